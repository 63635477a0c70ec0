#pragma once

/**
 * @file bitendian_libevent.hpp
 * @brief Convenience header for libevent bufferevent extensions
 *
 * Primary types:
 * - ReadOperation<T>: pending read of one value, started with start(handler)
 * - WriteOperation<N>: pending write of one encoded value
 */

#include "../bitendian.hpp"
#include "libevent/bufferevent_io.hpp"

namespace bitendian {

template <Convertible T>
using BuffereventReadOperation = libevent::ReadOperation<T>;

template <size_t N>
using BuffereventWriteOperation = libevent::WriteOperation<N>;

} // namespace bitendian
