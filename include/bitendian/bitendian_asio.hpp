#pragma once

/**
 * @file bitendian_asio.hpp
 * @brief Convenience header for Boost.Asio stream extensions
 *
 * Blocking operations (read_be, write_le, ...) work on any SyncReadStream /
 * SyncWriteStream; asynchronous operations (async_read_be, async_write_le, ...)
 * work on any AsyncReadStream / AsyncWriteStream with any completion token.
 */

#include "../bitendian.hpp"
#include "asio/async_stream.hpp"

namespace bitendian {

// Import asynchronous operations into main namespace for convenience
using asio::async_read;
using asio::async_read_be;
using asio::async_read_le;
using asio::async_read_ne;
using asio::async_write;
using asio::async_write_be;
using asio::async_write_le;
using asio::async_write_ne;

} // namespace bitendian
