// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace bitendian::error {

/**
 * @brief Error conditions raised by the stream extensions themselves
 *
 * Failures reported by the underlying stream (socket reset, permission,
 * disk errors, Asio's operation_aborted, ...) are passed through unchanged and
 * never mapped to one of these values.
 */
enum stream_errors {
    unexpected_eof = 1, ///< Stream ended before a complete value was read
    stream_failure,     ///< std::iostream failbit/badbit set without a reported cause
    write_zero,         ///< Stream accepted no bytes and reported no error
    buffer_rejected     ///< bufferevent refused to queue the encoded bytes
};

// Convert stream error to human-readable string
constexpr const char* error_string(stream_errors err) noexcept {
    switch (err) {
        case unexpected_eof:
            return "Unexpected end of stream before a complete value was read";
        case stream_failure:
            return "Stream entered a failed state";
        case write_zero:
            return "Stream accepted no bytes";
        case buffer_rejected:
            return "Output buffer rejected the encoded value";
        default:
            return "Unknown error";
    }
}

namespace detail {

class stream_category : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "bitendian"; }

    std::string message(int value) const override {
        return error_string(static_cast<stream_errors>(value));
    }
};

} // namespace detail

inline const boost::system::error_category& get_stream_category() noexcept {
    static const detail::stream_category instance{};
    return instance;
}

inline boost::system::error_code make_error_code(stream_errors err) noexcept {
    return boost::system::error_code(static_cast<int>(err), get_stream_category());
}

} // namespace bitendian::error

namespace boost::system {

template <>
struct is_error_code_enum<bitendian::error::stream_errors> : std::true_type {};

} // namespace boost::system

namespace bitendian::detail {

// Throw if ec holds an error, following the Asio convention for the
// throwing overload of an operation
inline void throw_error(const boost::system::error_code& ec, const char* location) {
    if (ec) {
        throw boost::system::system_error(ec, location);
    }
}

} // namespace bitendian::detail
