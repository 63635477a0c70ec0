// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>

#include <cstddef>

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

namespace bitendian {

// Concept for blocking byte sources (Asio SyncReadStream requirements):
// sockets, serial ports, posix::stream_descriptor and user-defined streams
template <typename S>
concept SyncReadStream = requires(S& stream, const boost::asio::mutable_buffer& buffer,
                                  boost::system::error_code& ec) {
    { stream.read_some(buffer, ec) } -> std::convertible_to<size_t>;
};

// Concept for blocking byte sinks (Asio SyncWriteStream requirements)
template <typename S>
concept SyncWriteStream = requires(S& stream, const boost::asio::const_buffer& buffer,
                                   boost::system::error_code& ec) {
    { stream.write_some(buffer, ec) } -> std::convertible_to<size_t>;
};

// Concept for Asio AsyncReadStream objects
template <typename S>
concept AsyncReadStream =
    requires(S& stream, const boost::asio::mutable_buffer& buffer,
             void (*handler)(boost::system::error_code, size_t)) {
        stream.get_executor();
        stream.async_read_some(buffer, handler);
    };

// Concept for Asio AsyncWriteStream objects
template <typename S>
concept AsyncWriteStream =
    requires(S& stream, const boost::asio::const_buffer& buffer,
             void (*handler)(boost::system::error_code, size_t)) {
        stream.get_executor();
        stream.async_write_some(buffer, handler);
    };

} // namespace bitendian
