// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "../core/byte_order.hpp"
#include "../core/concepts.hpp"
#include "../core/detail/transfer_state.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "stream_concepts.hpp"

namespace bitendian {

/**
 * @brief Blocking endian-aware reads and writes on Asio-style streams
 *
 * Works with any SyncReadStream / SyncWriteStream: boost::asio sockets,
 * serial ports, posix::stream_descriptor, or user types exposing
 * read_some(buffer, ec) / write_some(buffer, ec).
 *
 * Every operation has two overloads, following the Asio convention:
 * - error_code overload: never throws; on failure ec is set and reads return T{}
 * - throwing overload: throws boost::system::system_error
 *
 * A stream that ends before a complete value arrives yields
 * error::unexpected_eof. Any other stream error is passed through unchanged.
 * Bytes consumed before a failure are not returned to the stream.
 *
 * Example:
 * @code
 * boost::asio::ip::tcp::socket socket(io);
 * auto length = bitendian::read_be<uint32_t>(socket);
 * bitendian::write_le(socket, 3.5);
 * @endcode
 */

// =============================================================================
// Reads
// =============================================================================

/**
 * @brief Read one value in a run-time selected byte order
 *
 * Blocks until byte_width_v<T> bytes have been read or the stream fails.
 *
 * @param stream Source stream
 * @param order Byte order of the encoded value
 * @param ec Set to the failure, cleared on success
 * @return Decoded value, or T{} on failure
 */
template <Convertible T, SyncReadStream Stream>
T read_ne(Stream& stream, Endian order, boost::system::error_code& ec) {
    detail::ReadState<T> state(order);
    ec = {};

    while (!state.complete()) {
        auto dest = state.remaining();
        size_t n = stream.read_some(boost::asio::buffer(dest.data(), dest.size()), ec);
        state.commit(n);

        // The final bytes may arrive together with end of stream
        if (ec == boost::asio::error::eof && state.complete()) {
            ec = {};
        } else if (ec == boost::asio::error::eof || (!ec && n == 0)) {
            ec = error::unexpected_eof;
        }
        if (ec) {
            return T{};
        }
    }

    return state.value();
}

template <Convertible T, SyncReadStream Stream>
T read_ne(Stream& stream, Endian order) {
    boost::system::error_code ec;
    T value = read_ne<T>(stream, order, ec);
    detail::throw_error(ec, "read_ne");
    return value;
}

template <Convertible T, SyncReadStream Stream>
T read_be(Stream& stream, boost::system::error_code& ec) {
    return read_ne<T>(stream, Endian::Big, ec);
}

template <Convertible T, SyncReadStream Stream>
T read_be(Stream& stream) {
    boost::system::error_code ec;
    T value = read_ne<T>(stream, Endian::Big, ec);
    detail::throw_error(ec, "read_be");
    return value;
}

template <Convertible T, SyncReadStream Stream>
T read_le(Stream& stream, boost::system::error_code& ec) {
    return read_ne<T>(stream, Endian::Little, ec);
}

template <Convertible T, SyncReadStream Stream>
T read_le(Stream& stream) {
    boost::system::error_code ec;
    T value = read_ne<T>(stream, Endian::Little, ec);
    detail::throw_error(ec, "read_le");
    return value;
}

// Compile-time byte order: read<uint32_t, BigEndian>(stream)
template <Convertible T, ByteOrderMarker Order, SyncReadStream Stream>
T read(Stream& stream, boost::system::error_code& ec) {
    return read_ne<T>(stream, Order::value, ec);
}

template <Convertible T, ByteOrderMarker Order, SyncReadStream Stream>
T read(Stream& stream) {
    boost::system::error_code ec;
    T value = read_ne<T>(stream, Order::value, ec);
    detail::throw_error(ec, "read");
    return value;
}

// =============================================================================
// Writes
// =============================================================================

/**
 * @brief Write one value in a run-time selected byte order
 *
 * Blocks until all byte_width_v<T> bytes have been accepted by the stream.
 *
 * @param stream Destination stream
 * @param value Value to encode
 * @param order Byte order to encode with
 * @param ec Set to the failure, cleared on success
 */
template <Convertible T, SyncWriteStream Stream>
void write_ne(Stream& stream, T value, Endian order, boost::system::error_code& ec) {
    auto state = detail::make_write_state(value, order);
    ec = {};

    while (!state.complete()) {
        auto src = state.remaining();
        size_t n = stream.write_some(boost::asio::buffer(src.data(), src.size()), ec);
        if (ec) {
            return;
        }
        if (n == 0) {
            ec = error::write_zero;
            return;
        }
        state.commit(n);
    }
}

template <Convertible T, SyncWriteStream Stream>
void write_ne(Stream& stream, T value, Endian order) {
    boost::system::error_code ec;
    write_ne(stream, value, order, ec);
    detail::throw_error(ec, "write_ne");
}

template <Convertible T, SyncWriteStream Stream>
void write_be(Stream& stream, T value, boost::system::error_code& ec) {
    write_ne(stream, value, Endian::Big, ec);
}

template <Convertible T, SyncWriteStream Stream>
void write_be(Stream& stream, T value) {
    boost::system::error_code ec;
    write_ne(stream, value, Endian::Big, ec);
    detail::throw_error(ec, "write_be");
}

template <Convertible T, SyncWriteStream Stream>
void write_le(Stream& stream, T value, boost::system::error_code& ec) {
    write_ne(stream, value, Endian::Little, ec);
}

template <Convertible T, SyncWriteStream Stream>
void write_le(Stream& stream, T value) {
    boost::system::error_code ec;
    write_ne(stream, value, Endian::Little, ec);
    detail::throw_error(ec, "write_le");
}

// Compile-time byte order: write<LittleEndian>(stream, value)
template <ByteOrderMarker Order, Convertible T, SyncWriteStream Stream>
void write(Stream& stream, T value, boost::system::error_code& ec) {
    write_ne(stream, value, Order::value, ec);
}

template <ByteOrderMarker Order, Convertible T, SyncWriteStream Stream>
void write(Stream& stream, T value) {
    boost::system::error_code ec;
    write_ne(stream, value, Order::value, ec);
    detail::throw_error(ec, "write");
}

} // namespace bitendian
