// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <istream>
#include <ostream>

#include <boost/system/error_code.hpp>

#include "../core/byte_order.hpp"
#include "../core/concepts.hpp"
#include "../core/detail/transfer_state.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"

namespace bitendian {

/**
 * @brief Endian-aware reads and writes on standard library streams
 *
 * Same surface as the SyncReadStream / SyncWriteStream overloads, for
 * std::istream / std::ostream and their derivatives (std::ifstream,
 * std::stringstream, ...).
 *
 * iostreams report no error cause: a read that hits end of input yields
 * error::unexpected_eof, any other failed state yields error::stream_failure.
 * An exception mask set on the stream with exceptions() is honored, so
 * std::ios_base::failure may escape even the error_code overloads.
 */

/**
 * @brief Read one value in a run-time selected byte order
 *
 * @param in Source stream
 * @param order Byte order of the encoded value
 * @param ec Set to the failure, cleared on success
 * @return Decoded value, or T{} on failure
 */
template <Convertible T>
T read_ne(std::istream& in, Endian order, boost::system::error_code& ec) {
    detail::ReadState<T> state(order);
    ec = {};

    auto dest = state.remaining();
    in.read(reinterpret_cast<char*>(dest.data()), static_cast<std::streamsize>(dest.size()));
    state.commit(static_cast<size_t>(in.gcount()));

    if (!state.complete()) {
        ec = in.eof() ? error::unexpected_eof : error::stream_failure;
        return T{};
    }

    return state.value();
}

template <Convertible T>
T read_ne(std::istream& in, Endian order) {
    boost::system::error_code ec;
    T value = read_ne<T>(in, order, ec);
    detail::throw_error(ec, "read_ne");
    return value;
}

template <Convertible T>
T read_be(std::istream& in, boost::system::error_code& ec) {
    return read_ne<T>(in, Endian::Big, ec);
}

template <Convertible T>
T read_be(std::istream& in) {
    return read_ne<T>(in, Endian::Big);
}

template <Convertible T>
T read_le(std::istream& in, boost::system::error_code& ec) {
    return read_ne<T>(in, Endian::Little, ec);
}

template <Convertible T>
T read_le(std::istream& in) {
    return read_ne<T>(in, Endian::Little);
}

template <Convertible T, ByteOrderMarker Order>
T read(std::istream& in, boost::system::error_code& ec) {
    return read_ne<T>(in, Order::value, ec);
}

template <Convertible T, ByteOrderMarker Order>
T read(std::istream& in) {
    return read_ne<T>(in, Order::value);
}

/**
 * @brief Write one value in a run-time selected byte order
 *
 * The bytes are handed to the stream buffer; no flush is performed.
 *
 * @param out Destination stream
 * @param value Value to encode
 * @param order Byte order to encode with
 * @param ec Set to the failure, cleared on success
 */
template <Convertible T>
void write_ne(std::ostream& out, T value, Endian order, boost::system::error_code& ec) {
    auto state = detail::make_write_state(value, order);
    ec = {};

    auto src = state.remaining();
    out.write(reinterpret_cast<const char*>(src.data()), static_cast<std::streamsize>(src.size()));
    if (!out) {
        ec = error::stream_failure;
    }
}

template <Convertible T>
void write_ne(std::ostream& out, T value, Endian order) {
    boost::system::error_code ec;
    write_ne(out, value, order, ec);
    detail::throw_error(ec, "write_ne");
}

template <Convertible T>
void write_be(std::ostream& out, T value, boost::system::error_code& ec) {
    write_ne(out, value, Endian::Big, ec);
}

template <Convertible T>
void write_be(std::ostream& out, T value) {
    write_ne(out, value, Endian::Big);
}

template <Convertible T>
void write_le(std::ostream& out, T value, boost::system::error_code& ec) {
    write_ne(out, value, Endian::Little, ec);
}

template <Convertible T>
void write_le(std::ostream& out, T value) {
    write_ne(out, value, Endian::Little);
}

template <ByteOrderMarker Order, Convertible T>
void write(std::ostream& out, T value, boost::system::error_code& ec) {
    write_ne(out, value, Order::value, ec);
}

template <ByteOrderMarker Order, Convertible T>
void write(std::ostream& out, T value) {
    write_ne(out, value, Order::value);
}

} // namespace bitendian
