// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <memory>
#include <utility>

#include <cstddef>

#include <boost/asio/buffer.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "../core/byte_order.hpp"
#include "../core/concepts.hpp"
#include "../core/detail/transfer_state.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../io/stream_concepts.hpp"

namespace bitendian::asio {

/**
 * @brief Asynchronous endian-aware reads and writes on Boost.Asio streams
 *
 * Works with any AsyncReadStream / AsyncWriteStream (sockets, SSL streams,
 * serial ports, pipes, ...) and any completion token: callbacks,
 * boost::asio::use_future, boost::asio::use_awaitable, deferred tokens.
 *
 * Completion signatures:
 * - reads:  void(boost::system::error_code, T)
 * - writes: void(boost::system::error_code)
 *
 * Each operation is a composed operation that loops over the stream's
 * async_read_some / async_write_some until the value's bytes are transferred,
 * suspending once per partial transfer. A stream that ends early completes
 * with error::unexpected_eof; other errors (including operation_aborted after
 * cancel() or close()) are passed through unchanged. Bytes transferred before
 * a failure or cancellation are lost.
 *
 * The program must ensure no other read (respectively write) is started on
 * the stream until the operation completes.
 *
 * Example:
 * @code
 * bitendian::asio::async_read_be<uint32_t>(socket,
 *     [](boost::system::error_code ec, uint32_t length) { ... });
 *
 * // Inside a coroutine
 * auto length = co_await bitendian::asio::async_read_le<uint16_t>(socket, use_awaitable);
 * @endcode
 */

namespace detail {

template <Convertible T, typename Stream>
class read_op {
public:
    read_op(Stream& stream, Endian order)
        : stream_(stream),
          state_(std::make_unique<bitendian::detail::ReadState<T>>(order)) {}

    template <typename Self>
    void operator()(Self& self, boost::system::error_code ec = {}, size_t n = 0) {
        if (started_) {
            state_->commit(n);
            if (ec == boost::asio::error::eof && state_->complete()) {
                ec = {};
            } else if (ec == boost::asio::error::eof || (!ec && n == 0)) {
                ec = error::unexpected_eof;
            }
            if (ec) {
                self.complete(ec, T{});
                return;
            }
            if (state_->complete()) {
                T value = state_->value();
                self.complete(ec, value);
                return;
            }
        }

        // The buffer lives on the heap: the composed operation is moved into
        // the stream's handler storage while the read is outstanding
        started_ = true;
        auto dest = state_->remaining();
        stream_.async_read_some(boost::asio::buffer(dest.data(), dest.size()), std::move(self));
    }

private:
    Stream& stream_;
    std::unique_ptr<bitendian::detail::ReadState<T>> state_;
    bool started_ = false;
};

template <size_t N, typename Stream>
class write_op {
public:
    write_op(Stream& stream, const std::array<uint8_t, N>& bytes)
        : stream_(stream),
          state_(std::make_unique<bitendian::detail::WriteState<N>>(bytes)) {}

    template <typename Self>
    void operator()(Self& self, boost::system::error_code ec = {}, size_t n = 0) {
        if (started_) {
            if (!ec && n == 0) {
                ec = error::write_zero;
            }
            if (ec) {
                self.complete(ec);
                return;
            }
            state_->commit(n);
            if (state_->complete()) {
                self.complete(ec);
                return;
            }
        }

        started_ = true;
        auto src = state_->remaining();
        stream_.async_write_some(boost::asio::buffer(src.data(), src.size()), std::move(self));
    }

private:
    Stream& stream_;
    std::unique_ptr<bitendian::detail::WriteState<N>> state_;
    bool started_ = false;
};

} // namespace detail

// =============================================================================
// Reads
// =============================================================================

/**
 * @brief Start an asynchronous read of one value in a run-time selected order
 *
 * @param stream Source stream (must outlive the operation)
 * @param order Byte order of the encoded value
 * @param token Completion token, signature void(boost::system::error_code, T)
 */
template <Convertible T, AsyncReadStream Stream, typename CompletionToken>
auto async_read_ne(Stream& stream, Endian order, CompletionToken&& token) {
    return boost::asio::async_compose<CompletionToken, void(boost::system::error_code, T)>(
        detail::read_op<T, Stream>(stream, order), token, stream);
}

template <Convertible T, AsyncReadStream Stream, typename CompletionToken>
auto async_read_be(Stream& stream, CompletionToken&& token) {
    return async_read_ne<T>(stream, Endian::Big, std::forward<CompletionToken>(token));
}

template <Convertible T, AsyncReadStream Stream, typename CompletionToken>
auto async_read_le(Stream& stream, CompletionToken&& token) {
    return async_read_ne<T>(stream, Endian::Little, std::forward<CompletionToken>(token));
}

template <Convertible T, ByteOrderMarker Order, AsyncReadStream Stream, typename CompletionToken>
auto async_read(Stream& stream, CompletionToken&& token) {
    return async_read_ne<T>(stream, Order::value, std::forward<CompletionToken>(token));
}

// =============================================================================
// Writes
// =============================================================================

/**
 * @brief Start an asynchronous write of one value in a run-time selected order
 *
 * The value is encoded before this function returns; the caller's copy may
 * be discarded immediately.
 *
 * @param stream Destination stream (must outlive the operation)
 * @param value Value to encode
 * @param order Byte order to encode with
 * @param token Completion token, signature void(boost::system::error_code)
 */
template <Convertible T, AsyncWriteStream Stream, typename CompletionToken>
auto async_write_ne(Stream& stream, T value, Endian order, CompletionToken&& token) {
    return boost::asio::async_compose<CompletionToken, void(boost::system::error_code)>(
        detail::write_op<byte_width_v<T>, Stream>(stream, to_bytes(value, order)), token, stream);
}

template <Convertible T, AsyncWriteStream Stream, typename CompletionToken>
auto async_write_be(Stream& stream, T value, CompletionToken&& token) {
    return async_write_ne(stream, value, Endian::Big, std::forward<CompletionToken>(token));
}

template <Convertible T, AsyncWriteStream Stream, typename CompletionToken>
auto async_write_le(Stream& stream, T value, CompletionToken&& token) {
    return async_write_ne(stream, value, Endian::Little, std::forward<CompletionToken>(token));
}

template <ByteOrderMarker Order, Convertible T, AsyncWriteStream Stream, typename CompletionToken>
auto async_write(Stream& stream, T value, CompletionToken&& token) {
    return async_write_ne(stream, value, Order::value, std::forward<CompletionToken>(token));
}

} // namespace bitendian::asio
