// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include <cstddef>
#include <cstdint>

#include <boost/system/error_code.hpp>
#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/event.h>
#include <event2/util.h>

#include "../core/byte_order.hpp"
#include "../core/concepts.hpp"
#include "../core/detail/transfer_state.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"

namespace bitendian::libevent {

/**
 * @brief Asynchronous endian-aware reads and writes on libevent bufferevents
 *
 * Each factory returns an operation object that owns the value's bytes and
 * its progress. start() attaches the operation to the bufferevent; the
 * completion handler is invoked from the event loop.
 *
 * Ownership and cancellation:
 * - Operations are neither copyable nor movable (the bufferevent holds a
 *   pointer to them while pending)
 * - cancel() or destroying a pending operation detaches it without invoking
 *   the handler; bytes already drained from the input are lost, and bytes
 *   already queued on the output are not withdrawn
 * - The operation is idle again before its handler runs, so the handler may
 *   start another operation or destroy the operation object
 *
 * Callback sharing:
 * - One read and one write may be pending on a bufferevent at the same time;
 *   a second operation in an occupied direction is rejected with
 *   std::logic_error
 * - Callbacks already installed by the application are saved when the first
 *   operation attaches and restored when the last one detaches; in between,
 *   callbacks for a direction with no pending operation are forwarded to them
 * - The application must not replace the bufferevent's callbacks while an
 *   operation is pending
 *
 * Example:
 * @code
 * auto op = bitendian::libevent::read_be<uint32_t>(bev);
 * op.start([](boost::system::error_code ec, uint32_t length) { ... });
 * event_base_dispatch(base);
 * @endcode
 */

namespace detail {

struct EventDeleter {
    void operator()(event* ev) const noexcept { event_free(ev); }
};

using EventPtr = std::unique_ptr<event, EventDeleter>;

// Callbacks and enabled directions present on a bufferevent before the
// first operation attached to it
struct SavedCallbacks {
    bufferevent_data_cb read = nullptr;
    bufferevent_data_cb write = nullptr;
    bufferevent_event_cb event = nullptr;
    void* arg = nullptr;
    short enabled = 0;

    void save(bufferevent* bev) noexcept {
        bufferevent_getcb(bev, &read, &write, &event, &arg);
        enabled = bufferevent_get_enabled(bev);
    }

    void restore(bufferevent* bev) const noexcept {
        bufferevent_setcb(bev, read, write, event, arg);
    }
};

// Error reported by the transport for a BEV_EVENT_ERROR
inline boost::system::error_code socket_error() noexcept {
    int err = EVUTIL_SOCKET_ERROR();
    if (err == 0) {
        return boost::system::errc::make_error_code(boost::system::errc::io_error);
    }
    return boost::system::error_code(err, boost::system::system_category());
}

// Create an fd-less event that is only ever activated manually
inline EventPtr make_deferred_event(bufferevent* bev, event_callback_fn callback, void* arg) {
    EventPtr ev(event_new(bufferevent_get_base(bev), -1, 0, callback, arg));
    if (!ev) {
        throw std::runtime_error("Failed to allocate libevent event");
    }
    return ev;
}

class Channel;

// An operation attached to a Channel in one direction
class ChannelClient {
protected:
    ChannelClient() = default;
    ~ChannelClient() = default;

private:
    friend class Channel;

    // Data callback for the client's direction
    virtual void on_ready() = 0;

    // Event callback carrying the client's direction flag
    virtual void on_transport_event(short what) = 0;
};

/**
 * @brief Callback record shared by the operations pending on one bufferevent
 *
 * Installed as the bufferevent's callbacks while at least one operation is
 * attached, and found again through bufferevent_getcb(). Holds one slot per
 * direction and dispatches each callback to the slot's client, or to the
 * application's saved callbacks when the slot is empty. Deletes itself when
 * the last client detaches.
 */
class Channel {
public:
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Attach a client to the bufferevent in one direction
     *
     * @param bev Bufferevent to attach to
     * @param direction EV_READ or EV_WRITE
     * @param client Operation receiving the direction's callbacks
     * @return The bufferevent's channel
     * @throws std::logic_error if another operation holds the direction
     * @throws std::runtime_error if the direction cannot be enabled
     */
    static Channel* attach(bufferevent* bev, short direction, ChannelClient* client) {
        Channel* channel = find(bev);
        std::unique_ptr<Channel> created;
        if (!channel) {
            created.reset(new Channel(bev));
            channel = created.get();
        }

        ChannelClient*& slot = channel->slot(direction);
        if (slot) {
            throw std::logic_error(direction == EV_READ
                                       ? "Another read is already pending on this bufferevent"
                                       : "Another write is already pending on this bufferevent");
        }
        if (bufferevent_enable(bev, direction) != 0) {
            throw std::runtime_error("Failed to enable bufferevent");
        }

        slot = client;
        if (created) {
            bufferevent_setcb(bev, &Channel::on_read, &Channel::on_write, &Channel::on_event,
                              created.release());
        }
        return channel;
    }

    /**
     * @brief Release a direction
     *
     * Disables the direction again if the application had not enabled it.
     * Restores the application's callbacks and destroys the channel once
     * both directions are free.
     */
    void detach(short direction) noexcept {
        slot(direction) = nullptr;
        if ((saved_.enabled & direction) == 0) {
            bufferevent_disable(bev_, direction);
        }
        if (!reader_ && !writer_) {
            saved_.restore(bev_);
            delete this;
        }
    }

private:
    explicit Channel(bufferevent* bev) : bev_(bev) { saved_.save(bev); }

    static Channel* find(bufferevent* bev) noexcept {
        bufferevent_data_cb read = nullptr;
        void* arg = nullptr;
        bufferevent_getcb(bev, &read, nullptr, nullptr, &arg);
        return read == &Channel::on_read ? static_cast<Channel*>(arg) : nullptr;
    }

    ChannelClient*& slot(short direction) noexcept {
        return direction == EV_READ ? reader_ : writer_;
    }

    // The channel may be destroyed by a client callback: nothing touches it
    // after dispatching to a client
    static void on_read(bufferevent* bev, void* arg) {
        auto* self = static_cast<Channel*>(arg);
        if (self->reader_) {
            self->reader_->on_ready();
        } else if (self->saved_.read) {
            self->saved_.read(bev, self->saved_.arg);
        }
    }

    static void on_write(bufferevent* bev, void* arg) {
        auto* self = static_cast<Channel*>(arg);
        if (self->writer_) {
            self->writer_->on_ready();
        } else if (self->saved_.write) {
            self->saved_.write(bev, self->saved_.arg);
        }
    }

    static void on_event(bufferevent* bev, short what, void* arg) {
        auto* self = static_cast<Channel*>(arg);
        if ((what & BEV_EVENT_READING) != 0 && self->reader_) {
            self->reader_->on_transport_event(what);
        } else if ((what & BEV_EVENT_WRITING) != 0 && self->writer_) {
            self->writer_->on_transport_event(what);
        } else if (self->saved_.event) {
            self->saved_.event(bev, what, self->saved_.arg);
        }
    }

    bufferevent* bev_;
    SavedCallbacks saved_;
    ChannelClient* reader_ = nullptr;
    ChannelClient* writer_ = nullptr;
};

} // namespace detail

// =============================================================================
// ReadOperation
// =============================================================================

/**
 * @brief Pending read of one value from a bufferevent
 *
 * On every read callback, drains at most the number of bytes still missing
 * from the bufferevent's input buffer, so bytes beyond the value remain
 * available to the next operation. Bytes already buffered when start() is
 * called are picked up on the next loop iteration.
 *
 * Completes with:
 * - the decoded value once byte_width_v<T> bytes have arrived
 * - error::unexpected_eof if the transport reports EOF first
 * - the transport's system error for BEV_EVENT_ERROR
 * - boost::system::errc::timed_out for a bufferevent read timeout
 *
 * @tparam T Convertible type to read
 */
template <Convertible T>
class ReadOperation : private detail::ChannelClient {
public:
    using Handler = std::function<void(boost::system::error_code, T)>;

    /**
     * @brief Create an idle read operation
     *
     * @param bev Bufferevent to read from (must outlive the operation)
     * @param order Byte order of the encoded value
     * @throws std::invalid_argument if bev is null
     */
    ReadOperation(bufferevent* bev, Endian order)
        : bev_(bev),
          order_(order) {
        if (!bev_) {
            throw std::invalid_argument("bufferevent must not be null");
        }
    }

    ~ReadOperation() { cancel(); }

    ReadOperation(const ReadOperation&) = delete;
    ReadOperation& operator=(const ReadOperation&) = delete;
    ReadOperation(ReadOperation&&) = delete;
    ReadOperation& operator=(ReadOperation&&) = delete;

    /**
     * @brief Begin reading
     *
     * @param handler Invoked once from the event loop with the result
     * @throws std::logic_error if this or another read is already pending on
     *         the bufferevent
     * @throws std::runtime_error if the bufferevent cannot be enabled for reading
     */
    void start(Handler handler) {
        if (pending_) {
            throw std::logic_error("Read operation already in progress");
        }
        if (!deferred_) {
            deferred_ = detail::make_deferred_event(bev_, &ReadOperation::on_deferred, this);
        }

        channel_ = detail::Channel::attach(bev_, EV_READ, this);
        state_.emplace(order_);
        handler_ = std::move(handler);
        pending_ = true;

        if (evbuffer_get_length(bufferevent_get_input(bev_)) > 0) {
            event_active(deferred_.get(), EV_TIMEOUT, 0);
        }
    }

    /**
     * @brief Abandon a pending read without invoking the handler
     *
     * Bytes already drained from the input buffer are lost.
     */
    void cancel() noexcept {
        if (!pending_) {
            return;
        }
        event_del(deferred_.get());
        channel_->detach(EV_READ);
        channel_ = nullptr;
        state_.reset();
        handler_ = nullptr;
        pending_ = false;
    }

    bool pending() const noexcept { return pending_; }

    /// Bytes of the current value received so far
    size_t progress() const noexcept { return state_ ? state_->progress() : 0; }

    Endian order() const noexcept { return order_; }

private:
    void on_ready() override { drain(); }

    void on_transport_event(short what) override {
        if ((what & BEV_EVENT_EOF) != 0) {
            // Data may have arrived together with the EOF
            if (drain()) {
                return;
            }
            finish(error::unexpected_eof);
        } else if ((what & BEV_EVENT_ERROR) != 0) {
            finish(detail::socket_error());
        } else if ((what & BEV_EVENT_TIMEOUT) != 0) {
            finish(boost::system::errc::make_error_code(boost::system::errc::timed_out));
        }
    }

    static void on_deferred(evutil_socket_t, short, void* arg) {
        static_cast<ReadOperation*>(arg)->drain();
    }

    // Returns true if the operation completed
    bool drain() {
        if (!pending_) {
            return false;
        }

        auto dest = state_->remaining();
        int n = evbuffer_remove(bufferevent_get_input(bev_), dest.data(), dest.size());
        if (n < 0) {
            finish(boost::system::errc::make_error_code(boost::system::errc::io_error));
            return true;
        }
        state_->commit(static_cast<size_t>(n));

        if (state_->complete()) {
            finish({}, state_->value());
            return true;
        }
        return false;
    }

    void finish(const boost::system::error_code& ec, T value = T{}) {
        if (!pending_) {
            return;
        }
        Handler handler = std::move(handler_);
        cancel();
        // *this may be destroyed by the handler
        handler(ec, value);
    }

    bufferevent* bev_;
    Endian order_;
    bool pending_ = false;
    std::optional<bitendian::detail::ReadState<T>> state_;
    Handler handler_;
    detail::Channel* channel_ = nullptr;
    detail::EventPtr deferred_;
};

// =============================================================================
// WriteOperation
// =============================================================================

/**
 * @brief Pending write of one encoded value to a bufferevent
 *
 * start() queues the bytes on the bufferevent's output buffer; the handler
 * runs once the output buffer has drained to the transport.
 *
 * Completes with:
 * - success once the output buffer is empty
 * - error::buffer_rejected if the output buffer refuses the bytes
 * - the transport's system error for BEV_EVENT_ERROR while writing
 * - error::unexpected_eof if the transport reports EOF while writing
 * - boost::system::errc::timed_out for a bufferevent write timeout
 *
 * @tparam N Encoded width in bytes
 */
template <size_t N>
class WriteOperation : private detail::ChannelClient {
public:
    using Handler = std::function<void(boost::system::error_code)>;

    /**
     * @brief Create an idle write operation
     *
     * @param bev Bufferevent to write to (must outlive the operation)
     * @param bytes Encoded value
     * @throws std::invalid_argument if bev is null
     */
    WriteOperation(bufferevent* bev, const std::array<uint8_t, N>& bytes)
        : bev_(bev),
          bytes_(bytes) {
        if (!bev_) {
            throw std::invalid_argument("bufferevent must not be null");
        }
    }

    ~WriteOperation() { cancel(); }

    WriteOperation(const WriteOperation&) = delete;
    WriteOperation& operator=(const WriteOperation&) = delete;
    WriteOperation(WriteOperation&&) = delete;
    WriteOperation& operator=(WriteOperation&&) = delete;

    /**
     * @brief Begin writing
     *
     * @param handler Invoked once from the event loop with the result
     * @throws std::logic_error if this or another write is already pending on
     *         the bufferevent
     * @throws std::runtime_error if the bufferevent cannot be enabled for writing
     */
    void start(Handler handler) {
        if (pending_) {
            throw std::logic_error("Write operation already in progress");
        }
        if (!deferred_) {
            deferred_ = detail::make_deferred_event(bev_, &WriteOperation::on_deferred, this);
        }

        channel_ = detail::Channel::attach(bev_, EV_WRITE, this);
        state_.emplace(bytes_);
        handler_ = std::move(handler);
        pending_ = true;

        auto src = state_->remaining();
        if (bufferevent_write(bev_, src.data(), src.size()) != 0) {
            rejected_ = true;
            event_active(deferred_.get(), EV_TIMEOUT, 0);
            return;
        }
        state_->commit(src.size());
    }

    /**
     * @brief Abandon a pending write without invoking the handler
     *
     * Bytes already queued on the output buffer are not withdrawn.
     */
    void cancel() noexcept {
        if (!pending_) {
            return;
        }
        event_del(deferred_.get());
        channel_->detach(EV_WRITE);
        channel_ = nullptr;
        state_.reset();
        handler_ = nullptr;
        rejected_ = false;
        pending_ = false;
    }

    bool pending() const noexcept { return pending_; }

    /// The encoded bytes this operation writes
    const std::array<uint8_t, N>& bytes() const noexcept { return bytes_; }

private:
    void on_ready() override {
        if (pending_ && !rejected_ && state_->complete()) {
            finish({});
        }
    }

    void on_transport_event(short what) override {
        if ((what & BEV_EVENT_ERROR) != 0) {
            finish(detail::socket_error());
        } else if ((what & BEV_EVENT_EOF) != 0) {
            finish(error::unexpected_eof);
        } else if ((what & BEV_EVENT_TIMEOUT) != 0) {
            finish(boost::system::errc::make_error_code(boost::system::errc::timed_out));
        }
    }

    static void on_deferred(evutil_socket_t, short, void* arg) {
        auto* self = static_cast<WriteOperation*>(arg);
        if (self->pending_ && self->rejected_) {
            self->finish(error::buffer_rejected);
        }
    }

    void finish(const boost::system::error_code& ec) {
        if (!pending_) {
            return;
        }
        Handler handler = std::move(handler_);
        cancel();
        // *this may be destroyed by the handler
        handler(ec);
    }

    bufferevent* bev_;
    std::array<uint8_t, N> bytes_;
    bool pending_ = false;
    bool rejected_ = false;
    std::optional<bitendian::detail::WriteState<N>> state_;
    Handler handler_;
    detail::Channel* channel_ = nullptr;
    detail::EventPtr deferred_;
};

// =============================================================================
// Factories
// =============================================================================

template <Convertible T>
ReadOperation<T> read_ne(bufferevent* bev, Endian order) {
    return ReadOperation<T>(bev, order);
}

template <Convertible T>
ReadOperation<T> read_be(bufferevent* bev) {
    return ReadOperation<T>(bev, Endian::Big);
}

template <Convertible T>
ReadOperation<T> read_le(bufferevent* bev) {
    return ReadOperation<T>(bev, Endian::Little);
}

template <Convertible T, ByteOrderMarker Order>
ReadOperation<T> read(bufferevent* bev) {
    return ReadOperation<T>(bev, Order::value);
}

template <Convertible T>
WriteOperation<byte_width_v<T>> write_ne(bufferevent* bev, T value, Endian order) {
    return WriteOperation<byte_width_v<T>>(bev, to_bytes(value, order));
}

template <Convertible T>
WriteOperation<byte_width_v<T>> write_be(bufferevent* bev, T value) {
    return WriteOperation<byte_width_v<T>>(bev, to_be_bytes(value));
}

template <Convertible T>
WriteOperation<byte_width_v<T>> write_le(bufferevent* bev, T value) {
    return WriteOperation<byte_width_v<T>>(bev, to_le_bytes(value));
}

template <ByteOrderMarker Order, Convertible T>
WriteOperation<byte_width_v<T>> write(bufferevent* bev, T value) {
    return WriteOperation<byte_width_v<T>>(bev, to_bytes<Order>(value));
}

} // namespace bitendian::libevent
