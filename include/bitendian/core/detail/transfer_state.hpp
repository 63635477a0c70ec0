// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../byte_order.hpp"
#include "../concepts.hpp"
#include "../types.hpp"

namespace bitendian::detail {

/**
 * @brief Byte accumulation for reading one value from a stream
 *
 * Owns the N-byte buffer for a single read. Stream adapters (blocking,
 * Asio, libevent) fill remaining() with whatever the stream delivers and
 * report it through commit() until complete() holds, then decode with value().
 *
 * @tparam T Convertible type being read
 */
template <Convertible T>
class ReadState {
public:
    explicit constexpr ReadState(Endian order) noexcept : order_(order) {}

    /// Unfilled tail of the buffer
    std::span<uint8_t> remaining() noexcept {
        return std::span<uint8_t>(bytes_).subspan(progress_);
    }

    /// Record n bytes written into remaining()
    void commit(size_t n) noexcept { progress_ += n; }

    bool complete() const noexcept { return progress_ >= bytes_.size(); }

    size_t progress() const noexcept { return progress_; }

    Endian order() const noexcept { return order_; }

    /// Decode the accumulated bytes (only meaningful once complete())
    T value() const noexcept { return from_bytes<T>(bytes_, order_); }

private:
    Bytes<T> bytes_{};
    size_t progress_ = 0;
    Endian order_;
};

/**
 * @brief Byte accounting for writing one encoded value to a stream
 *
 * @tparam N Encoded width in bytes
 */
template <size_t N>
class WriteState {
public:
    explicit constexpr WriteState(const std::array<uint8_t, N>& bytes) noexcept
        : bytes_(bytes) {}

    /// Bytes not yet accepted by the stream
    std::span<const uint8_t> remaining() const noexcept {
        return std::span<const uint8_t>(bytes_).subspan(progress_);
    }

    /// Record n bytes accepted by the stream
    void commit(size_t n) noexcept { progress_ += n; }

    bool complete() const noexcept { return progress_ >= N; }

    size_t progress() const noexcept { return progress_; }

private:
    std::array<uint8_t, N> bytes_;
    size_t progress_ = 0;
};

// Encode a value into a write state for the given run-time order
template <Convertible T>
constexpr WriteState<byte_width_v<T>> make_write_state(T value, Endian order) noexcept {
    return WriteState<byte_width_v<T>>(to_bytes(value, order));
}

} // namespace bitendian::detail
