// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <bit>
#include <span>

#include <cstddef>
#include <cstdint>

#include "concepts.hpp"
#include "detail/endian.hpp"
#include "types.hpp"

/**
 * @brief Declare a type convertible to and from big/little-endian bytes
 *
 * Specializes bitendian::ByteOrderTraits for the given type. The carrier must be
 * an unsigned integer of the same width; the value's bit pattern is reached
 * through std::bit_cast, so two's-complement integers and IEEE-754 floating
 * point types share a single conversion routine.
 *
 * Must be used at global namespace scope.
 */
#define BITENDIAN_DEFINE_BYTE_ORDER(type, carrier)                                       \
    template <>                                                                          \
    struct bitendian::ByteOrderTraits<type> {                                            \
        using bits_type = carrier;                                                       \
        static constexpr size_t width = sizeof(carrier);                                 \
        static_assert(sizeof(type) == sizeof(carrier), "Carrier width must match type"); \
    }

BITENDIAN_DEFINE_BYTE_ORDER(unsigned char, unsigned char);
BITENDIAN_DEFINE_BYTE_ORDER(signed char, unsigned char);
BITENDIAN_DEFINE_BYTE_ORDER(unsigned short, unsigned short);
BITENDIAN_DEFINE_BYTE_ORDER(short, unsigned short);
BITENDIAN_DEFINE_BYTE_ORDER(unsigned int, unsigned int);
BITENDIAN_DEFINE_BYTE_ORDER(int, unsigned int);
BITENDIAN_DEFINE_BYTE_ORDER(unsigned long, unsigned long);
BITENDIAN_DEFINE_BYTE_ORDER(long, unsigned long);
BITENDIAN_DEFINE_BYTE_ORDER(unsigned long long, unsigned long long);
BITENDIAN_DEFINE_BYTE_ORDER(long long, unsigned long long);
BITENDIAN_DEFINE_BYTE_ORDER(float, uint32_t);
BITENDIAN_DEFINE_BYTE_ORDER(double, uint64_t);

#if defined(__SIZEOF_INT128__)
BITENDIAN_DEFINE_BYTE_ORDER(bitendian::detail::uint128_t, bitendian::detail::uint128_t);
BITENDIAN_DEFINE_BYTE_ORDER(bitendian::detail::int128_t, bitendian::detail::uint128_t);
#endif

static_assert(sizeof(float) == 4, "float must be IEEE-754 binary32");
static_assert(sizeof(double) == 8, "double must be IEEE-754 binary64");

namespace bitendian {

// =============================================================================
// Fixed byte order
// =============================================================================

/**
 * @brief Encode a value as big-endian (network order) bytes
 *
 * @param value Value to encode
 * @return Exactly byte_width_v<T> bytes, most-significant first
 */
template <Convertible T>
constexpr Bytes<T> to_be_bytes(T value) noexcept {
    using Bits = typename ByteOrderTraits<T>::bits_type;
    return std::bit_cast<Bytes<T>>(detail::host_to_big(std::bit_cast<Bits>(value)));
}

/**
 * @brief Encode a value as little-endian bytes
 *
 * @param value Value to encode
 * @return Exactly byte_width_v<T> bytes, least-significant first
 */
template <Convertible T>
constexpr Bytes<T> to_le_bytes(T value) noexcept {
    using Bits = typename ByteOrderTraits<T>::bits_type;
    return std::bit_cast<Bytes<T>>(detail::host_to_little(std::bit_cast<Bits>(value)));
}

/**
 * @brief Decode a value from big-endian (network order) bytes
 *
 * @param bytes Exactly byte_width_v<T> bytes, most-significant first
 * @return Decoded value
 */
template <Convertible T>
constexpr T from_be_bytes(const Bytes<T>& bytes) noexcept {
    using Bits = typename ByteOrderTraits<T>::bits_type;
    return std::bit_cast<T>(detail::host_to_big(std::bit_cast<Bits>(bytes)));
}

/**
 * @brief Decode a value from little-endian bytes
 *
 * @param bytes Exactly byte_width_v<T> bytes, least-significant first
 * @return Decoded value
 */
template <Convertible T>
constexpr T from_le_bytes(const Bytes<T>& bytes) noexcept {
    using Bits = typename ByteOrderTraits<T>::bits_type;
    return std::bit_cast<T>(detail::host_to_little(std::bit_cast<Bits>(bytes)));
}

// Decode in place from a fixed-extent view into a larger buffer
template <Convertible T>
constexpr T from_be_bytes(std::span<const uint8_t, byte_width_v<T>> bytes) noexcept {
    Bytes<T> copy{};
    for (size_t i = 0; i < copy.size(); ++i) {
        copy[i] = bytes[i];
    }
    return from_be_bytes<T>(copy);
}

template <Convertible T>
constexpr T from_le_bytes(std::span<const uint8_t, byte_width_v<T>> bytes) noexcept {
    Bytes<T> copy{};
    for (size_t i = 0; i < copy.size(); ++i) {
        copy[i] = bytes[i];
    }
    return from_le_bytes<T>(copy);
}

// =============================================================================
// Compile-time byte order (BigEndian / LittleEndian markers)
// =============================================================================

template <ByteOrderMarker Order, Convertible T>
constexpr Bytes<T> to_bytes(T value) noexcept {
    if constexpr (Order::value == Endian::Big) {
        return to_be_bytes(value);
    } else {
        return to_le_bytes(value);
    }
}

template <Convertible T, ByteOrderMarker Order>
constexpr T from_bytes(const Bytes<T>& bytes) noexcept {
    if constexpr (Order::value == Endian::Big) {
        return from_be_bytes<T>(bytes);
    } else {
        return from_le_bytes<T>(bytes);
    }
}

// =============================================================================
// Run-time byte order
// =============================================================================

template <Convertible T>
constexpr Bytes<T> to_bytes(T value, Endian order) noexcept {
    switch (order) {
        case Endian::Big:
            return to_be_bytes(value);
        case Endian::Little:
        default:
            return to_le_bytes(value);
    }
}

template <Convertible T>
constexpr T from_bytes(const Bytes<T>& bytes, Endian order) noexcept {
    switch (order) {
        case Endian::Big:
            return from_be_bytes<T>(bytes);
        case Endian::Little:
        default:
            return from_le_bytes<T>(bytes);
    }
}

} // namespace bitendian
