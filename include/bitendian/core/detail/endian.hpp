// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <bit>

#include <cstddef>
#include <cstdint>

namespace bitendian::detail {

// Platform endianness detection
inline constexpr bool is_little_endian = (std::endian::native == std::endian::little);
inline constexpr bool is_big_endian = (std::endian::native == std::endian::big);

static_assert(is_little_endian || is_big_endian, "Mixed endianness not supported");

// Byte swap operations (constexpr for compile-time use)
constexpr uint16_t byteswap16(uint16_t value) noexcept {
    return __builtin_bswap16(value);
}

constexpr uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

constexpr uint64_t byteswap64(uint64_t value) noexcept {
    return __builtin_bswap64(value);
}

#if defined(__SIZEOF_INT128__)
__extension__ typedef unsigned __int128 uint128_t;
__extension__ typedef __int128 int128_t;

constexpr uint128_t byteswap128(uint128_t value) noexcept {
    const auto low = static_cast<uint64_t>(value);
    const auto high = static_cast<uint64_t>(value >> 64);
    return (static_cast<uint128_t>(byteswap64(low)) << 64) | byteswap64(high);
}
#endif

/**
 * @brief Reverse the byte order of an unsigned carrier
 *
 * Dispatches on the carrier width. Single-byte carriers are returned as-is.
 *
 * @tparam Bits Unsigned integer carrier (1, 2, 4, 8 or 16 bytes)
 */
template <typename Bits>
constexpr Bits byteswap(Bits value) noexcept {
    if constexpr (sizeof(Bits) == 1) {
        return value;
    } else if constexpr (sizeof(Bits) == 2) {
        return byteswap16(value);
    } else if constexpr (sizeof(Bits) == 4) {
        return byteswap32(value);
    } else if constexpr (sizeof(Bits) == 8) {
        return byteswap64(value);
    } else {
        static_assert(sizeof(Bits) == 16, "Unsupported carrier width");
        return byteswap128(value);
    }
}

// Convert a carrier between host order and the requested order.
// The operation is its own inverse.
template <typename Bits>
constexpr Bits host_to_big(Bits value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap(value);
    } else {
        return value;
    }
}

template <typename Bits>
constexpr Bits host_to_little(Bits value) noexcept {
    if constexpr (is_big_endian) {
        return byteswap(value);
    } else {
        return value;
    }
}

} // namespace bitendian::detail
