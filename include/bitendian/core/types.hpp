// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>

#include <cstddef>
#include <cstdint>

namespace bitendian {

// Run-time byte order, for when the order is only known during execution
// (e.g. declared in a file header)
enum class Endian : uint8_t {
    Big = 0,   // Most-significant byte first (network order)
    Little = 1 // Least-significant byte first
};

// Compile-time byte order markers
struct BigEndian {
    static constexpr Endian value = Endian::Big;
};

struct LittleEndian {
    static constexpr Endian value = Endian::Little;
};

// Network byte order
using NetworkEndian = BigEndian;

// Convert byte order to human-readable string
constexpr const char* endian_string(Endian order) noexcept {
    switch (order) {
        case Endian::Big:
            return "big";
        case Endian::Little:
            return "little";
        default:
            return "unknown";
    }
}

/**
 * @brief Per-type byte order traits
 *
 * Specialized once for every convertible type by BITENDIAN_DEFINE_BYTE_ORDER
 * (see byte_order.hpp). A specialization provides:
 * - bits_type: unsigned integer of the same width carrying the bit pattern
 * - width: byte width of the encoded value
 *
 * The primary template is intentionally left undefined.
 */
template <typename T>
struct ByteOrderTraits;

} // namespace bitendian
