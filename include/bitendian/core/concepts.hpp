// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <type_traits>

#include <cstddef>
#include <cstdint>

#include "types.hpp"

namespace bitendian {

// Concept for types with a fixed-width byte representation in either order.
// Satisfied by every type with a ByteOrderTraits specialization whose carrier
// has the same size as the type itself.
template <typename T>
concept Convertible = requires {
    typename ByteOrderTraits<T>::bits_type;
    { ByteOrderTraits<T>::width } -> std::convertible_to<size_t>;
} && std::is_trivially_copyable_v<T> &&
    (sizeof(T) == ByteOrderTraits<T>::width) &&
    (sizeof(typename ByteOrderTraits<T>::bits_type) == ByteOrderTraits<T>::width);

// Concept for compile-time byte order markers (BigEndian, LittleEndian)
template <typename Order>
concept ByteOrderMarker = std::same_as<Order, BigEndian> || std::same_as<Order, LittleEndian>;

// Byte width of a convertible type
template <Convertible T>
inline constexpr size_t byte_width_v = ByteOrderTraits<T>::width;

// Fixed-size byte buffer holding exactly one encoded value of type T
template <Convertible T>
using Bytes = std::array<uint8_t, byte_width_v<T>>;

} // namespace bitendian
