#pragma once

// BITENDIAN - Endian-aware numeric encoding for C++20
//
// A header-only library for encoding and decoding fixed-width numbers in
// big-endian or little-endian order, selected at compile time or at run time,
// with the target type chosen by a single template parameter instead of one
// function per width.
//
// Conversion Features:
// - 8/16/32/64-bit signed and unsigned integers, 128-bit integers where the
//   compiler provides them, IEEE-754 float and double
// - constexpr, noexcept, allocation-free conversions
// - Compile-time order (BigEndian / LittleEndian markers) or run-time order (Endian)
// - No host-order operation: results never depend on the machine
//
// Stream Features:
// - Blocking reads/writes on Boost.Asio sync streams and std::iostreams
// - Asynchronous reads/writes on Boost.Asio streams (bitendian/bitendian_asio.hpp)
// - Asynchronous reads/writes on libevent bufferevents (bitendian/bitendian_libevent.hpp)
// - Short reads reported as bitendian::error::unexpected_eof

// ====================
// Public API
// ====================

// Version information (generated)
#include "bitendian/version.hpp"

// Byte order enum and markers
#include "bitendian/core/types.hpp"

// Concepts for constraining user templates
#include "bitendian/core/concepts.hpp"

// Error codes
#include "bitendian/core/error.hpp"

// ====================
// Implementation
// ====================

// Conversion layer
#include "bitendian/core/byte_order.hpp"

// Blocking stream extensions
#include "bitendian/io/iostream.hpp"
#include "bitendian/io/sync_stream.hpp"
