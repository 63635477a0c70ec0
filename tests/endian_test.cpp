// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <gtest/gtest.h>
#include <bitendian/core/detail/endian.hpp>
#include <bitendian/core/types.hpp>
#include <bitendian/version.hpp>

// Fixed-width swaps, each applied twice to get the input back
TEST(EndianTest, FixedWidthByteSwap) {
    EXPECT_EQ(bitendian::detail::byteswap16(0x1234), 0x3412);
    EXPECT_EQ(bitendian::detail::byteswap16(bitendian::detail::byteswap16(0xBEEF)), 0xBEEF);

    EXPECT_EQ(bitendian::detail::byteswap32(0x12345678), 0x78563412u);
    EXPECT_EQ(bitendian::detail::byteswap32(bitendian::detail::byteswap32(0xCAFEF00D)), 0xCAFEF00Du);

    EXPECT_EQ(bitendian::detail::byteswap64(0x123456789ABCDEF0ULL), 0xF0DEBC9A78563412ULL);
    EXPECT_EQ(bitendian::detail::byteswap64(bitendian::detail::byteswap64(0x0011223344556677ULL)),
              0x0011223344556677ULL);
}

TEST(EndianTest, ByteSwap128) {
    using bitendian::detail::uint128_t;
    uint128_t value = (static_cast<uint128_t>(0x0011223344556677ULL) << 64) | 0x8899AABBCCDDEEFFULL;
    uint128_t expected =
        (static_cast<uint128_t>(0xFFEEDDCCBBAA9988ULL) << 64) | 0x7766554433221100ULL;

    EXPECT_TRUE(bitendian::detail::byteswap128(value) == expected);
    EXPECT_TRUE(bitendian::detail::byteswap128(expected) == value);
}

// Generic dispatch picks the routine by carrier width
TEST(EndianTest, GenericByteSwap) {
    EXPECT_EQ(bitendian::detail::byteswap<uint8_t>(0xAB), 0xAB);
    EXPECT_EQ(bitendian::detail::byteswap<uint16_t>(0xABCD), 0xCDAB);
    EXPECT_EQ(bitendian::detail::byteswap<uint32_t>(0x01020304), 0x04030201u);
    EXPECT_EQ(bitendian::detail::byteswap<uint64_t>(0x0102030405060708ULL), 0x0807060504030201ULL);
}

// Test that big-endian conversion lays out the most-significant byte first
TEST(EndianTest, HostToBigIsBigEndian) {
    uint32_t value = 0x12345678;
    uint32_t big = bitendian::detail::host_to_big(value);

    uint8_t bytes[4];
    std::memcpy(bytes, &big, 4);

    EXPECT_EQ(bytes[0], 0x12); // MSB
    EXPECT_EQ(bytes[1], 0x34);
    EXPECT_EQ(bytes[2], 0x56);
    EXPECT_EQ(bytes[3], 0x78); // LSB
}

TEST(EndianTest, HostToLittleIsLittleEndian) {
    uint32_t value = 0x12345678;
    uint32_t little = bitendian::detail::host_to_little(value);

    uint8_t bytes[4];
    std::memcpy(bytes, &little, 4);

    EXPECT_EQ(bytes[0], 0x78); // LSB
    EXPECT_EQ(bytes[1], 0x56);
    EXPECT_EQ(bytes[2], 0x34);
    EXPECT_EQ(bytes[3], 0x12); // MSB
}

// Conversions are their own inverse
TEST(EndianTest, RoundTrip) {
    uint64_t value = 0xCAFEBABEDEADBEEFULL;
    EXPECT_EQ(bitendian::detail::host_to_big(bitendian::detail::host_to_big(value)), value);
    EXPECT_EQ(bitendian::detail::host_to_little(bitendian::detail::host_to_little(value)), value);
}

// Test constexpr nature of endian functions
TEST(EndianTest, ConstexprFunctions) {
    constexpr uint32_t swapped = bitendian::detail::byteswap32(0x12345678);
    constexpr uint32_t big = bitendian::detail::host_to_big<uint32_t>(0xDEADBEEF);

    EXPECT_EQ(swapped, 0x78563412);
    // big value depends on platform endianness, just verify it compiles
    (void)big;
}

// Test platform detection
TEST(EndianTest, PlatformDetection) {
    EXPECT_TRUE(bitendian::detail::is_little_endian || bitendian::detail::is_big_endian);
    EXPECT_FALSE(bitendian::detail::is_little_endian && bitendian::detail::is_big_endian);

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    EXPECT_TRUE(bitendian::detail::is_little_endian);
#endif
}

// Test edge cases
TEST(EndianTest, EdgeCases) {
    EXPECT_EQ(bitendian::detail::byteswap16(0), 0);
    EXPECT_EQ(bitendian::detail::byteswap32(0), 0);
    EXPECT_EQ(bitendian::detail::byteswap64(0), 0);

    EXPECT_EQ(bitendian::detail::byteswap16(0xFFFF), 0xFFFF);
    EXPECT_EQ(bitendian::detail::byteswap32(0xFFFFFFFF), 0xFFFFFFFF);
    EXPECT_EQ(bitendian::detail::byteswap64(0xFFFFFFFFFFFFFFFFULL), 0xFFFFFFFFFFFFFFFFULL);

    // Powers of 2
    EXPECT_EQ(bitendian::detail::byteswap32(0x00000001), 0x01000000);
    EXPECT_EQ(bitendian::detail::byteswap32(0x80000000), 0x00000080);
}

// =============================================================================
// Endian enum and markers
// =============================================================================

TEST(EndianTest, MarkerValues) {
    static_assert(bitendian::BigEndian::value == bitendian::Endian::Big);
    static_assert(bitendian::LittleEndian::value == bitendian::Endian::Little);
    static_assert(bitendian::NetworkEndian::value == bitendian::Endian::Big);

    EXPECT_TRUE(std::is_empty_v<bitendian::BigEndian>);
    EXPECT_TRUE(std::is_empty_v<bitendian::LittleEndian>);
}

TEST(EndianTest, EndianString) {
    EXPECT_STREQ(bitendian::endian_string(bitendian::Endian::Big), "big");
    EXPECT_STREQ(bitendian::endian_string(bitendian::Endian::Little), "little");
    EXPECT_STREQ(bitendian::endian_string(static_cast<bitendian::Endian>(7)), "unknown");
}

TEST(EndianTest, VersionConstants) {
    EXPECT_EQ(bitendian::version_major, BITENDIAN_VERSION_MAJOR);
    EXPECT_EQ(bitendian::version_minor, BITENDIAN_VERSION_MINOR);
    EXPECT_EQ(bitendian::version_patch, BITENDIAN_VERSION_PATCH);

    const std::string expected = std::to_string(BITENDIAN_VERSION_MAJOR) + "." +
                                 std::to_string(BITENDIAN_VERSION_MINOR) + "." +
                                 std::to_string(BITENDIAN_VERSION_PATCH);
    EXPECT_EQ(expected, bitendian::version_string);
}
