// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <vector>

#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <bitendian.hpp>

using namespace bitendian;
using boost::asio::local::stream_protocol;

// In-memory stream delivering at most chunk_ bytes per read_some call
class ChunkedStream {
public:
    explicit ChunkedStream(size_t chunk) : chunk_(chunk) {}

    size_t read_some(const boost::asio::mutable_buffer& buffer, boost::system::error_code& ec) {
        if (data_.empty()) {
            ec = boost::asio::error::eof;
            return 0;
        }
        size_t n = std::min({chunk_, buffer.size(), data_.size()});
        std::copy_n(data_.begin(), n, static_cast<uint8_t*>(buffer.data()));
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(n));
        ++reads_;
        ec = (eof_with_last_ && data_.empty()) ? boost::system::error_code(boost::asio::error::eof)
                                               : boost::system::error_code();
        return n;
    }

    size_t write_some(const boost::asio::const_buffer& buffer, boost::system::error_code& ec) {
        size_t n = std::min(chunk_, buffer.size());
        auto* src = static_cast<const uint8_t*>(buffer.data());
        data_.insert(data_.end(), src, src + n);
        ++writes_;
        ec = {};
        return n;
    }

    std::vector<uint8_t> data_;
    size_t chunk_;
    bool eof_with_last_ = false; // report eof together with the final bytes
    size_t reads_ = 0;
    size_t writes_ = 0;
};

// Stream that accepts nothing without reporting an error
struct StalledStream {
    size_t write_some(const boost::asio::const_buffer&, boost::system::error_code& ec) {
        ec = {};
        return 0;
    }
};

static_assert(SyncReadStream<ChunkedStream>);
static_assert(SyncWriteStream<ChunkedStream>);
static_assert(SyncReadStream<stream_protocol::socket>);
static_assert(!SyncReadStream<StalledStream>);

class SyncStreamTest : public ::testing::Test {
protected:
    void SetUp() override { boost::asio::local::connect_pair(reader_, writer_); }

    boost::asio::io_context io_;
    stream_protocol::socket reader_{io_};
    stream_protocol::socket writer_{io_};
};

// =============================================================================
// Sockets
// =============================================================================

TEST_F(SyncStreamTest, SocketRoundTrip) {
    write_be<uint16_t>(writer_, 0x0102);
    write_le<int32_t>(writer_, -42);
    write_ne(writer_, 3.25, Endian::Big);
    write<LittleEndian>(writer_, 0.5f);

    EXPECT_EQ(read_be<uint16_t>(reader_), 0x0102);
    EXPECT_EQ(read_le<int32_t>(reader_), -42);
    EXPECT_EQ(read_ne<double>(reader_, Endian::Big), 3.25);
    EXPECT_EQ((read<float, LittleEndian>(reader_)), 0.5f);
}

TEST_F(SyncStreamTest, WireBytesMatchConversionLayer) {
    write_be<uint32_t>(writer_, 0x12345678);

    std::array<uint8_t, 4> raw{};
    boost::asio::read(reader_, boost::asio::buffer(raw));
    EXPECT_EQ(raw, to_be_bytes<uint32_t>(0x12345678));
}

TEST_F(SyncStreamTest, ShortReadAfterPeerClosed) {
    const std::array<uint8_t, 3> partial{0xAA, 0xBB, 0xCC};
    boost::asio::write(writer_, boost::asio::buffer(partial));
    writer_.close();

    boost::system::error_code ec;
    uint32_t value = read_le<uint32_t>(reader_, ec);

    EXPECT_EQ(ec, error::unexpected_eof);
    EXPECT_EQ(value, 0u);
}

TEST_F(SyncStreamTest, ThrowingOverloadReportsUnexpectedEof) {
    writer_.close();

    try {
        read_be<uint64_t>(reader_);
        FAIL() << "Expected boost::system::system_error";
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), error::unexpected_eof);
    }
}

TEST_F(SyncStreamTest, TransportErrorPassedThrough) {
    reader_.close();

    boost::system::error_code ec;
    read_be<uint16_t>(reader_, ec);

    EXPECT_TRUE(ec);
    EXPECT_NE(ec, error::unexpected_eof);
    EXPECT_EQ(ec, boost::asio::error::bad_descriptor);
}

// =============================================================================
// User-defined streams
// =============================================================================

TEST(ChunkedStreamTest, ReadAccumulatesSingleBytes) {
    ChunkedStream stream(1);
    stream.data_ = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x00, 0x00, 0x01};

    EXPECT_EQ(read_be<uint32_t>(stream), 0xDEADBEEFu);
    EXPECT_EQ(stream.reads_, 4u);
    EXPECT_EQ(read_be<uint32_t>(stream), 1u);
}

TEST(ChunkedStreamTest, WriteLoopsOverPartialWrites) {
    ChunkedStream stream(3);
    write_le<uint64_t>(stream, 0x0807060504030201ULL);

    EXPECT_EQ(stream.writes_, 3u);
    const std::vector<uint8_t> expected = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(stream.data_, expected);
}

TEST(ChunkedStreamTest, OnlyRequestedBytesConsumed) {
    ChunkedStream stream(64);
    stream.data_ = {0x00, 0x05, 0xFF};

    EXPECT_EQ(read_be<uint16_t>(stream), 5);
    ASSERT_EQ(stream.data_.size(), 1u);
    EXPECT_EQ(stream.data_[0], 0xFF);
}

TEST(ChunkedStreamTest, FinalBytesWithEofSucceed) {
    ChunkedStream stream(2);
    stream.eof_with_last_ = true;
    stream.data_ = {0x01, 0x02, 0x03, 0x04};

    boost::system::error_code ec;
    EXPECT_EQ(read_be<uint32_t>(stream, ec), 0x01020304u);
    EXPECT_FALSE(ec);

    stream.data_ = {0x01, 0x02};
    read_be<uint32_t>(stream, ec);
    EXPECT_EQ(ec, error::unexpected_eof);
}

TEST(StalledStreamTest, ZeroLengthWriteReported) {
    StalledStream stream;

    boost::system::error_code ec;
    write_be<uint32_t>(stream, 1, ec);
    EXPECT_EQ(ec, error::write_zero);

    EXPECT_THROW(write_be<uint32_t>(stream, 1), boost::system::system_error);
}
