#include "paddock/protocol/byte_reader.hpp"

#include <gtest/gtest.h>

#include <array>

using namespace paddock;
using namespace paddock::protocol;

TEST(ByteReader, ReadsLittleEndian) {
    const std::array<uint8_t, 15> bytes = {0x01,                   // u8
                                           0x34, 0x12,             // u16
                                           0x78, 0x56, 0x34, 0x12, // u32
                                           0xFF,                   // i8
                                           0xFE, 0xFF,             // i16
                                           0x00, 0x00, 0x80, 0x3F, // f32 1.0
                                           0x02};
    ByteReader r(bytes, "test");

    EXPECT_EQ(r.u8(), 0x01);
    EXPECT_EQ(r.u16(), 0x1234);
    EXPECT_EQ(r.u32(), 0x12345678u);
    EXPECT_EQ(r.i8(), -1);
    EXPECT_EQ(r.i16(), -2);
    EXPECT_FLOAT_EQ(r.f32(), 1.0f);
    EXPECT_TRUE(r.flag());
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(ByteReader, ReadsU64AndF64) {
    const std::array<uint8_t, 16> bytes = {0xEF, 0xCD, 0xAB, 0x89, 0x67, 0x45, 0x23, 0x01,
                                           0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F};
    ByteReader r(bytes, "test");
    EXPECT_EQ(r.u64(), 0x0123456789ABCDEFull);
    EXPECT_DOUBLE_EQ(r.f64(), 1.0);
}

TEST(ByteReader, ShortReadThrowsTruncated) {
    const std::array<uint8_t, 3> bytes = {1, 2, 3};
    ByteReader r(bytes, "thing");
    r.u16();
    try {
        r.u16();
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Truncated);
        EXPECT_EQ(std::string(e.what()), "thing: need 4 bytes, have 3");
    }
    // Failed read does not advance
    EXPECT_EQ(r.position(), 2u);
    EXPECT_EQ(r.u8(), 3);
}

TEST(ByteReader, EmptyBuffer) {
    ByteReader r({}, "empty");
    EXPECT_EQ(r.remaining(), 0u);
    EXPECT_THROW(r.u8(), DecodeError);
    EXPECT_NO_THROW(r.require(0));
}

TEST(ByteReader, FixedStringStopsAtNul) {
    const std::array<uint8_t, 6> bytes = {'H', 'A', 'M', 0, 'X', 'Y'};
    ByteReader r(bytes, "name");
    EXPECT_EQ(r.fixed_string(6), "HAM");
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(ByteReader, FixedStringWithoutNul) {
    const std::array<uint8_t, 4> bytes = {'V', 'E', 'R', 'S'};
    ByteReader r(bytes, "name");
    EXPECT_EQ(r.fixed_string(4), "VERS");
}

TEST(ByteReader, SkipAndRest) {
    const std::array<uint8_t, 5> bytes = {1, 2, 3, 4, 5};
    ByteReader r(bytes, "test");
    r.skip(2);
    EXPECT_EQ(r.position(), 2u);
    auto rest = r.rest();
    ASSERT_EQ(rest.size(), 3u);
    EXPECT_EQ(rest[0], 3);
    EXPECT_THROW(r.skip(4), DecodeError);
}

TEST(EnumInRange, AcceptsBoundsRejectsOutside) {
    enum class Small : uint8_t { A, B, C };
    EXPECT_EQ((enum_in_range<Small, uint8_t>(0, 0, 2, "f")), Small::A);
    EXPECT_EQ((enum_in_range<Small, uint8_t>(2, 0, 2, "f")), Small::C);
    try {
        (void)enum_in_range<Small, uint8_t>(3, 0, 2, "thing.small");
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedField);
        EXPECT_EQ(e.field(), "thing.small");
        EXPECT_EQ(std::string(e.what()), "Invalid value 3 for 'thing.small'");
    }
}

TEST(EnumInRange, SignedRange) {
    enum class Flag : int8_t { Unknown = -1, None = 0, Red = 4 };
    EXPECT_EQ((enum_in_range<Flag, int8_t>(-1, -1, 4, "f")), Flag::Unknown);
    EXPECT_THROW((enum_in_range<Flag, int8_t>(-2, -1, 4, "f")), DecodeError);
}

TEST(Errors, KindNamesAndRecoverability) {
    EXPECT_EQ(error_kind_name(ErrorKind::Truncated), "Truncated");
    EXPECT_EQ(error_kind_name(ErrorKind::ConcurrentReceive), "ConcurrentReceive");

    EXPECT_TRUE(DecodeError::truncated("x", 2, 1).recoverable());
    EXPECT_TRUE(ClientError(ErrorKind::ReceiveFailed, "x").recoverable());
    EXPECT_FALSE(ClientError(ErrorKind::BindError, "x").recoverable());
    EXPECT_FALSE(ClientError(ErrorKind::Closed, "x").recoverable());
}
