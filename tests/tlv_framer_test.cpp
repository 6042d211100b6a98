#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <expected>

#include <gtest/gtest.h>

#include "byte_cursor.h"
#include "codec_error.h"
#include "tlv_framer.h"
#include "codec_options.h"
#include "test_util.h"

namespace sctp
{

namespace
{

std::expected<tlv_record, codec_error> read_one(const std::vector<std::uint8_t>& buf,
                                                const tlv_layout layout = tlv_layout::kChunk,
                                                const tail_padding tail = tail_padding::kRequired,
                                                const codec_options& opts = {})
{
    byte_reader r(buf);
    return read_tlv(r, layout, tail, opts, "/chunks/0");
}

}    // namespace

TEST(TlvFramerTest, ChunkHeaderLayout)
{
    const auto buf = test::bytes({0x00, 0x03, 0x00, 0x06, 0xAB, 0xCD, 0x00, 0x00});
    byte_reader r(buf);
    const auto record = read_tlv(r, tlv_layout::kChunk, tail_padding::kRequired, {}, "/chunks/0");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->type, 0);
    EXPECT_EQ(record->flags, 3);
    ASSERT_EQ(record->value.size(), 2U);
    EXPECT_EQ(record->value[0], 0xAB);
    EXPECT_TRUE(r.empty());
}

TEST(TlvFramerTest, ParameterHeaderLayout)
{
    const auto buf = test::bytes({0x80, 0x00, 0x00, 0x04});
    const auto record = read_one(buf, tlv_layout::kParameter);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->type, 0x8000);
    EXPECT_EQ(record->flags, 0);
    EXPECT_TRUE(record->value.empty());
}

TEST(TlvFramerTest, DanglingHeaderIsTruncated)
{
    for (std::size_t len = 1; len < 4; ++len)
    {
        const std::vector<std::uint8_t> buf(len, 0x01);
        const auto record = read_one(buf);
        ASSERT_FALSE(record.has_value());
        EXPECT_EQ(record.error().code, errc::kTruncated);
        EXPECT_EQ(record.error().path, "/chunks/0");
    }
}

TEST(TlvFramerTest, LengthBelowHeaderIsInvalid)
{
    for (const int length : {0, 1, 2, 3})
    {
        const auto buf = test::bytes({0x01, 0x00, 0x00, length, 0, 0, 0, 0});
        const auto record = read_one(buf);
        ASSERT_FALSE(record.has_value());
        EXPECT_EQ(record.error().code, errc::kInvalidLength);
    }
}

TEST(TlvFramerTest, LengthPastEndIsInvalid)
{
    const auto buf = test::bytes({0x01, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00});
    const auto record = read_one(buf);
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, errc::kInvalidLength);
}

TEST(TlvFramerTest, MissingPaddingIsTruncatedWhenRequired)
{
    const auto buf = test::bytes({0x0A, 0x00, 0x00, 0x05, 0x11});
    const auto record = read_one(buf);
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, errc::kTruncated);

    const auto partial = test::bytes({0x0A, 0x00, 0x00, 0x05, 0x11, 0x00, 0x00});
    const auto partial_record = read_one(partial);
    ASSERT_FALSE(partial_record.has_value());
    EXPECT_EQ(partial_record.error().code, errc::kTruncated);
}

TEST(TlvFramerTest, LastRecordMayOmitPaddingWhenOptional)
{
    const auto buf = test::bytes({0x00, 0x07, 0x00, 0x05, 0x11});
    const auto record = read_one(buf, tlv_layout::kParameter, tail_padding::kOptionalAtEnd);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->type, 7);
    EXPECT_EQ(record->value.size(), 1U);

    // Padding is still required when more bytes follow.
    const auto followed = test::bytes({0x00, 0x07, 0x00, 0x05, 0x11, 0x00});
    const auto followed_record = read_one(followed, tlv_layout::kParameter, tail_padding::kOptionalAtEnd);
    ASSERT_FALSE(followed_record.has_value());
    EXPECT_EQ(followed_record.error().code, errc::kTruncated);
}

TEST(TlvFramerTest, NonZeroPaddingRejectedUnlessTolerated)
{
    const auto buf = test::bytes({0x0A, 0x00, 0x00, 0x05, 0x11, 0x00, 0x01, 0x00});
    const auto strict = read_one(buf);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, errc::kMalformedValue);

    codec_options lenient;
    lenient.tolerate_nonzero_padding = true;
    const auto tolerated = read_one(buf, tlv_layout::kChunk, tail_padding::kRequired, lenient);
    ASSERT_TRUE(tolerated.has_value());
    EXPECT_EQ(tolerated->value.size(), 1U);
}

TEST(TlvFramerTest, WriteFiveByteValuePadsThreeZeros)
{
    std::vector<std::uint8_t> buf;
    byte_writer w(buf);
    const auto value = test::bytes({1, 2, 3, 4, 5});
    ASSERT_TRUE(write_tlv(w, tlv_layout::kChunk, 0x0A, 0x00, value, true, "/chunks/0").has_value());
    EXPECT_EQ(buf, test::bytes({0x0A, 0x00, 0x00, 0x09, 1, 2, 3, 4, 5, 0, 0, 0}));

    std::vector<std::uint8_t> unpadded;
    byte_writer uw(unpadded);
    ASSERT_TRUE(write_tlv(uw, tlv_layout::kParameter, 0x0001, 0x00, value, false, "/params/0").has_value());
    EXPECT_EQ(unpadded, test::bytes({0x00, 0x01, 0x00, 0x09, 1, 2, 3, 4, 5}));
}

TEST(TlvFramerTest, BeginFinishPatchesLength)
{
    std::vector<std::uint8_t> buf;
    byte_writer w(buf);
    const auto start = begin_tlv(w, tlv_layout::kCause, 0x000C, 0);
    w.push_u16(0x4142);
    ASSERT_TRUE(finish_tlv(w, start, true, "/causes/0").has_value());
    EXPECT_EQ(buf, test::bytes({0x00, 0x0C, 0x00, 0x06, 0x41, 0x42, 0x00, 0x00}));
}

TEST(TlvFramerTest, OversizedValueRejected)
{
    std::vector<std::uint8_t> buf;
    byte_writer w(buf);
    const std::vector<std::uint8_t> value(65532, 0);
    const auto written = write_tlv(w, tlv_layout::kChunk, 0x00, 0x00, value, true, "/chunks/3");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, errc::kInvalidLength);
    EXPECT_EQ(written.error().path, "/chunks/3");

    const std::vector<std::uint8_t> largest(65531, 0);
    EXPECT_TRUE(write_tlv(w, tlv_layout::kChunk, 0x00, 0x00, largest, true, "/chunks/0").has_value());
}

TEST(TlvFramerTest, LengthChecks)
{
    EXPECT_TRUE(check_exact_length(4, 4, "/").has_value());
    EXPECT_EQ(check_exact_length(3, 4, "/").error().code, errc::kTruncated);
    EXPECT_EQ(check_exact_length(5, 4, "/").error().code, errc::kInvalidLength);
    EXPECT_TRUE(check_min_length(9, 8, "/").has_value());
    EXPECT_EQ(check_min_length(7, 8, "/").error().code, errc::kTruncated);
    EXPECT_TRUE(check_record_multiple(8, 4, "/").has_value());
    EXPECT_EQ(check_record_multiple(6, 4, "/").error().code, errc::kInvalidLength);
}

TEST(TlvFramerTest, ChildPath)
{
    EXPECT_EQ(child_path("/", "chunks", 0), "/chunks/0");
    EXPECT_EQ(child_path("/chunks/2", "params", 1), "/chunks/2/params/1");
    EXPECT_EQ(child_path("/chunks/0", "causes", 3), "/chunks/0/causes/3");
}

}    // namespace sctp
