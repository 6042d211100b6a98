#include <vector>
#include <cstdint>
#include <initializer_list>

#include <gtest/gtest.h>

#include "sctp_chunk.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "chunk_framer.h"
#include "codec_options.h"
#include "test_util.h"

namespace sctp
{

namespace
{

const std::vector<std::uint8_t> kCookieAck = test::bytes({0x0B, 0x00, 0x00, 0x04});
const std::vector<std::uint8_t> kShutdownComplete = test::bytes({0x0E, 0x01, 0x00, 0x04});

std::vector<std::uint8_t> unknown_chunk_bytes(const int type) { return test::bytes({type, 0x05, 0x00, 0x05, 0xAA, 0x00, 0x00, 0x00}); }

std::vector<std::uint8_t> join(std::initializer_list<std::vector<std::uint8_t>> parts)
{
    std::vector<std::uint8_t> out;
    for (const auto& part : parts)
    {
        test::append(out, part);
    }
    return out;
}

}    // namespace

TEST(ChunkFramerTest, EmptyBodyHasNoChunks)
{
    const auto chunks = decode_chunks({});
    ASSERT_TRUE(chunks.has_value());
    EXPECT_TRUE(chunks->empty());
}

TEST(ChunkFramerTest, DecodesSequenceAndFlags)
{
    const auto body = join({kCookieAck, kShutdownComplete});
    const auto chunks = decode_chunks(body);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 2U);
    EXPECT_EQ((*chunks)[0].type(), chunk_type::kCookieAck);
    EXPECT_EQ((*chunks)[1].type(), chunk_type::kShutdownComplete);
    EXPECT_EQ((*chunks)[1].flags, chunk_flag::kTagReflected);
}

TEST(ChunkFramerTest, ZeroLengthChunkFailsInsteadOfLooping)
{
    const auto body = join({kCookieAck, test::bytes({0x0B, 0x00, 0x00, 0x00})});
    const auto chunks = decode_chunks(body);
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, errc::kInvalidLength);
    EXPECT_EQ(chunks.error().path, "/chunks/1");
}

TEST(ChunkFramerTest, DanglingHeaderIsTruncated)
{
    const auto body = join({kCookieAck, test::bytes({0x0B, 0x00})});
    const auto chunks = decode_chunks(body);
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, errc::kTruncated);
}

TEST(ChunkFramerTest, MissingPaddingOnLastChunkIsTruncated)
{
    const auto body = test::bytes({0x0A, 0x00, 0x00, 0x05, 0x42});
    const auto chunks = decode_chunks(body);
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, errc::kTruncated);
}

TEST(ChunkFramerTest, NonZeroPaddingPolicy)
{
    const auto body = test::bytes({0x0A, 0x00, 0x00, 0x05, 0x42, 0x00, 0x00, 0x07});
    const auto strict = decode_chunks(body);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, errc::kMalformedValue);

    codec_options opts;
    opts.tolerate_nonzero_padding = true;
    const auto lenient = decode_chunks(body, opts);
    ASSERT_TRUE(lenient.has_value());
    ASSERT_EQ(lenient->size(), 1U);
    const auto* cookie = (*lenient)[0].get_if<cookie_echo_chunk>();
    ASSERT_NE(cookie, nullptr);
    EXPECT_EQ(cookie->cookie, test::bytes({0x42}));
}

TEST(ChunkFramerTest, UnknownTypeWithStopActionIsFatal)
{
    const auto body = join({kCookieAck, unknown_chunk_bytes(0x3F), kShutdownComplete});
    decode_report report;
    const auto chunks = decode_chunks(body, {}, &report);
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, errc::kUnrecognizedType);
    EXPECT_EQ(chunks.error().type, 0x3F);
    ASSERT_TRUE(chunks.error().action.has_value());
    EXPECT_EQ(*chunks.error().action, unrecognized_action::kStop);
    EXPECT_EQ(chunks.error().path, "/chunks/1");
}

TEST(ChunkFramerTest, UnknownTypeWithStopSilentlyDropsRemainder)
{
    // The bytes after the unknown chunk are garbage but are never parsed.
    const auto body = join({kCookieAck, unknown_chunk_bytes(0x7F), test::bytes({0x0B, 0x00, 0x00})});
    decode_report report;
    const auto chunks = decode_chunks(body, {}, &report);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 1U);
    EXPECT_EQ((*chunks)[0].type(), chunk_type::kCookieAck);
    EXPECT_TRUE(report.advisories.empty());
}

TEST(ChunkFramerTest, UnknownTypeWithSkipActionContinues)
{
    const auto body = join({kCookieAck, unknown_chunk_bytes(0xBF), kShutdownComplete});
    decode_report report;
    const auto chunks = decode_chunks(body, {}, &report);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 2U);
    EXPECT_EQ((*chunks)[0].type(), chunk_type::kCookieAck);
    EXPECT_EQ((*chunks)[1].type(), chunk_type::kShutdownComplete);
    EXPECT_TRUE(report.advisories.empty());
}

TEST(ChunkFramerTest, UnknownTypeWithSkipAndReportAddsAdvisory)
{
    const auto body = join({unknown_chunk_bytes(0xFF), kCookieAck});
    decode_report report;
    const auto chunks = decode_chunks(body, {}, &report);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 1U);
    ASSERT_EQ(report.advisories.size(), 1U);
    EXPECT_EQ(report.advisories[0].code, errc::kUnrecognizedType);
    EXPECT_EQ(report.advisories[0].type, 0xFF);
    EXPECT_EQ(report.advisories[0].action, unrecognized_action::kSkipAndReport);
    EXPECT_EQ(report.advisories[0].path, "/chunks/0");
    EXPECT_TRUE(report.checksum_ok());

    // A missing report is allowed.
    EXPECT_TRUE(decode_chunks(body).has_value());
}

TEST(ChunkFramerTest, RetainUnrecognizedKeepsSkippedChunks)
{
    const auto body = join({unknown_chunk_bytes(0xBF), kCookieAck});
    codec_options opts;
    opts.retain_unrecognized = true;
    const auto chunks = decode_chunks(body, opts);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 2U);
    const auto* unknown = (*chunks)[0].get_if<unknown_chunk>();
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->type, 0xBF);
    EXPECT_EQ(unknown->value, test::bytes({0xAA}));
    EXPECT_EQ((*chunks)[0].flags, 0x05);
    EXPECT_EQ((*chunks)[0].type(), 0xBF);

    // Re-encoding reproduces the original bytes.
    std::vector<std::uint8_t> buf;
    byte_writer w(buf);
    ASSERT_TRUE(encode_chunks(*chunks, w).has_value());
    EXPECT_EQ(buf, body);
}

TEST(ChunkFramerTest, EncodePadsFiveByteValue)
{
    chunk c;
    c.value = cookie_echo_chunk{.cookie = test::bytes({1, 2, 3, 4, 5})};
    std::vector<std::uint8_t> buf;
    byte_writer w(buf);
    ASSERT_TRUE(encode_chunk(c, w).has_value());
    EXPECT_EQ(buf, test::bytes({0x0A, 0x00, 0x00, 0x09, 1, 2, 3, 4, 5, 0, 0, 0}));
}

TEST(ChunkFramerTest, EncodeReportsFailingChunkPath)
{
    std::vector<chunk> chunks(2);
    chunks[0].value = cookie_ack_chunk{};
    chunks[1].value = reconfig_chunk{};
    std::vector<std::uint8_t> buf;
    byte_writer w(buf);
    const auto encoded = encode_chunks(chunks, w);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code, errc::kMalformedValue);
    EXPECT_EQ(encoded.error().path, "/chunks/1");
}

}    // namespace sctp
