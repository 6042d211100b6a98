#include <span>
#include <vector>
#include <cstdint>

#include <gtest/gtest.h>

#include "sctp_chunk.h"
#include "codec_error.h"
#include "error_cause.h"
#include "sctp_header.h"
#include "sctp_packet.h"
#include "codec_options.h"
#include "test_util.h"

namespace sctp
{

namespace
{

packet sample_packet()
{
    packet p;
    p.source_port = 5000;
    p.destination_port = 5001;
    p.verification_tag = 0xA1B2C3D4;
    p.chunks.push_back({.flags = chunk_flag::kDataBegin | chunk_flag::kDataEnd,
                        .value = data_chunk{.tsn = 1, .stream_id = 0, .stream_sequence = 0, .payload_protocol_id = 51, .user_data = test::bytes({'p', 'i', 'n', 'g', '!'})}});
    p.chunks.push_back({.flags = 0, .value = sack_chunk{.cumulative_tsn_ack = 7, .advertised_window = 65536, .gap_blocks = {}, .duplicate_tsns = {}}});
    p.chunks.push_back({.flags = 0, .value = error_chunk{.causes = {make_invalid_stream_cause(2)}}});
    return p;
}

}    // namespace

TEST(PacketTest, EncodeDecodeRoundTrip)
{
    const auto p = sample_packet();
    const auto encoded = encode_packet(p);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_TRUE(verify_checksum(*encoded));

    decode_report report;
    const auto decoded = decode_packet(*encoded, {}, &report);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(report.advisories.empty());
    EXPECT_EQ(decoded->source_port, p.source_port);
    EXPECT_EQ(decoded->destination_port, p.destination_port);
    EXPECT_EQ(decoded->verification_tag, p.verification_tag);
    EXPECT_EQ(decoded->chunks, p.chunks);

    auto expected = p;
    expected.checksum = decoded->checksum;
    EXPECT_EQ(*decoded, expected);

    const auto reencoded = encode_packet(*decoded);
    ASSERT_TRUE(reencoded.has_value());
    EXPECT_EQ(*reencoded, *encoded);
}

TEST(PacketTest, ShortInputIsTruncated)
{
    const auto empty = decode_packet({});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, errc::kTruncated);

    const std::vector<std::uint8_t> header(11, 0x42);
    for (std::size_t len = 1; len <= header.size(); ++len)
    {
        const auto decoded = decode_packet(std::span<const std::uint8_t>(header.data(), len));
        ASSERT_FALSE(decoded.has_value()) << "length " << len;
        EXPECT_EQ(decoded.error().code, errc::kTruncated);
    }
}

TEST(PacketTest, HeaderOnlyPacketWithZeroChecksum)
{
    const auto data = test::bytes({0x00, 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    decode_report report;
    const auto decoded = decode_packet(data, {}, &report);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->source_port, 1);
    EXPECT_EQ(decoded->destination_port, 2);
    EXPECT_EQ(decoded->verification_tag, 1U);
    EXPECT_EQ(decoded->checksum, 0U);
    EXPECT_TRUE(decoded->chunks.empty());
    EXPECT_FALSE(verify_checksum(data));
    EXPECT_FALSE(report.checksum_ok());
    ASSERT_EQ(report.advisories.size(), 1U);
    EXPECT_EQ(report.advisories[0].code, errc::kChecksumMismatch);
}

TEST(PacketTest, ChecksumMismatchIsAdvisory)
{
    auto encoded = encode_packet(sample_packet());
    ASSERT_TRUE(encoded.has_value());
    (*encoded)[20] ^= 0x01;

    decode_report report;
    const auto decoded = decode_packet(*encoded, {}, &report);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(report.checksum_ok());

    // Without a report the mismatch goes unrecorded but decoding still succeeds.
    EXPECT_TRUE(decode_packet(*encoded).has_value());
}

TEST(PacketTest, MaxPacketSize)
{
    const auto encoded = encode_packet(sample_packet());
    ASSERT_TRUE(encoded.has_value());

    codec_options opts;
    opts.max_packet_size = encoded->size() - 1;
    const auto decoded = decode_packet(*encoded, opts);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, errc::kInvalidLength);

    const auto too_big = encode_packet(sample_packet(), opts);
    ASSERT_FALSE(too_big.has_value());
    EXPECT_EQ(too_big.error().code, errc::kInvalidLength);

    opts.max_packet_size = encoded->size();
    EXPECT_TRUE(decode_packet(*encoded, opts).has_value());
    EXPECT_TRUE(encode_packet(sample_packet(), opts).has_value());
}

TEST(PacketTest, ChunkErrorCarriesPath)
{
    auto body = test::bytes({0x0B, 0x00, 0x00, 0x04});
    test::append(body, test::bytes({0x07, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0x00}));
    const auto data = test::make_packet(body);
    const auto decoded = decode_packet(data);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, errc::kTruncated);
    EXPECT_EQ(decoded.error().path, "/chunks/1");
}

TEST(PacketTest, TrailingGarbageAfterChunks)
{
    auto body = test::bytes({0x0B, 0x00, 0x00, 0x04, 0x00, 0x00});
    const auto decoded = decode_packet(test::make_packet(body));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, errc::kTruncated);
}

TEST(PacketTest, ArbitraryBytesNeverCrash)
{
    std::vector<std::uint8_t> data;
    std::uint32_t state = 0x12345678;
    for (int round = 0; round < 2000; ++round)
    {
        state = state * 1664525U + 1013904223U;
        data.resize(state % 96);
        for (auto& b : data)
        {
            state = state * 1664525U + 1013904223U;
            b = static_cast<std::uint8_t>(state >> 24);
        }
        codec_options opts;
        opts.retain_unrecognized = (round % 2) == 0;
        opts.tolerate_nonzero_padding = (round % 3) == 0;
        decode_report report;
        const auto decoded = decode_packet(data, opts, &report);
        if (decoded)
        {
            EXPECT_TRUE(encode_packet(*decoded).has_value());
        }
    }
}

}    // namespace sctp
