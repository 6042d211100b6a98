#include <vector>
#include <cstdint>
#include <variant>

#include <gtest/gtest.h>

#include "sctp_chunk.h"
#include "codec_error.h"
#include "sctp_packet.h"
#include "packet_validation.h"
#include "test_util.h"

namespace sctp
{

namespace
{

packet init_packet()
{
    packet p;
    p.source_port = 5000;
    p.destination_port = 5001;
    p.verification_tag = 0;
    p.chunks.push_back(
        {.flags = 0,
         .value = init_chunk{.initiate_tag = 0x01020304, .advertised_window = 1500, .outbound_streams = 1, .inbound_streams = 1, .initial_tsn = 1, .params = {}}});
    return p;
}

void expect_rejected(const packet& p, const char* path)
{
    const auto result = validate_packet(p);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, errc::kMalformedValue);
    EXPECT_EQ(result.error().path, path) << describe(result.error());
}

init_chunk& init_of(packet& p) { return std::get<init_chunk>(p.chunks[0].value); }

}    // namespace

TEST(PacketValidationTest, AcceptsWellFormedInit)
{
    EXPECT_TRUE(validate_packet(init_packet()).has_value());
}

TEST(PacketValidationTest, PortsMustBeNonZero)
{
    auto p = init_packet();
    p.source_port = 0;
    expect_rejected(p, "/header/source_port");

    p = init_packet();
    p.destination_port = 0;
    expect_rejected(p, "/header/destination_port");
}

TEST(PacketValidationTest, InitMustTravelAloneWithZeroTag)
{
    auto p = init_packet();
    p.verification_tag = 7;
    expect_rejected(p, "/header/verification_tag");

    p = init_packet();
    p.chunks.push_back({.flags = 0, .value = cookie_ack_chunk{}});
    expect_rejected(p, "/chunks/0");
}

TEST(PacketValidationTest, InitFields)
{
    auto p = init_packet();
    p.chunks[0].flags = 0x01;
    expect_rejected(p, "/chunks/0");

    p = init_packet();
    init_of(p).initiate_tag = 0;
    expect_rejected(p, "/chunks/0");

    p = init_packet();
    init_of(p).outbound_streams = 0;
    expect_rejected(p, "/chunks/0");

    p = init_packet();
    init_of(p).inbound_streams = 0;
    expect_rejected(p, "/chunks/0");

    p = init_packet();
    init_of(p).advertised_window = 1499;
    expect_rejected(p, "/chunks/0");
}

TEST(PacketValidationTest, InitAckMayShareThePacket)
{
    packet p;
    p.source_port = 1;
    p.destination_port = 2;
    p.verification_tag = 99;
    p.chunks.push_back({.flags = 0, .value = cookie_ack_chunk{}});
    p.chunks.push_back(
        {.flags = 0,
         .value = init_ack_chunk{.initiate_tag = 5, .advertised_window = 0x10000, .outbound_streams = 2, .inbound_streams = 2, .initial_tsn = 9, .params = {}}});
    EXPECT_TRUE(validate_packet(p).has_value());

    std::get<init_ack_chunk>(p.chunks[1].value).initiate_tag = 0;
    expect_rejected(p, "/chunks/1");
}

TEST(PacketValidationTest, DataNeedsUserData)
{
    packet p;
    p.source_port = 1;
    p.destination_port = 2;
    p.verification_tag = 3;
    p.chunks.push_back({.flags = chunk_flag::kDataBegin | chunk_flag::kDataEnd, .value = data_chunk{}});
    expect_rejected(p, "/chunks/0");

    std::get<data_chunk>(p.chunks[0].value).user_data = test::bytes({1});
    EXPECT_TRUE(validate_packet(p).has_value());
}

TEST(PacketValidationTest, EmptyPacketIsValid)
{
    packet p;
    p.source_port = 1;
    p.destination_port = 2;
    EXPECT_TRUE(validate_packet(p).has_value());
}

}    // namespace sctp
