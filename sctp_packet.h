#ifndef SCTP_PACKET_H
#define SCTP_PACKET_H

#include <span>
#include <vector>
#include <cstdint>
#include <expected>

#include "sctp_chunk.h"
#include "codec_error.h"
#include "sctp_header.h"
#include "codec_options.h"

namespace sctp
{

struct packet
{
    std::uint16_t source_port = 0;
    std::uint16_t destination_port = 0;
    std::uint32_t verification_tag = 0;
    // Filled in by decode_packet; encode_packet always computes it.
    std::uint32_t checksum = 0;
    std::vector<chunk> chunks;

    [[nodiscard]] common_header header() const;

    bool operator==(const packet&) const = default;
};

// A checksum mismatch does not fail the decode; it is recorded in report and
// the caller decides whether to drop the packet.
[[nodiscard]] std::expected<packet, codec_error> decode_packet(std::span<const std::uint8_t> data,
                                                               const codec_options& opts = {},
                                                               decode_report* report = nullptr);

[[nodiscard]] std::expected<std::vector<std::uint8_t>, codec_error> encode_packet(const packet& p, const codec_options& opts = {});

}    // namespace sctp

#endif
