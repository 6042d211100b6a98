#ifndef SCTP_HEADER_H
#define SCTP_HEADER_H

#include <span>
#include <vector>
#include <cstdint>
#include <expected>

#include "codec_error.h"

namespace sctp
{

struct common_header
{
    std::uint16_t source_port = 0;
    std::uint16_t destination_port = 0;
    std::uint32_t verification_tag = 0;
    std::uint32_t checksum = 0;

    bool operator==(const common_header&) const = default;
};

// Splits the 12-byte common header off the front of data. rest receives the
// packet body on success.
[[nodiscard]] std::expected<common_header, codec_error> decode_header(std::span<const std::uint8_t> data, std::span<const std::uint8_t>& rest);

// Appends the header with a zero checksum; the checksum is patched once the
// body is complete.
void encode_header(const common_header& h, std::vector<std::uint8_t>& buf);

// Overwrites the checksum field of an encoded packet with the CRC32c of its contents.
[[nodiscard]] std::expected<std::uint32_t, codec_error> patch_checksum(std::vector<std::uint8_t>& packet);

// False for short packets and for checksum mismatches.
[[nodiscard]] bool verify_checksum(std::span<const std::uint8_t> packet);

// Distinguishes a short packet from a checksum mismatch.
[[nodiscard]] std::expected<void, codec_error> check_checksum(std::span<const std::uint8_t> packet);

}    // namespace sctp

#endif
