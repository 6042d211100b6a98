#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <expected>

#include "log.h"
#include "crc32c.h"
#include "constants.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "sctp_header.h"

namespace sctp
{

namespace
{

// The checksum travels in little endian order, unlike every other field.
[[nodiscard]] std::uint32_t load_checksum(const std::uint8_t* p)
{
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) | (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

void store_checksum(std::uint8_t* p, const std::uint32_t value)
{
    p[0] = static_cast<std::uint8_t>(value & 0xFF);
    p[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    p[2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    p[3] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
}

}    // namespace

std::expected<common_header, codec_error> decode_header(const std::span<const std::uint8_t> data, std::span<const std::uint8_t>& rest)
{
    byte_reader r(data);
    common_header h;
    std::span<const std::uint8_t> checksum_bytes;
    if (!r.read_u16(h.source_port) || !r.read_u16(h.destination_port) || !r.read_u32(h.verification_tag) || !r.read(4, checksum_bytes))
    {
        return std::unexpected(make_codec_error(
            errc::kTruncated, "/header", "need " + std::to_string(constants::wire::COMMON_HEADER_SIZE) + " bytes got " + std::to_string(data.size())));
    }
    h.checksum = load_checksum(checksum_bytes.data());
    rest = r.rest();
    return h;
}

void encode_header(const common_header& h, std::vector<std::uint8_t>& buf)
{
    byte_writer w(buf);
    w.push_u16(h.source_port);
    w.push_u16(h.destination_port);
    w.push_u32(h.verification_tag);
    w.push_u32(0);
}

std::expected<std::uint32_t, codec_error> patch_checksum(std::vector<std::uint8_t>& packet)
{
    if (packet.size() < constants::wire::COMMON_HEADER_SIZE)
    {
        return std::unexpected(make_codec_error(errc::kTruncated, "/header", "packet shorter than common header"));
    }
    const std::uint32_t checksum = compute_checksum(packet);
    store_checksum(packet.data() + constants::wire::CHECKSUM_OFFSET, checksum);
    return checksum;
}

std::expected<void, codec_error> check_checksum(const std::span<const std::uint8_t> packet)
{
    if (packet.size() < constants::wire::COMMON_HEADER_SIZE)
    {
        return std::unexpected(make_codec_error(errc::kTruncated, "/header", "packet shorter than common header"));
    }
    const std::uint32_t carried = load_checksum(packet.data() + constants::wire::CHECKSUM_OFFSET);
    const std::uint32_t computed = compute_checksum(packet);
    if (carried != computed)
    {
        LOG_DEBUG("checksum mismatch carried {:08x} computed {:08x}", carried, computed);
        return std::unexpected(make_codec_error(errc::kChecksumMismatch, "/header/checksum", "carried checksum does not match computed crc32c"));
    }
    return {};
}

bool verify_checksum(const std::span<const std::uint8_t> packet) { return check_checksum(packet).has_value(); }

}    // namespace sctp
