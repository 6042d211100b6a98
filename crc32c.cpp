#include <span>
#include <array>
#include <cstdint>

#include <boost/crc.hpp>

#include "crc32c.h"
#include "constants.h"

namespace sctp
{

namespace
{

// Castagnoli polynomial, reflected in and out. boost builds the lookup table once
// and never mutates it afterwards.
using crc32c_type = boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true>;

constexpr std::array<std::uint8_t, 4> kZeroChecksum = {0, 0, 0, 0};

}    // namespace

std::uint32_t compute_checksum(const std::span<const std::uint8_t> packet)
{
    crc32c_type crc;
    if (packet.size() < constants::wire::COMMON_HEADER_SIZE)
    {
        crc.process_bytes(packet.data(), packet.size());
        return crc.checksum();
    }
    crc.process_bytes(packet.data(), constants::wire::CHECKSUM_OFFSET);
    crc.process_bytes(kZeroChecksum.data(), kZeroChecksum.size());
    const auto body = packet.subspan(constants::wire::COMMON_HEADER_SIZE);
    crc.process_bytes(body.data(), body.size());
    return crc.checksum();
}

}    // namespace sctp
