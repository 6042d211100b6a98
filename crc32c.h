#ifndef CRC32C_H
#define CRC32C_H

#include <span>
#include <cstdint>

namespace sctp
{

// CRC32c over a whole packet with the checksum field treated as zero.
[[nodiscard]] std::uint32_t compute_checksum(std::span<const std::uint8_t> packet);

}    // namespace sctp

#endif
