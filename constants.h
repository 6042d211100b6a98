#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstdint>
#include <cstddef>

namespace constants
{

namespace wire
{
constexpr std::size_t COMMON_HEADER_SIZE = 12;
constexpr std::size_t CHUNK_HEADER_SIZE = 4;
constexpr std::size_t PARAM_HEADER_SIZE = 4;
constexpr std::size_t CAUSE_HEADER_SIZE = 4;
constexpr std::size_t CHECKSUM_OFFSET = 8;
constexpr std::size_t MAX_TLV_LENGTH = 65535;
}    // namespace wire

namespace limits
{
constexpr std::size_t DEFAULT_MAX_PACKET_SIZE = 65535;
constexpr std::size_t MIN_PACKET_SIZE = wire::COMMON_HEADER_SIZE;
constexpr std::uint32_t MIN_ADVERTISED_WINDOW = 1500;
}    // namespace limits

}    // namespace constants

#endif
