#ifndef PACKET_FORMAT_H
#define PACKET_FORMAT_H

#include <string>

#include "sctp_param.h"
#include "sctp_chunk.h"
#include "sctp_packet.h"

namespace sctp
{

[[nodiscard]] std::string format_param(const parameter& p);
[[nodiscard]] std::string format_chunk(const chunk& c);

// One line for the header followed by one indented line per chunk, parameter and cause.
[[nodiscard]] std::string format_packet(const packet& p);

}    // namespace sctp

#endif
