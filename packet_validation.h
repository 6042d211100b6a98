#ifndef PACKET_VALIDATION_H
#define PACKET_VALIDATION_H

#include <expected>

#include "codec_error.h"
#include "sctp_packet.h"

namespace sctp
{

// Association independent sanity rules applied to a decoded packet before it
// is handed to an association. Failures are reported as malformed values.
[[nodiscard]] std::expected<void, codec_error> validate_packet(const packet& p);

}    // namespace sctp

#endif
