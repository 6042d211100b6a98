#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>

#include "sctp_packet.h"
#include "codec_options.h"
#include "packet_validation.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    const std::span<const std::uint8_t> input(data, size);

    sctp::decode_report report;
    const auto decoded = sctp::decode_packet(input, {}, &report);
    if (!decoded)
    {
        return 0;
    }
    (void)sctp::validate_packet(*decoded);

    const auto encoded = sctp::encode_packet(*decoded);
    if (encoded)
    {
        (void)sctp::decode_packet(*encoded);
    }

    sctp::codec_options lenient;
    lenient.tolerate_nonzero_padding = true;
    lenient.retain_unrecognized = true;
    (void)sctp::decode_packet(input, lenient, &report);
    return 0;
}
