#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>

#include "param_framer.h"
#include "codec_options.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    sctp::codec_options opts;
    opts.retain_unrecognized = true;
    const auto params = sctp::decode_param_list(std::span<const std::uint8_t>(data, size), opts);
    if (!params)
    {
        return 0;
    }

    const auto encoded = sctp::encode_param_list(*params);
    if (encoded)
    {
        (void)sctp::decode_param_list(*encoded, opts);
    }
    return 0;
}
