#ifndef CODEC_OPTIONS_H
#define CODEC_OPTIONS_H

#include <vector>
#include <cstddef>
#include <utility>
#include <algorithm>

#include "constants.h"
#include "codec_error.h"

namespace sctp
{

struct codec_options
{
    // Nonzero padding is rejected unless this is set.
    bool tolerate_nonzero_padding = false;
    // Keep skipped unrecognized records as unknown values instead of dropping them.
    bool retain_unrecognized = false;
    std::size_t max_packet_size = constants::limits::DEFAULT_MAX_PACKET_SIZE;
};

// Non-fatal findings of one decode call: checksum mismatches and
// skip-and-report unrecognized records.
struct decode_report
{
    std::vector<codec_error> advisories;

    void add(codec_error error) { advisories.push_back(std::move(error)); }

    [[nodiscard]] bool checksum_ok() const
    {
        return std::none_of(advisories.begin(), advisories.end(), [](const codec_error& e) { return e.code == errc::kChecksumMismatch; });
    }
};

}    // namespace sctp

#endif
