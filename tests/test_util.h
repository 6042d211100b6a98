#ifndef SCTP_TEST_UTIL_H
#define SCTP_TEST_UTIL_H

#include <vector>
#include <cstdint>
#include <initializer_list>

#include "sctp_header.h"

namespace sctp::test
{

inline std::vector<std::uint8_t> bytes(std::initializer_list<int> values)
{
    std::vector<std::uint8_t> out;
    out.reserve(values.size());
    for (const int v : values)
    {
        out.push_back(static_cast<std::uint8_t>(v));
    }
    return out;
}

inline void append(std::vector<std::uint8_t>& out, const std::vector<std::uint8_t>& tail) { out.insert(out.end(), tail.begin(), tail.end()); }

// Header for ports 5000 -> 5001 with the given tag, followed by body, with a valid checksum.
inline std::vector<std::uint8_t> make_packet(const std::vector<std::uint8_t>& body, const std::uint32_t tag = 0x01020304)
{
    std::vector<std::uint8_t> out;
    common_header h;
    h.source_port = 5000;
    h.destination_port = 5001;
    h.verification_tag = tag;
    encode_header(h, out);
    append(out, body);
    (void)patch_checksum(out);
    return out;
}

}    // namespace sctp::test

#endif
