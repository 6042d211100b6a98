#ifndef HEX_UTIL_H
#define HEX_UTIL_H

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace sctp
{

[[nodiscard]] std::string bytes_to_hex(const std::vector<std::uint8_t>& bytes);

// Accepts "0a1b", "0A:1B" and either form split by whitespace.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(const std::string& text);

}    // namespace sctp

#endif
