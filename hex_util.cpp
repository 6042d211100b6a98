#include <cctype>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <openssl/crypto.h>

#include "hex_util.h"

namespace sctp
{

std::string bytes_to_hex(const std::vector<std::uint8_t>& bytes)
{
    static constexpr char kHexTable[] = "0123456789abcdef";
    std::string hex;
    hex.resize(bytes.size() * 2);
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        const std::uint8_t value = bytes[i];
        hex[2 * i] = kHexTable[(value >> 4) & 0x0F];
        hex[2 * i + 1] = kHexTable[value & 0x0F];
    }
    return hex;
}

std::optional<std::vector<std::uint8_t>> hex_to_bytes(const std::string& text)
{
    std::string compact;
    compact.reserve(text.size());
    for (const char ch : text)
    {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0)
        {
            compact.push_back(ch);
        }
    }
    if (compact.empty())
    {
        return std::vector<std::uint8_t>{};
    }

    long len = 0;
    std::uint8_t* buf = OPENSSL_hexstr2buf(compact.c_str(), &len);
    if (buf == nullptr)
    {
        return std::nullopt;
    }
    std::vector<std::uint8_t> result{buf, buf + len};
    OPENSSL_free(buf);
    return result;
}

}    // namespace sctp
