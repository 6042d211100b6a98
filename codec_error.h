#ifndef CODEC_ERROR_H
#define CODEC_ERROR_H

#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sctp
{

enum class errc : std::uint8_t
{
    kTruncated,
    kInvalidLength,
    kChecksumMismatch,
    kUnrecognizedType,
    kMalformedValue,
};

// Action encoded in the two most significant bits of a chunk or parameter type.
enum class unrecognized_action : std::uint8_t
{
    kStop = 0,
    kStopSilently = 1,
    kSkip = 2,
    kSkipAndReport = 3,
};

struct codec_error
{
    errc code = errc::kMalformedValue;
    std::string path = "/";
    std::string reason;
    std::uint16_t type = 0;
    std::optional<unrecognized_action> action;
};

[[nodiscard]] std::string_view to_string(errc code);
[[nodiscard]] std::string_view to_string(unrecognized_action action);
[[nodiscard]] std::string describe(const codec_error& error);

[[nodiscard]] codec_error make_codec_error(errc code, std::string path, std::string reason);
[[nodiscard]] codec_error make_unrecognized_error(std::string path, std::uint16_t type, unrecognized_action action);

[[nodiscard]] constexpr unrecognized_action chunk_action_of(const std::uint8_t type)
{
    return static_cast<unrecognized_action>((type >> 6) & 0x03);
}

[[nodiscard]] constexpr unrecognized_action param_action_of(const std::uint16_t type)
{
    return static_cast<unrecognized_action>((type >> 14) & 0x03);
}

}    // namespace sctp

#endif
