#ifndef ERROR_CAUSE_H
#define ERROR_CAUSE_H

#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <expected>

#include "byte_cursor.h"
#include "codec_error.h"
#include "codec_options.h"

namespace sctp
{

namespace cause_code
{
constexpr std::uint16_t kInvalidStreamIdentifier = 1;
constexpr std::uint16_t kMissingMandatoryParameter = 2;
constexpr std::uint16_t kStaleCookieError = 3;
constexpr std::uint16_t kOutOfResource = 4;
constexpr std::uint16_t kUnresolvableAddress = 5;
constexpr std::uint16_t kUnrecognizedChunkType = 6;
constexpr std::uint16_t kInvalidMandatoryParameter = 7;
constexpr std::uint16_t kUnrecognizedParameters = 8;
constexpr std::uint16_t kNoUserData = 9;
constexpr std::uint16_t kCookieReceivedWhileShuttingDown = 10;
constexpr std::uint16_t kRestartWithNewAddresses = 11;
constexpr std::uint16_t kUserInitiatedAbort = 12;
constexpr std::uint16_t kProtocolViolation = 13;
}    // namespace cause_code

// Error causes keep their info bytes as received; the structured accessors
// below read the fields of the cause codes that have a fixed layout.
struct error_cause
{
    std::uint16_t code = 0;
    std::vector<std::uint8_t> info;

    bool operator==(const error_cause&) const = default;
};

[[nodiscard]] const char* cause_name(std::uint16_t code);

[[nodiscard]] error_cause make_invalid_stream_cause(std::uint16_t stream_id);
[[nodiscard]] error_cause make_stale_cookie_cause(std::uint32_t staleness_us);
[[nodiscard]] error_cause make_no_user_data_cause(std::uint32_t tsn);
[[nodiscard]] error_cause make_missing_parameters_cause(const std::vector<std::uint16_t>& types);
[[nodiscard]] error_cause make_text_cause(std::uint16_t code, const std::string& text);

// Stream identifier of an Invalid Stream Identifier cause, TSN of a No User
// Data cause, staleness of a Stale Cookie cause.
[[nodiscard]] std::expected<std::uint32_t, codec_error> cause_scalar(const error_cause& cause);
[[nodiscard]] std::expected<std::vector<std::uint16_t>, codec_error> missing_parameter_types(const error_cause& cause);

[[nodiscard]] std::expected<std::vector<error_cause>, codec_error> decode_cause_list(std::span<const std::uint8_t> data,
                                                                                    const codec_options& opts,
                                                                                    const std::string& path);
[[nodiscard]] std::expected<void, codec_error> encode_cause_list(const std::vector<error_cause>& causes, byte_writer& w, const std::string& path);

}    // namespace sctp

#endif
