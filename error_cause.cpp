#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <expected>

#include "log.h"
#include "tlv_framer.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "error_cause.h"

namespace sctp
{

namespace
{

[[nodiscard]] error_cause make_scalar_cause(const std::uint16_t code, const std::uint32_t value)
{
    error_cause cause;
    cause.code = code;
    byte_writer w(cause.info);
    w.push_u32(value);
    return cause;
}

[[nodiscard]] std::expected<void, codec_error> validate_cause(const std::uint16_t code, const std::span<const std::uint8_t> info, const std::string& path)
{
    switch (code)
    {
        case cause_code::kInvalidStreamIdentifier:
        case cause_code::kStaleCookieError:
        case cause_code::kNoUserData:
            if (info.size() != 4)
            {
                return std::unexpected(
                    make_codec_error(errc::kMalformedValue, path, std::string(cause_name(code)) + " cause must carry 4 bytes got " + std::to_string(info.size())));
            }
            return {};
        case cause_code::kMissingMandatoryParameter:
        {
            byte_reader r(info);
            std::uint32_t count = 0;
            if (!r.read_u32(count))
            {
                return std::unexpected(make_codec_error(errc::kMalformedValue, path, "missing mandatory parameter cause without count"));
            }
            if (r.remaining() % 2 != 0 || r.remaining() / 2 != count)
            {
                return std::unexpected(make_codec_error(errc::kMalformedValue, path, "missing mandatory parameter count " + std::to_string(count) + " does not match list"));
            }
            return {};
        }
        default:
            return {};
    }
}

}    // namespace

const char* cause_name(const std::uint16_t code)
{
    switch (code)
    {
        case cause_code::kInvalidStreamIdentifier:
            return "invalid_stream_identifier";
        case cause_code::kMissingMandatoryParameter:
            return "missing_mandatory_parameter";
        case cause_code::kStaleCookieError:
            return "stale_cookie_error";
        case cause_code::kOutOfResource:
            return "out_of_resource";
        case cause_code::kUnresolvableAddress:
            return "unresolvable_address";
        case cause_code::kUnrecognizedChunkType:
            return "unrecognized_chunk_type";
        case cause_code::kInvalidMandatoryParameter:
            return "invalid_mandatory_parameter";
        case cause_code::kUnrecognizedParameters:
            return "unrecognized_parameters";
        case cause_code::kNoUserData:
            return "no_user_data";
        case cause_code::kCookieReceivedWhileShuttingDown:
            return "cookie_received_while_shutting_down";
        case cause_code::kRestartWithNewAddresses:
            return "restart_with_new_addresses";
        case cause_code::kUserInitiatedAbort:
            return "user_initiated_abort";
        case cause_code::kProtocolViolation:
            return "protocol_violation";
        default:
            return "unknown";
    }
}

error_cause make_invalid_stream_cause(const std::uint16_t stream_id)
{
    return make_scalar_cause(cause_code::kInvalidStreamIdentifier, static_cast<std::uint32_t>(stream_id) << 16);
}

error_cause make_stale_cookie_cause(const std::uint32_t staleness_us) { return make_scalar_cause(cause_code::kStaleCookieError, staleness_us); }

error_cause make_no_user_data_cause(const std::uint32_t tsn) { return make_scalar_cause(cause_code::kNoUserData, tsn); }

error_cause make_missing_parameters_cause(const std::vector<std::uint16_t>& types)
{
    error_cause cause;
    cause.code = cause_code::kMissingMandatoryParameter;
    byte_writer w(cause.info);
    w.push_u32(static_cast<std::uint32_t>(types.size()));
    for (const auto type : types)
    {
        w.push_u16(type);
    }
    return cause;
}

error_cause make_text_cause(const std::uint16_t code, const std::string& text)
{
    error_cause cause;
    cause.code = code;
    cause.info.assign(text.begin(), text.end());
    return cause;
}

std::expected<std::uint32_t, codec_error> cause_scalar(const error_cause& cause)
{
    if (auto ok = validate_cause(cause.code, cause.info, "/cause"); !ok)
    {
        return std::unexpected(ok.error());
    }
    switch (cause.code)
    {
        case cause_code::kInvalidStreamIdentifier:
            return load_u16(cause.info.data());
        case cause_code::kStaleCookieError:
        case cause_code::kNoUserData:
            return load_u32(cause.info.data());
        default:
            return std::unexpected(make_codec_error(errc::kMalformedValue, "/cause", std::string(cause_name(cause.code)) + " has no scalar field"));
    }
}

std::expected<std::vector<std::uint16_t>, codec_error> missing_parameter_types(const error_cause& cause)
{
    if (cause.code != cause_code::kMissingMandatoryParameter)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, "/cause", "not a missing mandatory parameter cause"));
    }
    if (auto ok = validate_cause(cause.code, cause.info, "/cause"); !ok)
    {
        return std::unexpected(ok.error());
    }
    std::vector<std::uint16_t> types;
    byte_reader r(cause.info);
    if (!r.skip(4))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, "/cause", "missing count"));
    }
    std::uint16_t type = 0;
    while (r.read_u16(type))
    {
        types.push_back(type);
    }
    return types;
}

std::expected<std::vector<error_cause>, codec_error> decode_cause_list(const std::span<const std::uint8_t> data,
                                                                      const codec_options& opts,
                                                                      const std::string& path)
{
    std::vector<error_cause> causes;
    byte_reader r(data);
    std::size_t index = 0;
    while (!r.empty())
    {
        const std::string cause_path = child_path(path, "causes", index);
        ++index;
        auto record = read_tlv(r, tlv_layout::kCause, tail_padding::kOptionalAtEnd, opts, cause_path);
        if (!record)
        {
            return std::unexpected(record.error());
        }
        if (auto ok = validate_cause(record->type, record->value, cause_path); !ok)
        {
            LOG_DEBUG("cause {} rejected {}", cause_path, describe(ok.error()));
            return std::unexpected(ok.error());
        }
        error_cause cause;
        cause.code = record->type;
        cause.info.assign(record->value.begin(), record->value.end());
        causes.push_back(std::move(cause));
    }
    return causes;
}

std::expected<void, codec_error> encode_cause_list(const std::vector<error_cause>& causes, byte_writer& w, const std::string& path)
{
    for (std::size_t i = 0; i < causes.size(); ++i)
    {
        const std::string cause_path = child_path(path, "causes", i);
        if (auto ok = validate_cause(causes[i].code, causes[i].info, cause_path); !ok)
        {
            return std::unexpected(ok.error());
        }
        const bool pad = i + 1 < causes.size();
        if (auto written = write_tlv(w, tlv_layout::kCause, causes[i].code, 0, causes[i].info, pad, cause_path); !written)
        {
            return std::unexpected(written.error());
        }
    }
    return {};
}

}    // namespace sctp
