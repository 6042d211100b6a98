#include <string>
#include <cstdint>
#include <utility>
#include <string_view>

#include "codec_error.h"

namespace sctp
{

std::string_view to_string(const errc code)
{
    switch (code)
    {
        case errc::kTruncated:
            return "truncated";
        case errc::kInvalidLength:
            return "invalid_length";
        case errc::kChecksumMismatch:
            return "checksum_mismatch";
        case errc::kUnrecognizedType:
            return "unrecognized_type";
        case errc::kMalformedValue:
            return "malformed_value";
    }
    return "unknown";
}

std::string_view to_string(const unrecognized_action action)
{
    switch (action)
    {
        case unrecognized_action::kStop:
            return "stop";
        case unrecognized_action::kStopSilently:
            return "stop_silently";
        case unrecognized_action::kSkip:
            return "skip";
        case unrecognized_action::kSkipAndReport:
            return "skip_and_report";
    }
    return "unknown";
}

std::string describe(const codec_error& error)
{
    std::string text(to_string(error.code));
    text += " at ";
    text += error.path;
    if (!error.reason.empty())
    {
        text += ": ";
        text += error.reason;
    }
    if (error.action.has_value())
    {
        text += " (type ";
        text += std::to_string(error.type);
        text += " action ";
        text += to_string(*error.action);
        text += ")";
    }
    return text;
}

codec_error make_codec_error(const errc code, std::string path, std::string reason)
{
    codec_error error;
    error.code = code;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

codec_error make_unrecognized_error(std::string path, const std::uint16_t type, const unrecognized_action action)
{
    codec_error error;
    error.code = errc::kUnrecognizedType;
    error.path = std::move(path);
    error.reason = "unrecognized type";
    error.type = type;
    error.action = action;
    return error;
}

}    // namespace sctp
