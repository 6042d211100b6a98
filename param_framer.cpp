#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <expected>

#include "log.h"
#include "tlv_framer.h"
#include "sctp_param.h"
#include "param_codec.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "param_framer.h"
#include "codec_options.h"

namespace sctp
{

std::expected<std::vector<parameter>, codec_error> decode_param_list(const std::span<const std::uint8_t> data,
                                                                     const codec_options& opts,
                                                                     decode_report* report,
                                                                     const std::string& path)
{
    std::vector<parameter> params;
    byte_reader r(data);
    std::size_t index = 0;
    while (!r.empty())
    {
        const std::string param_path = child_path(path, "params", index);
        ++index;
        auto record = read_tlv(r, tlv_layout::kParameter, tail_padding::kOptionalAtEnd, opts, param_path);
        if (!record)
        {
            return std::unexpected(record.error());
        }

        if (!is_known_param_type(record->type))
        {
            const auto action = param_action_of(record->type);
            LOG_DEBUG("unrecognized parameter {} type {:#06x} action {}", param_path, record->type, to_string(action));
            if (action == unrecognized_action::kStop)
            {
                return std::unexpected(make_unrecognized_error(param_path, record->type, action));
            }
            if (action == unrecognized_action::kStopSilently)
            {
                return params;
            }
            if (action == unrecognized_action::kSkipAndReport && report != nullptr)
            {
                report->add(make_unrecognized_error(param_path, record->type, action));
            }
            if (opts.retain_unrecognized)
            {
                unknown_param unknown;
                unknown.type = record->type;
                unknown.value.assign(record->value.begin(), record->value.end());
                params.emplace_back(std::move(unknown));
            }
            continue;
        }

        auto param = decode_param_value(record->type, record->value, param_path);
        if (!param)
        {
            LOG_DEBUG("parameter {} rejected {}", param_path, describe(param.error()));
            return std::unexpected(param.error());
        }
        params.push_back(std::move(*param));
    }
    return params;
}

std::expected<void, codec_error> encode_param_list(const std::vector<parameter>& params, byte_writer& w, const std::string& path)
{
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        const std::string param_path = child_path(path, "params", i);
        const std::size_t start = begin_tlv(w, tlv_layout::kParameter, param_type_of(params[i]), 0);
        if (auto encoded = encode_param_value(params[i], w, param_path); !encoded)
        {
            return std::unexpected(encoded.error());
        }
        const bool pad = i + 1 < params.size();
        if (auto finished = finish_tlv(w, start, pad, param_path); !finished)
        {
            return std::unexpected(finished.error());
        }
    }
    return {};
}

std::expected<std::vector<std::uint8_t>, codec_error> encode_param_list(const std::vector<parameter>& params)
{
    std::vector<std::uint8_t> buf;
    byte_writer w(buf);
    if (auto encoded = encode_param_list(params, w); !encoded)
    {
        return std::unexpected(encoded.error());
    }
    return buf;
}

}    // namespace sctp
