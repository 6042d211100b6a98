#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <expected>

#include "log.h"
#include "tlv_framer.h"
#include "sctp_chunk.h"
#include "byte_cursor.h"
#include "chunk_codec.h"
#include "codec_error.h"
#include "chunk_framer.h"
#include "codec_options.h"

namespace sctp
{

std::expected<std::vector<chunk>, codec_error> decode_chunks(const std::span<const std::uint8_t> body, const codec_options& opts, decode_report* report)
{
    std::vector<chunk> chunks;
    byte_reader r(body);
    std::size_t index = 0;
    while (!r.empty())
    {
        const std::string chunk_path = child_path("/", "chunks", index);
        ++index;
        auto record = read_tlv(r, tlv_layout::kChunk, tail_padding::kRequired, opts, chunk_path);
        if (!record)
        {
            return std::unexpected(record.error());
        }
        const auto type = static_cast<std::uint8_t>(record->type);

        if (!is_known_chunk_type(type))
        {
            const auto action = chunk_action_of(type);
            LOG_DEBUG("unrecognized chunk {} type {} action {}", chunk_path, type, to_string(action));
            if (action == unrecognized_action::kStop)
            {
                return std::unexpected(make_unrecognized_error(chunk_path, type, action));
            }
            if (action == unrecognized_action::kStopSilently)
            {
                break;
            }
            if (action == unrecognized_action::kSkipAndReport && report != nullptr)
            {
                report->add(make_unrecognized_error(chunk_path, type, action));
            }
            if (opts.retain_unrecognized)
            {
                unknown_chunk unknown;
                unknown.type = type;
                unknown.value.assign(record->value.begin(), record->value.end());
                chunks.push_back(chunk{.flags = record->flags, .value = std::move(unknown)});
            }
            continue;
        }

        auto value = decode_chunk_value(type, record->value, opts, report, chunk_path);
        if (!value)
        {
            LOG_DEBUG("chunk {} {} rejected {}", chunk_path, chunk_name(type), describe(value.error()));
            return std::unexpected(value.error());
        }
        chunks.push_back(chunk{.flags = record->flags, .value = std::move(*value)});
    }
    return chunks;
}

std::expected<void, codec_error> encode_chunk(const chunk& c, byte_writer& w, const std::string& path)
{
    const std::size_t start = begin_tlv(w, tlv_layout::kChunk, c.type(), c.flags);
    if (auto encoded = encode_chunk_value(c.value, w, path); !encoded)
    {
        return std::unexpected(encoded.error());
    }
    return finish_tlv(w, start, true, path);
}

std::expected<void, codec_error> encode_chunks(const std::vector<chunk>& chunks, byte_writer& w)
{
    for (std::size_t i = 0; i < chunks.size(); ++i)
    {
        if (auto encoded = encode_chunk(chunks[i], w, child_path("/", "chunks", i)); !encoded)
        {
            return std::unexpected(encoded.error());
        }
    }
    return {};
}

}    // namespace sctp
