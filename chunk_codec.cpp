#include <span>
#include <array>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <variant>
#include <expected>
#include <algorithm>
#include <type_traits>

#include "log.h"
#include "tlv_framer.h"
#include "sctp_chunk.h"
#include "sctp_param.h"
#include "byte_cursor.h"
#include "chunk_codec.h"
#include "codec_error.h"
#include "error_cause.h"
#include "param_framer.h"

namespace sctp
{

namespace
{

constexpr std::size_t kDataHeaderSize = 12;
constexpr std::size_t kInitFixedSize = 16;
constexpr std::size_t kSackFixedSize = 12;
constexpr std::size_t kForwardTsnFixedSize = 4;
constexpr std::size_t kMaxReconfigParams = 2;

[[nodiscard]] std::expected<chunk_value, codec_error> decode_data(const std::span<const std::uint8_t> value, const std::string& path)
{
    data_chunk c;
    byte_reader r(value);
    if (!r.read_u32(c.tsn) || !r.read_u16(c.stream_id) || !r.read_u16(c.stream_sequence) || !r.read_u32(c.payload_protocol_id))
    {
        return std::unexpected(make_codec_error(
            errc::kTruncated, path, "data chunk needs " + std::to_string(kDataHeaderSize) + " bytes got " + std::to_string(value.size())));
    }
    const auto user_data = r.rest();
    c.user_data.assign(user_data.begin(), user_data.end());
    return c;
}

template <typename Chunk>
[[nodiscard]] std::expected<chunk_value, codec_error> decode_init(const std::span<const std::uint8_t> value,
                                                                  const codec_options& opts,
                                                                  decode_report* report,
                                                                  const std::string& path)
{
    Chunk c;
    byte_reader r(value);
    if (!r.read_u32(c.initiate_tag) || !r.read_u32(c.advertised_window) || !r.read_u16(c.outbound_streams) || !r.read_u16(c.inbound_streams) ||
        !r.read_u32(c.initial_tsn))
    {
        return std::unexpected(make_codec_error(
            errc::kTruncated, path, "init chunk needs " + std::to_string(kInitFixedSize) + " bytes got " + std::to_string(value.size())));
    }
    auto params = decode_param_list(r.rest(), opts, report, path);
    if (!params)
    {
        return std::unexpected(params.error());
    }
    c.params = std::move(*params);
    return c;
}

[[nodiscard]] std::expected<chunk_value, codec_error> decode_sack(const std::span<const std::uint8_t> value, const std::string& path)
{
    sack_chunk c;
    byte_reader r(value);
    std::uint16_t gap_count = 0;
    std::uint16_t dup_count = 0;
    if (!r.read_u32(c.cumulative_tsn_ack) || !r.read_u32(c.advertised_window) || !r.read_u16(gap_count) || !r.read_u16(dup_count))
    {
        return std::unexpected(make_codec_error(
            errc::kTruncated, path, "sack chunk needs " + std::to_string(kSackFixedSize) + " bytes got " + std::to_string(value.size())));
    }
    const std::size_t needed = (static_cast<std::size_t>(gap_count) * 4) + (static_cast<std::size_t>(dup_count) * 4);
    if (r.remaining() < needed)
    {
        return std::unexpected(make_codec_error(errc::kTruncated,
                                                path,
                                                std::to_string(gap_count) + " gap blocks and " + std::to_string(dup_count) + " duplicate tsns need " +
                                                    std::to_string(needed) + " bytes got " + std::to_string(r.remaining())));
    }
    if (r.remaining() > needed)
    {
        return std::unexpected(make_codec_error(errc::kInvalidLength, path, std::to_string(r.remaining() - needed) + " trailing bytes after sack records"));
    }
    c.gap_blocks.resize(gap_count);
    for (auto& block : c.gap_blocks)
    {
        if (!r.read_u16(block.start) || !r.read_u16(block.end))
        {
            return std::unexpected(make_codec_error(errc::kTruncated, path, "gap ack block cut short"));
        }
    }
    c.duplicate_tsns.resize(dup_count);
    for (auto& tsn : c.duplicate_tsns)
    {
        if (!r.read_u32(tsn))
        {
            return std::unexpected(make_codec_error(errc::kTruncated, path, "duplicate tsn cut short"));
        }
    }
    return c;
}

template <typename Chunk>
[[nodiscard]] std::expected<chunk_value, codec_error> decode_heartbeat(const std::span<const std::uint8_t> value,
                                                                       const codec_options& opts,
                                                                       decode_report* report,
                                                                       const std::string& path)
{
    if (value.empty())
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "heartbeat without info parameter"));
    }
    auto params = decode_param_list(value, opts, report, path);
    if (!params)
    {
        return std::unexpected(params.error());
    }
    if (params->size() != 1)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "heartbeat must carry exactly one parameter got " + std::to_string(params->size())));
    }
    auto* info = std::get_if<heartbeat_info_param>(&params->front());
    if (info == nullptr)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "heartbeat parameter is not heartbeat info"));
    }
    Chunk c;
    c.info = std::move(info->data);
    return c;
}

template <typename Chunk>
[[nodiscard]] std::expected<chunk_value, codec_error> decode_causes(const std::span<const std::uint8_t> value,
                                                                    const codec_options& opts,
                                                                    const std::string& path)
{
    auto causes = decode_cause_list(value, opts, path);
    if (!causes)
    {
        return std::unexpected(causes.error());
    }
    Chunk c;
    c.causes = std::move(*causes);
    return c;
}

template <typename Chunk>
[[nodiscard]] std::expected<chunk_value, codec_error> decode_tsn(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (auto ok = check_exact_length(value.size(), 4, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    Chunk c;
    c.tsn = load_u32(value.data());
    return c;
}

template <typename Chunk>
[[nodiscard]] std::expected<chunk_value, codec_error> decode_empty(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (auto ok = check_exact_length(value.size(), 0, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    return Chunk{};
}

[[nodiscard]] std::expected<chunk_value, codec_error> decode_cookie_echo(const std::span<const std::uint8_t> value)
{
    cookie_echo_chunk c;
    c.cookie.assign(value.begin(), value.end());
    return c;
}

[[nodiscard]] std::expected<chunk_value, codec_error> decode_reconfig(const std::span<const std::uint8_t> value,
                                                                      const codec_options& opts,
                                                                      decode_report* report,
                                                                      const std::string& path)
{
    auto params = decode_param_list(value, opts, report, path);
    if (!params)
    {
        return std::unexpected(params.error());
    }
    if (params->empty() || params->size() > kMaxReconfigParams)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "re-config must carry 1 or 2 parameters got " + std::to_string(params->size())));
    }
    reconfig_chunk c;
    c.params = std::move(*params);
    return c;
}

[[nodiscard]] std::expected<chunk_value, codec_error> decode_forward_tsn(const std::span<const std::uint8_t> value, const std::string& path)
{
    forward_tsn_chunk c;
    byte_reader r(value);
    if (!r.read_u32(c.new_cumulative_tsn))
    {
        return std::unexpected(make_codec_error(
            errc::kTruncated, path, "forward tsn needs " + std::to_string(kForwardTsnFixedSize) + " bytes got " + std::to_string(value.size())));
    }
    if (auto ok = check_record_multiple(r.remaining(), 4, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    c.streams.reserve(r.remaining() / 4);
    forward_tsn_stream stream;
    while (r.read_u16(stream.stream_id) && r.read_u16(stream.stream_sequence))
    {
        c.streams.push_back(stream);
    }
    return c;
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const data_chunk& c, byte_writer& w, const std::string& /*path*/)
{
    w.push_u32(c.tsn);
    w.push_u16(c.stream_id);
    w.push_u16(c.stream_sequence);
    w.push_u32(c.payload_protocol_id);
    w.push_bytes(c.user_data);
    return {};
}

template <std::uint8_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const basic_init_chunk<Type>& c, byte_writer& w, const std::string& path)
{
    w.push_u32(c.initiate_tag);
    w.push_u32(c.advertised_window);
    w.push_u16(c.outbound_streams);
    w.push_u16(c.inbound_streams);
    w.push_u32(c.initial_tsn);
    return encode_param_list(c.params, w, path);
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const sack_chunk& c, byte_writer& w, const std::string& path)
{
    if (c.gap_blocks.size() > 0xFFFF || c.duplicate_tsns.size() > 0xFFFF)
    {
        return std::unexpected(make_codec_error(errc::kInvalidLength, path, "sack record count does not fit 16 bits"));
    }
    w.push_u32(c.cumulative_tsn_ack);
    w.push_u32(c.advertised_window);
    w.push_u16(static_cast<std::uint16_t>(c.gap_blocks.size()));
    w.push_u16(static_cast<std::uint16_t>(c.duplicate_tsns.size()));
    for (const auto& block : c.gap_blocks)
    {
        w.push_u16(block.start);
        w.push_u16(block.end);
    }
    for (const auto tsn : c.duplicate_tsns)
    {
        w.push_u32(tsn);
    }
    return {};
}

template <std::uint8_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const basic_heartbeat_chunk<Type>& c, byte_writer& w, const std::string& path)
{
    return write_tlv(w, tlv_layout::kParameter, param_type::kHeartbeatInfo, 0, c.info, false, child_path(path, "params", 0));
}

template <std::uint8_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const basic_cause_chunk<Type>& c, byte_writer& w, const std::string& path)
{
    return encode_cause_list(c.causes, w, path);
}

template <std::uint8_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const basic_empty_chunk<Type>& /*c*/, byte_writer& /*w*/, const std::string& /*path*/)
{
    return {};
}

template <std::uint8_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const basic_tsn_chunk<Type>& c, byte_writer& w, const std::string& /*path*/)
{
    w.push_u32(c.tsn);
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const cookie_echo_chunk& c, byte_writer& w, const std::string& /*path*/)
{
    w.push_bytes(c.cookie);
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const reconfig_chunk& c, byte_writer& w, const std::string& path)
{
    if (c.params.empty() || c.params.size() > kMaxReconfigParams)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "re-config must carry 1 or 2 parameters"));
    }
    return encode_param_list(c.params, w, path);
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const forward_tsn_chunk& c, byte_writer& w, const std::string& /*path*/)
{
    w.push_u32(c.new_cumulative_tsn);
    for (const auto& stream : c.streams)
    {
        w.push_u16(stream.stream_id);
        w.push_u16(stream.stream_sequence);
    }
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const unknown_chunk& c, byte_writer& w, const std::string& /*path*/)
{
    w.push_bytes(c.value);
    return {};
}

struct chunk_info
{
    std::uint8_t type;
    const char* name;
};

constexpr std::array<chunk_info, 17> kKnownChunks = {{
    {.type = chunk_type::kData, .name = "DATA"},
    {.type = chunk_type::kInit, .name = "INIT"},
    {.type = chunk_type::kInitAck, .name = "INIT_ACK"},
    {.type = chunk_type::kSack, .name = "SACK"},
    {.type = chunk_type::kHeartbeat, .name = "HEARTBEAT"},
    {.type = chunk_type::kHeartbeatAck, .name = "HEARTBEAT_ACK"},
    {.type = chunk_type::kAbort, .name = "ABORT"},
    {.type = chunk_type::kShutdown, .name = "SHUTDOWN"},
    {.type = chunk_type::kShutdownAck, .name = "SHUTDOWN_ACK"},
    {.type = chunk_type::kError, .name = "ERROR"},
    {.type = chunk_type::kCookieEcho, .name = "COOKIE_ECHO"},
    {.type = chunk_type::kCookieAck, .name = "COOKIE_ACK"},
    {.type = chunk_type::kEcne, .name = "ECNE"},
    {.type = chunk_type::kCwr, .name = "CWR"},
    {.type = chunk_type::kShutdownComplete, .name = "SHUTDOWN_COMPLETE"},
    {.type = chunk_type::kReconfig, .name = "RECONFIG"},
    {.type = chunk_type::kForwardTsn, .name = "FORWARD_TSN"},
}};

}    // namespace

std::uint8_t chunk::type() const
{
    return std::visit(
        [](const auto& v) -> std::uint8_t
        {
            using value_type = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_type, unknown_chunk>)
            {
                return v.type;
            }
            else
            {
                return value_type::kType;
            }
        },
        value);
}

bool is_known_chunk_type(const std::uint8_t type)
{
    return std::any_of(kKnownChunks.begin(), kKnownChunks.end(), [type](const chunk_info& info) { return info.type == type; });
}

const char* chunk_name(const std::uint8_t type)
{
    for (const auto& info : kKnownChunks)
    {
        if (info.type == type)
        {
            return info.name;
        }
    }
    return "UNKNOWN";
}

std::expected<chunk_value, codec_error> decode_chunk_value(const std::uint8_t type,
                                                           const std::span<const std::uint8_t> value,
                                                           const codec_options& opts,
                                                           decode_report* report,
                                                           const std::string& path)
{
    LOG_TRACE("decode chunk {} type {} value {} bytes", path, chunk_name(type), value.size());
    switch (type)
    {
        case chunk_type::kData:
            return decode_data(value, path);
        case chunk_type::kInit:
            return decode_init<init_chunk>(value, opts, report, path);
        case chunk_type::kInitAck:
            return decode_init<init_ack_chunk>(value, opts, report, path);
        case chunk_type::kSack:
            return decode_sack(value, path);
        case chunk_type::kHeartbeat:
            return decode_heartbeat<heartbeat_chunk>(value, opts, report, path);
        case chunk_type::kHeartbeatAck:
            return decode_heartbeat<heartbeat_ack_chunk>(value, opts, report, path);
        case chunk_type::kAbort:
            return decode_causes<abort_chunk>(value, opts, path);
        case chunk_type::kShutdown:
            return decode_tsn<shutdown_chunk>(value, path);
        case chunk_type::kShutdownAck:
            return decode_empty<shutdown_ack_chunk>(value, path);
        case chunk_type::kError:
            return decode_causes<error_chunk>(value, opts, path);
        case chunk_type::kCookieEcho:
            return decode_cookie_echo(value);
        case chunk_type::kCookieAck:
            return decode_empty<cookie_ack_chunk>(value, path);
        case chunk_type::kEcne:
            return decode_tsn<ecne_chunk>(value, path);
        case chunk_type::kCwr:
            return decode_tsn<cwr_chunk>(value, path);
        case chunk_type::kShutdownComplete:
            return decode_empty<shutdown_complete_chunk>(value, path);
        case chunk_type::kReconfig:
            return decode_reconfig(value, opts, report, path);
        case chunk_type::kForwardTsn:
            return decode_forward_tsn(value, path);
        default:
            break;
    }
    unknown_chunk c;
    c.type = type;
    c.value.assign(value.begin(), value.end());
    return c;
}

std::expected<void, codec_error> encode_chunk_value(const chunk_value& value, byte_writer& w, const std::string& path)
{
    return std::visit([&w, &path](const auto& v) { return encode_value(v, w, path); }, value);
}

}    // namespace sctp
