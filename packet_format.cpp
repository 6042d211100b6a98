#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <type_traits>

#include <spdlog/fmt/fmt.h>

#include "sctp_param.h"
#include "sctp_chunk.h"
#include "error_cause.h"
#include "sctp_packet.h"
#include "packet_format.h"

namespace sctp
{

namespace
{

template <typename T>
[[nodiscard]] std::string join(const std::vector<T>& values)
{
    std::string text;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i != 0)
        {
            text += ',';
        }
        text += std::to_string(values[i]);
    }
    return text;
}

[[nodiscard]] std::string format_value(const heartbeat_info_param& p) { return fmt::format("{} bytes", p.data.size()); }
[[nodiscard]] std::string format_value(const state_cookie_param& p) { return fmt::format("{} bytes", p.data.size()); }
[[nodiscard]] std::string format_value(const unrecognized_parameter_param& p) { return fmt::format("{} bytes", p.data.size()); }
[[nodiscard]] std::string format_value(const random_param& p) { return fmt::format("{} bytes", p.data.size()); }
[[nodiscard]] std::string format_value(const chunk_list_param& p) { return join(std::vector<int>(p.data.begin(), p.data.end())); }
[[nodiscard]] std::string format_value(const supported_extensions_param& p) { return join(std::vector<int>(p.data.begin(), p.data.end())); }
[[nodiscard]] std::string format_value(const ecn_capable_param& /*p*/) { return {}; }
[[nodiscard]] std::string format_value(const forward_tsn_supported_param& /*p*/) { return {}; }
[[nodiscard]] std::string format_value(const cookie_preservative_param& p) { return fmt::format("increment {}ms", p.value); }
[[nodiscard]] std::string format_value(const ssn_tsn_reset_request_param& p) { return fmt::format("request {}", p.value); }
[[nodiscard]] std::string format_value(const adaptation_layer_indication_param& p) { return fmt::format("indication {:#010x}", p.value); }
[[nodiscard]] std::string format_value(const supported_address_types_param& p) { return join(p.values); }
[[nodiscard]] std::string format_value(const requested_hmac_algorithm_param& p) { return join(p.values); }
[[nodiscard]] std::string format_value(const ipv4_address_param& p) { return p.address.to_string(); }
[[nodiscard]] std::string format_value(const ipv6_address_param& p) { return p.address.to_string(); }
[[nodiscard]] std::string format_value(const host_name_address_param& p) { return p.host_name; }

[[nodiscard]] std::string format_value(const outgoing_reset_request_param& p)
{
    return fmt::format(
        "request {} response {} last_tsn {} streams [{}]", p.request_sequence, p.response_sequence, p.sender_last_tsn, join(p.stream_ids));
}

[[nodiscard]] std::string format_value(const incoming_reset_request_param& p)
{
    return fmt::format("request {} streams [{}]", p.request_sequence, join(p.stream_ids));
}

[[nodiscard]] std::string format_value(const reconfig_response_param& p)
{
    if (p.sender_next_tsn.has_value() && p.receiver_next_tsn.has_value())
    {
        return fmt::format(
            "response {} result {} sender_next_tsn {} receiver_next_tsn {}", p.response_sequence, p.result, *p.sender_next_tsn, *p.receiver_next_tsn);
    }
    return fmt::format("response {} result {}", p.response_sequence, p.result);
}

template <std::uint16_t Type>
[[nodiscard]] std::string format_value(const add_streams_request_param<Type>& p)
{
    return fmt::format("request {} new_streams {}", p.request_sequence, p.new_streams);
}

[[nodiscard]] std::string format_value(const unknown_param& p) { return fmt::format("{} bytes", p.value.size()); }

[[nodiscard]] std::string format_cause(const error_cause& cause)
{
    return fmt::format("{}({}) {} bytes", cause_name(cause.code), cause.code, cause.info.size());
}

void append_params(std::string& out, const std::vector<parameter>& params)
{
    for (const auto& p : params)
    {
        out += "\n    ";
        out += format_param(p);
    }
}

void append_causes(std::string& out, const std::vector<error_cause>& causes)
{
    for (const auto& cause : causes)
    {
        out += "\n    ";
        out += format_cause(cause);
    }
}

}    // namespace

std::string format_param(const parameter& p)
{
    const auto type = param_type_of(p);
    const auto detail = std::visit([](const auto& v) { return format_value(v); }, p);
    if (detail.empty())
    {
        return fmt::format("{}({:#06x})", param_name(type), type);
    }
    return fmt::format("{}({:#06x}) {}", param_name(type), type, detail);
}

std::string format_chunk(const chunk& c)
{
    std::string out = fmt::format("{}({}) flags {:#04x}", chunk_name(c.type()), c.type(), c.flags);
    std::visit(
        [&out](const auto& v)
        {
            using value_type = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_type, data_chunk>)
            {
                out += fmt::format(" tsn {} stream {} ssn {} ppid {} {} bytes", v.tsn, v.stream_id, v.stream_sequence, v.payload_protocol_id, v.user_data.size());
            }
            else if constexpr (std::is_same_v<value_type, init_chunk> || std::is_same_v<value_type, init_ack_chunk>)
            {
                out += fmt::format(" tag {:#010x} a_rwnd {} out {} in {} initial_tsn {}",
                                   v.initiate_tag,
                                   v.advertised_window,
                                   v.outbound_streams,
                                   v.inbound_streams,
                                   v.initial_tsn);
                append_params(out, v.params);
            }
            else if constexpr (std::is_same_v<value_type, sack_chunk>)
            {
                out += fmt::format(" cum_tsn {} a_rwnd {} gaps {} dups {}", v.cumulative_tsn_ack, v.advertised_window, v.gap_blocks.size(), v.duplicate_tsns.size());
                for (const auto& block : v.gap_blocks)
                {
                    out += fmt::format("\n    gap {}-{}", block.start, block.end);
                }
            }
            else if constexpr (std::is_same_v<value_type, heartbeat_chunk> || std::is_same_v<value_type, heartbeat_ack_chunk>)
            {
                out += fmt::format(" info {} bytes", v.info.size());
            }
            else if constexpr (std::is_same_v<value_type, abort_chunk> || std::is_same_v<value_type, error_chunk>)
            {
                append_causes(out, v.causes);
            }
            else if constexpr (std::is_same_v<value_type, shutdown_chunk> || std::is_same_v<value_type, ecne_chunk> ||
                               std::is_same_v<value_type, cwr_chunk>)
            {
                out += fmt::format(" tsn {}", v.tsn);
            }
            else if constexpr (std::is_same_v<value_type, cookie_echo_chunk>)
            {
                out += fmt::format(" cookie {} bytes", v.cookie.size());
            }
            else if constexpr (std::is_same_v<value_type, reconfig_chunk>)
            {
                append_params(out, v.params);
            }
            else if constexpr (std::is_same_v<value_type, forward_tsn_chunk>)
            {
                out += fmt::format(" new_cum_tsn {} streams {}", v.new_cumulative_tsn, v.streams.size());
            }
            else if constexpr (std::is_same_v<value_type, unknown_chunk>)
            {
                out += fmt::format(" {} bytes", v.value.size());
            }
        },
        c.value);
    return out;
}

std::string format_packet(const packet& p)
{
    std::string out = fmt::format(
        "packet {} -> {} tag {:#010x} checksum {:#010x} chunks {}", p.source_port, p.destination_port, p.verification_tag, p.checksum, p.chunks.size());
    for (const auto& c : p.chunks)
    {
        out += "\n  ";
        out += format_chunk(c);
    }
    return out;
}

}    // namespace sctp
