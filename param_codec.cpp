#include <span>
#include <array>
#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <expected>
#include <algorithm>
#include <type_traits>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

#include "log.h"
#include "tlv_framer.h"
#include "sctp_param.h"
#include "param_codec.h"
#include "byte_cursor.h"
#include "codec_error.h"

namespace sctp
{

namespace
{

template <typename Param>
[[nodiscard]] std::expected<parameter, codec_error> decode_opaque(const std::span<const std::uint8_t> value)
{
    Param p;
    p.data.assign(value.begin(), value.end());
    return p;
}

template <typename Param>
[[nodiscard]] std::expected<parameter, codec_error> decode_flag(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (auto ok = check_exact_length(value.size(), 0, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    return Param{};
}

template <typename Param>
[[nodiscard]] std::expected<parameter, codec_error> decode_u32(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (auto ok = check_exact_length(value.size(), 4, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    Param p;
    p.value = load_u32(value.data());
    return p;
}

[[nodiscard]] std::expected<void, codec_error> read_u16_list(byte_reader& r, std::vector<std::uint16_t>& out, const std::string& path)
{
    if (auto ok = check_record_multiple(r.remaining(), 2, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    out.reserve(r.remaining() / 2);
    std::uint16_t v = 0;
    while (r.read_u16(v))
    {
        out.push_back(v);
    }
    return {};
}

template <typename Param>
[[nodiscard]] std::expected<parameter, codec_error> decode_u16_list(const std::span<const std::uint8_t> value, const std::string& path)
{
    Param p;
    byte_reader r(value);
    if (auto ok = read_u16_list(r, p.values, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    return p;
}

[[nodiscard]] std::expected<parameter, codec_error> decode_ipv4(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (auto ok = check_exact_length(value.size(), 4, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    boost::asio::ip::address_v4::bytes_type bytes;
    std::copy_n(value.begin(), bytes.size(), bytes.begin());
    ipv4_address_param p;
    p.address = boost::asio::ip::address_v4(bytes);
    return p;
}

[[nodiscard]] std::expected<parameter, codec_error> decode_ipv6(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (auto ok = check_exact_length(value.size(), 16, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    boost::asio::ip::address_v6::bytes_type bytes;
    std::copy_n(value.begin(), bytes.size(), bytes.begin());
    ipv6_address_param p;
    p.address = boost::asio::ip::address_v6(bytes);
    return p;
}

[[nodiscard]] std::expected<parameter, codec_error> decode_host_name(const std::span<const std::uint8_t> value, const std::string& path)
{
    const auto terminator = std::find(value.begin(), value.end(), static_cast<std::uint8_t>(0));
    if (terminator == value.end())
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "host name is not nul terminated"));
    }
    if (std::any_of(terminator, value.end(), [](const std::uint8_t b) { return b != 0; }))
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "host name contains embedded nul"));
    }
    host_name_address_param p;
    p.host_name.assign(value.begin(), terminator);
    return p;
}

[[nodiscard]] std::expected<parameter, codec_error> decode_outgoing_reset(const std::span<const std::uint8_t> value, const std::string& path)
{
    outgoing_reset_request_param p;
    byte_reader r(value);
    if (!r.read_u32(p.request_sequence) || !r.read_u32(p.response_sequence) || !r.read_u32(p.sender_last_tsn))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "outgoing reset request needs 12 bytes"));
    }
    if (auto ok = read_u16_list(r, p.stream_ids, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    return p;
}

[[nodiscard]] std::expected<parameter, codec_error> decode_incoming_reset(const std::span<const std::uint8_t> value, const std::string& path)
{
    incoming_reset_request_param p;
    byte_reader r(value);
    if (!r.read_u32(p.request_sequence))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "incoming reset request needs 4 bytes"));
    }
    if (auto ok = read_u16_list(r, p.stream_ids, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    return p;
}

[[nodiscard]] std::expected<parameter, codec_error> decode_reconfig_response(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (value.size() < 8)
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "reconfig response needs 8 bytes"));
    }
    if (value.size() != 8 && value.size() != 16)
    {
        return std::unexpected(make_codec_error(errc::kInvalidLength, path, "reconfig response must be 8 or 16 bytes"));
    }
    reconfig_response_param p;
    byte_reader r(value);
    if (!r.read_u32(p.response_sequence) || !r.read_u32(p.result))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "reconfig response needs 8 bytes"));
    }
    std::uint32_t sender_next = 0;
    std::uint32_t receiver_next = 0;
    if (r.read_u32(sender_next) && r.read_u32(receiver_next))
    {
        p.sender_next_tsn = sender_next;
        p.receiver_next_tsn = receiver_next;
    }
    return p;
}

template <typename Param>
[[nodiscard]] std::expected<parameter, codec_error> decode_add_streams(const std::span<const std::uint8_t> value, const std::string& path)
{
    if (auto ok = check_exact_length(value.size(), 8, path); !ok)
    {
        return std::unexpected(ok.error());
    }
    Param p;
    byte_reader r(value);
    if (!r.read_u32(p.request_sequence) || !r.read_u16(p.new_streams) || !r.read_u16(p.reserved))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "add streams request needs 8 bytes"));
    }
    return p;
}

template <std::uint16_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const opaque_param<Type>& p, byte_writer& w, const std::string& /*path*/)
{
    w.push_bytes(p.data);
    return {};
}

template <std::uint16_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const flag_param<Type>& /*p*/, byte_writer& /*w*/, const std::string& /*path*/)
{
    return {};
}

template <std::uint16_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const u32_param<Type>& p, byte_writer& w, const std::string& /*path*/)
{
    w.push_u32(p.value);
    return {};
}

template <std::uint16_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const u16_list_param<Type>& p, byte_writer& w, const std::string& /*path*/)
{
    for (const auto v : p.values)
    {
        w.push_u16(v);
    }
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const ipv4_address_param& p, byte_writer& w, const std::string& /*path*/)
{
    const auto bytes = p.address.to_bytes();
    w.push_bytes(bytes);
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const ipv6_address_param& p, byte_writer& w, const std::string& /*path*/)
{
    const auto bytes = p.address.to_bytes();
    w.push_bytes(bytes);
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const host_name_address_param& p, byte_writer& w, const std::string& path)
{
    if (p.host_name.find('\0') != std::string::npos)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "host name must not contain nul"));
    }
    w.push_bytes(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(p.host_name.data()), p.host_name.size()));
    w.push_u8(0);
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const outgoing_reset_request_param& p, byte_writer& w, const std::string& /*path*/)
{
    w.push_u32(p.request_sequence);
    w.push_u32(p.response_sequence);
    w.push_u32(p.sender_last_tsn);
    for (const auto id : p.stream_ids)
    {
        w.push_u16(id);
    }
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const incoming_reset_request_param& p, byte_writer& w, const std::string& /*path*/)
{
    w.push_u32(p.request_sequence);
    for (const auto id : p.stream_ids)
    {
        w.push_u16(id);
    }
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const reconfig_response_param& p, byte_writer& w, const std::string& path)
{
    if (p.sender_next_tsn.has_value() != p.receiver_next_tsn.has_value())
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "sender and receiver next tsn must be set together"));
    }
    w.push_u32(p.response_sequence);
    w.push_u32(p.result);
    if (p.sender_next_tsn.has_value())
    {
        w.push_u32(*p.sender_next_tsn);
        w.push_u32(*p.receiver_next_tsn);
    }
    return {};
}

template <std::uint16_t Type>
[[nodiscard]] std::expected<void, codec_error> encode_value(const add_streams_request_param<Type>& p, byte_writer& w, const std::string& /*path*/)
{
    w.push_u32(p.request_sequence);
    w.push_u16(p.new_streams);
    w.push_u16(p.reserved);
    return {};
}

[[nodiscard]] std::expected<void, codec_error> encode_value(const unknown_param& p, byte_writer& w, const std::string& /*path*/)
{
    w.push_bytes(p.value);
    return {};
}

struct param_info
{
    std::uint16_t type;
    const char* name;
};

constexpr std::array<param_info, 21> kKnownParams = {{
    {.type = param_type::kHeartbeatInfo, .name = "heartbeat_info"},
    {.type = param_type::kIpv4Address, .name = "ipv4_address"},
    {.type = param_type::kIpv6Address, .name = "ipv6_address"},
    {.type = param_type::kStateCookie, .name = "state_cookie"},
    {.type = param_type::kUnrecognizedParameter, .name = "unrecognized_parameter"},
    {.type = param_type::kCookiePreservative, .name = "cookie_preservative"},
    {.type = param_type::kHostNameAddress, .name = "host_name_address"},
    {.type = param_type::kSupportedAddressTypes, .name = "supported_address_types"},
    {.type = param_type::kOutgoingResetRequest, .name = "outgoing_reset_request"},
    {.type = param_type::kIncomingResetRequest, .name = "incoming_reset_request"},
    {.type = param_type::kSsnTsnResetRequest, .name = "ssn_tsn_reset_request"},
    {.type = param_type::kReconfigResponse, .name = "reconfig_response"},
    {.type = param_type::kAddOutgoingStreamsRequest, .name = "add_outgoing_streams_request"},
    {.type = param_type::kAddIncomingStreamsRequest, .name = "add_incoming_streams_request"},
    {.type = param_type::kEcnCapable, .name = "ecn_capable"},
    {.type = param_type::kRandom, .name = "random"},
    {.type = param_type::kChunkList, .name = "chunk_list"},
    {.type = param_type::kRequestedHmacAlgorithm, .name = "requested_hmac_algorithm"},
    {.type = param_type::kSupportedExtensions, .name = "supported_extensions"},
    {.type = param_type::kForwardTsnSupported, .name = "forward_tsn_supported"},
    {.type = param_type::kAdaptationLayerIndication, .name = "adaptation_layer_indication"},
}};

}    // namespace

std::uint16_t param_type_of(const parameter& p)
{
    return std::visit(
        [](const auto& v) -> std::uint16_t
        {
            using value_type = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_type, unknown_param>)
            {
                return v.type;
            }
            else
            {
                return value_type::kType;
            }
        },
        p);
}

bool is_known_param_type(const std::uint16_t type)
{
    return std::any_of(kKnownParams.begin(), kKnownParams.end(), [type](const param_info& info) { return info.type == type; });
}

const char* param_name(const std::uint16_t type)
{
    for (const auto& info : kKnownParams)
    {
        if (info.type == type)
        {
            return info.name;
        }
    }
    return "unknown";
}

std::expected<parameter, codec_error> decode_param_value(const std::uint16_t type, const std::span<const std::uint8_t> value, const std::string& path)
{
    LOG_TRACE("decode parameter {} type {} value {} bytes", path, param_name(type), value.size());
    switch (type)
    {
        case param_type::kHeartbeatInfo:
            return decode_opaque<heartbeat_info_param>(value);
        case param_type::kIpv4Address:
            return decode_ipv4(value, path);
        case param_type::kIpv6Address:
            return decode_ipv6(value, path);
        case param_type::kStateCookie:
            return decode_opaque<state_cookie_param>(value);
        case param_type::kUnrecognizedParameter:
            return decode_opaque<unrecognized_parameter_param>(value);
        case param_type::kCookiePreservative:
            return decode_u32<cookie_preservative_param>(value, path);
        case param_type::kHostNameAddress:
            return decode_host_name(value, path);
        case param_type::kSupportedAddressTypes:
            return decode_u16_list<supported_address_types_param>(value, path);
        case param_type::kOutgoingResetRequest:
            return decode_outgoing_reset(value, path);
        case param_type::kIncomingResetRequest:
            return decode_incoming_reset(value, path);
        case param_type::kSsnTsnResetRequest:
            return decode_u32<ssn_tsn_reset_request_param>(value, path);
        case param_type::kReconfigResponse:
            return decode_reconfig_response(value, path);
        case param_type::kAddOutgoingStreamsRequest:
            return decode_add_streams<add_outgoing_streams_request_param>(value, path);
        case param_type::kAddIncomingStreamsRequest:
            return decode_add_streams<add_incoming_streams_request_param>(value, path);
        case param_type::kEcnCapable:
            return decode_flag<ecn_capable_param>(value, path);
        case param_type::kRandom:
            return decode_opaque<random_param>(value);
        case param_type::kChunkList:
            return decode_opaque<chunk_list_param>(value);
        case param_type::kRequestedHmacAlgorithm:
            return decode_u16_list<requested_hmac_algorithm_param>(value, path);
        case param_type::kSupportedExtensions:
            return decode_opaque<supported_extensions_param>(value);
        case param_type::kForwardTsnSupported:
            return decode_flag<forward_tsn_supported_param>(value, path);
        case param_type::kAdaptationLayerIndication:
            return decode_u32<adaptation_layer_indication_param>(value, path);
        default:
            break;
    }
    unknown_param p;
    p.type = type;
    p.value.assign(value.begin(), value.end());
    return p;
}

std::expected<void, codec_error> encode_param_value(const parameter& p, byte_writer& w, const std::string& path)
{
    return std::visit([&w, &path](const auto& v) { return encode_value(v, w, path); }, p);
}

}    // namespace sctp
