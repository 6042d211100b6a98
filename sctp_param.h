#ifndef SCTP_PARAM_H
#define SCTP_PARAM_H

#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <optional>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

namespace sctp
{

namespace param_type
{
constexpr std::uint16_t kHeartbeatInfo = 1;
constexpr std::uint16_t kIpv4Address = 5;
constexpr std::uint16_t kIpv6Address = 6;
constexpr std::uint16_t kStateCookie = 7;
constexpr std::uint16_t kUnrecognizedParameter = 8;
constexpr std::uint16_t kCookiePreservative = 9;
constexpr std::uint16_t kHostNameAddress = 11;
constexpr std::uint16_t kSupportedAddressTypes = 12;
constexpr std::uint16_t kOutgoingResetRequest = 13;
constexpr std::uint16_t kIncomingResetRequest = 14;
constexpr std::uint16_t kSsnTsnResetRequest = 15;
constexpr std::uint16_t kReconfigResponse = 16;
constexpr std::uint16_t kAddOutgoingStreamsRequest = 17;
constexpr std::uint16_t kAddIncomingStreamsRequest = 18;
constexpr std::uint16_t kEcnCapable = 0x8000;
constexpr std::uint16_t kRandom = 0x8002;
constexpr std::uint16_t kChunkList = 0x8003;
constexpr std::uint16_t kRequestedHmacAlgorithm = 0x8004;
constexpr std::uint16_t kSupportedExtensions = 0x8008;
constexpr std::uint16_t kForwardTsnSupported = 0xC000;
constexpr std::uint16_t kAdaptationLayerIndication = 0xC006;
}    // namespace param_type

// Parameters whose whole value is an opaque byte string.
template <std::uint16_t Type>
struct opaque_param
{
    static constexpr std::uint16_t kType = Type;
    std::vector<std::uint8_t> data;

    bool operator==(const opaque_param&) const = default;
};

// Parameters with an empty value.
template <std::uint16_t Type>
struct flag_param
{
    static constexpr std::uint16_t kType = Type;

    bool operator==(const flag_param&) const = default;
};

// Parameters carrying a single 32-bit value.
template <std::uint16_t Type>
struct u32_param
{
    static constexpr std::uint16_t kType = Type;
    std::uint32_t value = 0;

    bool operator==(const u32_param&) const = default;
};

template <std::uint16_t Type>
struct u16_list_param
{
    static constexpr std::uint16_t kType = Type;
    std::vector<std::uint16_t> values;

    bool operator==(const u16_list_param&) const = default;
};

using heartbeat_info_param = opaque_param<param_type::kHeartbeatInfo>;
using state_cookie_param = opaque_param<param_type::kStateCookie>;
// Carries the complete unrecognized parameter, header included.
using unrecognized_parameter_param = opaque_param<param_type::kUnrecognizedParameter>;
using random_param = opaque_param<param_type::kRandom>;
using chunk_list_param = opaque_param<param_type::kChunkList>;
using supported_extensions_param = opaque_param<param_type::kSupportedExtensions>;

using ecn_capable_param = flag_param<param_type::kEcnCapable>;
using forward_tsn_supported_param = flag_param<param_type::kForwardTsnSupported>;

using cookie_preservative_param = u32_param<param_type::kCookiePreservative>;
using ssn_tsn_reset_request_param = u32_param<param_type::kSsnTsnResetRequest>;
using adaptation_layer_indication_param = u32_param<param_type::kAdaptationLayerIndication>;

using supported_address_types_param = u16_list_param<param_type::kSupportedAddressTypes>;
using requested_hmac_algorithm_param = u16_list_param<param_type::kRequestedHmacAlgorithm>;

struct ipv4_address_param
{
    static constexpr std::uint16_t kType = param_type::kIpv4Address;
    boost::asio::ip::address_v4 address;

    bool operator==(const ipv4_address_param&) const = default;
};

struct ipv6_address_param
{
    static constexpr std::uint16_t kType = param_type::kIpv6Address;
    boost::asio::ip::address_v6 address;

    bool operator==(const ipv6_address_param&) const = default;
};

struct host_name_address_param
{
    static constexpr std::uint16_t kType = param_type::kHostNameAddress;
    std::string host_name;

    bool operator==(const host_name_address_param&) const = default;
};

struct outgoing_reset_request_param
{
    static constexpr std::uint16_t kType = param_type::kOutgoingResetRequest;
    std::uint32_t request_sequence = 0;
    std::uint32_t response_sequence = 0;
    std::uint32_t sender_last_tsn = 0;
    std::vector<std::uint16_t> stream_ids;

    bool operator==(const outgoing_reset_request_param&) const = default;
};

struct incoming_reset_request_param
{
    static constexpr std::uint16_t kType = param_type::kIncomingResetRequest;
    std::uint32_t request_sequence = 0;
    std::vector<std::uint16_t> stream_ids;

    bool operator==(const incoming_reset_request_param&) const = default;
};

struct reconfig_response_param
{
    static constexpr std::uint16_t kType = param_type::kReconfigResponse;
    std::uint32_t response_sequence = 0;
    std::uint32_t result = 0;
    // Either both present or both absent.
    std::optional<std::uint32_t> sender_next_tsn;
    std::optional<std::uint32_t> receiver_next_tsn;

    bool operator==(const reconfig_response_param&) const = default;
};

template <std::uint16_t Type>
struct add_streams_request_param
{
    static constexpr std::uint16_t kType = Type;
    std::uint32_t request_sequence = 0;
    std::uint16_t new_streams = 0;
    std::uint16_t reserved = 0;

    bool operator==(const add_streams_request_param&) const = default;
};

using add_outgoing_streams_request_param = add_streams_request_param<param_type::kAddOutgoingStreamsRequest>;
using add_incoming_streams_request_param = add_streams_request_param<param_type::kAddIncomingStreamsRequest>;

struct unknown_param
{
    std::uint16_t type = 0;
    std::vector<std::uint8_t> value;

    bool operator==(const unknown_param&) const = default;
};

using parameter = std::variant<heartbeat_info_param,
                               ipv4_address_param,
                               ipv6_address_param,
                               state_cookie_param,
                               unrecognized_parameter_param,
                               cookie_preservative_param,
                               host_name_address_param,
                               supported_address_types_param,
                               outgoing_reset_request_param,
                               incoming_reset_request_param,
                               ssn_tsn_reset_request_param,
                               reconfig_response_param,
                               add_outgoing_streams_request_param,
                               add_incoming_streams_request_param,
                               ecn_capable_param,
                               random_param,
                               chunk_list_param,
                               requested_hmac_algorithm_param,
                               supported_extensions_param,
                               forward_tsn_supported_param,
                               adaptation_layer_indication_param,
                               unknown_param>;

[[nodiscard]] std::uint16_t param_type_of(const parameter& p);
[[nodiscard]] bool is_known_param_type(std::uint16_t type);
[[nodiscard]] const char* param_name(std::uint16_t type);

}    // namespace sctp

#endif
