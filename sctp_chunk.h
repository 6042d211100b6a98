#ifndef SCTP_CHUNK_H
#define SCTP_CHUNK_H

#include <vector>
#include <cstdint>
#include <variant>

#include "sctp_param.h"
#include "error_cause.h"

namespace sctp
{

namespace chunk_type
{
constexpr std::uint8_t kData = 0;
constexpr std::uint8_t kInit = 1;
constexpr std::uint8_t kInitAck = 2;
constexpr std::uint8_t kSack = 3;
constexpr std::uint8_t kHeartbeat = 4;
constexpr std::uint8_t kHeartbeatAck = 5;
constexpr std::uint8_t kAbort = 6;
constexpr std::uint8_t kShutdown = 7;
constexpr std::uint8_t kShutdownAck = 8;
constexpr std::uint8_t kError = 9;
constexpr std::uint8_t kCookieEcho = 10;
constexpr std::uint8_t kCookieAck = 11;
constexpr std::uint8_t kEcne = 12;
constexpr std::uint8_t kCwr = 13;
constexpr std::uint8_t kShutdownComplete = 14;
constexpr std::uint8_t kReconfig = 130;
constexpr std::uint8_t kForwardTsn = 192;
}    // namespace chunk_type

namespace chunk_flag
{
constexpr std::uint8_t kDataEnd = 0x01;
constexpr std::uint8_t kDataBegin = 0x02;
constexpr std::uint8_t kDataUnordered = 0x04;
constexpr std::uint8_t kDataImmediate = 0x08;
// Set on ABORT and SHUTDOWN COMPLETE when the sender used the peer's tag.
constexpr std::uint8_t kTagReflected = 0x01;
}    // namespace chunk_flag

struct data_chunk
{
    static constexpr std::uint8_t kType = chunk_type::kData;
    std::uint32_t tsn = 0;
    std::uint16_t stream_id = 0;
    std::uint16_t stream_sequence = 0;
    std::uint32_t payload_protocol_id = 0;
    std::vector<std::uint8_t> user_data;

    bool operator==(const data_chunk&) const = default;
};

template <std::uint8_t Type>
struct basic_init_chunk
{
    static constexpr std::uint8_t kType = Type;
    std::uint32_t initiate_tag = 0;
    std::uint32_t advertised_window = 0;
    std::uint16_t outbound_streams = 0;
    std::uint16_t inbound_streams = 0;
    std::uint32_t initial_tsn = 0;
    std::vector<parameter> params;

    bool operator==(const basic_init_chunk&) const = default;
};

using init_chunk = basic_init_chunk<chunk_type::kInit>;
using init_ack_chunk = basic_init_chunk<chunk_type::kInitAck>;

struct gap_ack_block
{
    std::uint16_t start = 0;
    std::uint16_t end = 0;

    bool operator==(const gap_ack_block&) const = default;
};

struct sack_chunk
{
    static constexpr std::uint8_t kType = chunk_type::kSack;
    std::uint32_t cumulative_tsn_ack = 0;
    std::uint32_t advertised_window = 0;
    std::vector<gap_ack_block> gap_blocks;
    std::vector<std::uint32_t> duplicate_tsns;

    bool operator==(const sack_chunk&) const = default;
};

// HEARTBEAT and HEARTBEAT ACK carry a single Heartbeat Info parameter.
template <std::uint8_t Type>
struct basic_heartbeat_chunk
{
    static constexpr std::uint8_t kType = Type;
    std::vector<std::uint8_t> info;

    bool operator==(const basic_heartbeat_chunk&) const = default;
};

using heartbeat_chunk = basic_heartbeat_chunk<chunk_type::kHeartbeat>;
using heartbeat_ack_chunk = basic_heartbeat_chunk<chunk_type::kHeartbeatAck>;

template <std::uint8_t Type>
struct basic_cause_chunk
{
    static constexpr std::uint8_t kType = Type;
    std::vector<error_cause> causes;

    bool operator==(const basic_cause_chunk&) const = default;
};

using abort_chunk = basic_cause_chunk<chunk_type::kAbort>;
using error_chunk = basic_cause_chunk<chunk_type::kError>;

template <std::uint8_t Type>
struct basic_empty_chunk
{
    static constexpr std::uint8_t kType = Type;

    bool operator==(const basic_empty_chunk&) const = default;
};

using shutdown_ack_chunk = basic_empty_chunk<chunk_type::kShutdownAck>;
using cookie_ack_chunk = basic_empty_chunk<chunk_type::kCookieAck>;
using shutdown_complete_chunk = basic_empty_chunk<chunk_type::kShutdownComplete>;

// Chunks whose value is a single TSN.
template <std::uint8_t Type>
struct basic_tsn_chunk
{
    static constexpr std::uint8_t kType = Type;
    std::uint32_t tsn = 0;

    bool operator==(const basic_tsn_chunk&) const = default;
};

// tsn is the cumulative TSN ack.
using shutdown_chunk = basic_tsn_chunk<chunk_type::kShutdown>;
// tsn is the lowest TSN of the congestion event.
using ecne_chunk = basic_tsn_chunk<chunk_type::kEcne>;
using cwr_chunk = basic_tsn_chunk<chunk_type::kCwr>;

struct cookie_echo_chunk
{
    static constexpr std::uint8_t kType = chunk_type::kCookieEcho;
    std::vector<std::uint8_t> cookie;

    bool operator==(const cookie_echo_chunk&) const = default;
};

struct reconfig_chunk
{
    static constexpr std::uint8_t kType = chunk_type::kReconfig;
    std::vector<parameter> params;

    bool operator==(const reconfig_chunk&) const = default;
};

struct forward_tsn_stream
{
    std::uint16_t stream_id = 0;
    std::uint16_t stream_sequence = 0;

    bool operator==(const forward_tsn_stream&) const = default;
};

struct forward_tsn_chunk
{
    static constexpr std::uint8_t kType = chunk_type::kForwardTsn;
    std::uint32_t new_cumulative_tsn = 0;
    std::vector<forward_tsn_stream> streams;

    bool operator==(const forward_tsn_chunk&) const = default;
};

struct unknown_chunk
{
    std::uint8_t type = 0;
    std::vector<std::uint8_t> value;

    bool operator==(const unknown_chunk&) const = default;
};

using chunk_value = std::variant<data_chunk,
                                 init_chunk,
                                 init_ack_chunk,
                                 sack_chunk,
                                 heartbeat_chunk,
                                 heartbeat_ack_chunk,
                                 abort_chunk,
                                 shutdown_chunk,
                                 shutdown_ack_chunk,
                                 error_chunk,
                                 cookie_echo_chunk,
                                 cookie_ack_chunk,
                                 ecne_chunk,
                                 cwr_chunk,
                                 shutdown_complete_chunk,
                                 reconfig_chunk,
                                 forward_tsn_chunk,
                                 unknown_chunk>;

struct chunk
{
    std::uint8_t flags = 0;
    chunk_value value;

    [[nodiscard]] std::uint8_t type() const;

    template <typename T>
    [[nodiscard]] const T* get_if() const
    {
        return std::get_if<T>(&value);
    }

    bool operator==(const chunk&) const = default;
};

[[nodiscard]] bool is_known_chunk_type(std::uint8_t type);
[[nodiscard]] const char* chunk_name(std::uint8_t type);

}    // namespace sctp

#endif
