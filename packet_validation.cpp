#include <string>
#include <cstdint>
#include <expected>

#include "log.h"
#include "constants.h"
#include "tlv_framer.h"
#include "sctp_chunk.h"
#include "codec_error.h"
#include "sctp_packet.h"
#include "packet_validation.h"

namespace sctp
{

namespace
{

template <std::uint8_t Type>
[[nodiscard]] std::expected<void, codec_error> validate_init(const chunk& c, const basic_init_chunk<Type>& init, const std::string& path)
{
    if (c.flags != 0)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "init flags must be zero"));
    }
    if (init.initiate_tag == 0)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "initiate tag must be non-zero"));
    }
    if (init.outbound_streams == 0 || init.inbound_streams == 0)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "stream counts must be non-zero"));
    }
    if (init.advertised_window < constants::limits::MIN_ADVERTISED_WINDOW)
    {
        return std::unexpected(make_codec_error(
            errc::kMalformedValue, path, "advertised window " + std::to_string(init.advertised_window) + " below " +
                                             std::to_string(constants::limits::MIN_ADVERTISED_WINDOW)));
    }
    return {};
}

[[nodiscard]] std::expected<void, codec_error> validate_chunk(const chunk& c, const std::string& path)
{
    if (const auto* init = c.get_if<init_chunk>(); init != nullptr)
    {
        return validate_init(c, *init, path);
    }
    if (const auto* init_ack = c.get_if<init_ack_chunk>(); init_ack != nullptr)
    {
        return validate_init(c, *init_ack, path);
    }
    if (const auto* data = c.get_if<data_chunk>(); data != nullptr && data->user_data.empty())
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "data chunk without user data"));
    }
    return {};
}

}    // namespace

std::expected<void, codec_error> validate_packet(const packet& p)
{
    if (p.source_port == 0)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, "/header/source_port", "must be non-zero"));
    }
    if (p.destination_port == 0)
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, "/header/destination_port", "must be non-zero"));
    }

    for (std::size_t i = 0; i < p.chunks.size(); ++i)
    {
        const std::string path = child_path("/", "chunks", i);
        const auto& c = p.chunks[i];
        if (c.get_if<init_chunk>() != nullptr)
        {
            if (p.chunks.size() != 1)
            {
                return std::unexpected(make_codec_error(errc::kMalformedValue, path, "init chunk must be the only chunk in its packet"));
            }
            if (p.verification_tag != 0)
            {
                return std::unexpected(make_codec_error(errc::kMalformedValue, "/header/verification_tag", "must be zero on a packet carrying init"));
            }
        }
        if (auto ok = validate_chunk(c, path); !ok)
        {
            LOG_DEBUG("packet validation failed {}", describe(ok.error()));
            return ok;
        }
    }
    return {};
}

}    // namespace sctp
