#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <expected>

#include "log.h"
#include "sctp_chunk.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "sctp_header.h"
#include "sctp_packet.h"
#include "chunk_framer.h"
#include "codec_options.h"

namespace sctp
{

common_header packet::header() const
{
    common_header h;
    h.source_port = source_port;
    h.destination_port = destination_port;
    h.verification_tag = verification_tag;
    h.checksum = checksum;
    return h;
}

std::expected<packet, codec_error> decode_packet(const std::span<const std::uint8_t> data, const codec_options& opts, decode_report* report)
{
    if (data.size() > opts.max_packet_size)
    {
        LOG_DEBUG("packet size {} exceeds limit {}", data.size(), opts.max_packet_size);
        return std::unexpected(make_codec_error(
            errc::kInvalidLength, "/", "packet size " + std::to_string(data.size()) + " exceeds limit " + std::to_string(opts.max_packet_size)));
    }

    std::span<const std::uint8_t> body;
    auto header = decode_header(data, body);
    if (!header)
    {
        LOG_DEBUG("packet rejected {}", describe(header.error()));
        return std::unexpected(header.error());
    }

    if (auto checked = check_checksum(data); !checked && report != nullptr)
    {
        report->add(std::move(checked.error()));
    }

    auto chunks = decode_chunks(body, opts, report);
    if (!chunks)
    {
        return std::unexpected(chunks.error());
    }

    packet p;
    p.source_port = header->source_port;
    p.destination_port = header->destination_port;
    p.verification_tag = header->verification_tag;
    p.checksum = header->checksum;
    p.chunks = std::move(*chunks);
    LOG_TRACE("decoded packet {} -> {} tag {:08x} chunks {}", p.source_port, p.destination_port, p.verification_tag, p.chunks.size());
    return p;
}

std::expected<std::vector<std::uint8_t>, codec_error> encode_packet(const packet& p, const codec_options& opts)
{
    std::vector<std::uint8_t> buf;
    encode_header(p.header(), buf);
    byte_writer w(buf);
    if (auto encoded = encode_chunks(p.chunks, w); !encoded)
    {
        return std::unexpected(encoded.error());
    }
    if (buf.size() > opts.max_packet_size)
    {
        return std::unexpected(make_codec_error(
            errc::kInvalidLength, "/", "encoded size " + std::to_string(buf.size()) + " exceeds limit " + std::to_string(opts.max_packet_size)));
    }
    if (auto patched = patch_checksum(buf); !patched)
    {
        return std::unexpected(patched.error());
    }
    return buf;
}

}    // namespace sctp
