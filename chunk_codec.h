#ifndef CHUNK_CODEC_H
#define CHUNK_CODEC_H

#include <span>
#include <string>
#include <cstdint>
#include <expected>

#include "sctp_chunk.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "codec_options.h"

namespace sctp
{

// Decodes the value bytes of a registered chunk type. Unregistered types come
// back as unknown_chunk. Parameters nested in the chunk report their advisories
// to report.
[[nodiscard]] std::expected<chunk_value, codec_error> decode_chunk_value(
    std::uint8_t type, std::span<const std::uint8_t> value, const codec_options& opts, decode_report* report, const std::string& path);

// Appends the value bytes of the chunk, without header or padding.
[[nodiscard]] std::expected<void, codec_error> encode_chunk_value(const chunk_value& value, byte_writer& w, const std::string& path);

}    // namespace sctp

#endif
