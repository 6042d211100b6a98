#ifndef CHUNK_FRAMER_H
#define CHUNK_FRAMER_H

#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <expected>

#include "sctp_chunk.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "codec_options.h"

namespace sctp
{

// Splits a packet body into chunks. Each chunk must be followed by its padding.
// Unregistered chunk types follow the action in the two high bits of the type;
// a malformed value of a registered type always fails the whole body.
[[nodiscard]] std::expected<std::vector<chunk>, codec_error> decode_chunks(std::span<const std::uint8_t> body,
                                                                           const codec_options& opts = {},
                                                                           decode_report* report = nullptr);

[[nodiscard]] std::expected<void, codec_error> encode_chunk(const chunk& c, byte_writer& w, const std::string& path = "/chunks/0");
[[nodiscard]] std::expected<void, codec_error> encode_chunks(const std::vector<chunk>& chunks, byte_writer& w);

}    // namespace sctp

#endif
