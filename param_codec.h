#ifndef PARAM_CODEC_H
#define PARAM_CODEC_H

#include <span>
#include <string>
#include <cstdint>
#include <expected>

#include "sctp_param.h"
#include "byte_cursor.h"
#include "codec_error.h"

namespace sctp
{

// Decodes the value bytes of one parameter. Types outside the registry come
// back as unknown_param; the framer decides whether that is acceptable.
[[nodiscard]] std::expected<parameter, codec_error> decode_param_value(std::uint16_t type, std::span<const std::uint8_t> value, const std::string& path);

// Appends the value bytes of p, without header or padding.
[[nodiscard]] std::expected<void, codec_error> encode_param_value(const parameter& p, byte_writer& w, const std::string& path);

}    // namespace sctp

#endif
