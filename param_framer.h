#ifndef PARAM_FRAMER_H
#define PARAM_FRAMER_H

#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <expected>

#include "sctp_param.h"
#include "byte_cursor.h"
#include "codec_error.h"
#include "codec_options.h"

namespace sctp
{

// Parses a sequence of parameters, preserving order and repetitions.
// Parameters with an unregistered type follow the action in the two high bits
// of their type: stop with an error, stop and keep what was parsed so far,
// skip, or skip and record an advisory in report.
[[nodiscard]] std::expected<std::vector<parameter>, codec_error> decode_param_list(std::span<const std::uint8_t> data,
                                                                                   const codec_options& opts = {},
                                                                                   decode_report* report = nullptr,
                                                                                   const std::string& path = "/");

// Every parameter but the last is followed by its padding; the enclosing chunk
// pads the final one.
[[nodiscard]] std::expected<void, codec_error> encode_param_list(const std::vector<parameter>& params, byte_writer& w, const std::string& path = "/");
[[nodiscard]] std::expected<std::vector<std::uint8_t>, codec_error> encode_param_list(const std::vector<parameter>& params);

}    // namespace sctp

#endif
