#ifndef TLV_FRAMER_H
#define TLV_FRAMER_H

#include <span>
#include <string>
#include <cstdint>
#include <expected>

#include "byte_cursor.h"
#include "codec_error.h"
#include "codec_options.h"

namespace sctp
{

// Header layouts sharing the 4-byte type/length framing.
//   chunk:     type:1 flags:1 length:2
//   parameter: type:2 length:2
//   cause:     code:2 length:2
enum class tlv_layout : std::uint8_t
{
    kChunk,
    kParameter,
    kCause,
};

enum class tail_padding : std::uint8_t
{
    // Padding must be present after every record, including the last.
    kRequired,
    // The last record of an enclosing value may end without padding.
    kOptionalAtEnd,
};

struct tlv_record
{
    std::uint16_t type = 0;
    std::uint8_t flags = 0;
    std::span<const std::uint8_t> value;
};

// Reads one record and its padding. A successful read always consumes at least
// the 4 header bytes, so loops built on it cannot stall.
[[nodiscard]] std::expected<tlv_record, codec_error> read_tlv(
    byte_reader& r, tlv_layout layout, tail_padding tail, const codec_options& opts, const std::string& path);

// Writes header, value and, when pad is set, zero padding up to a multiple of 4.
[[nodiscard]] std::expected<void, codec_error> write_tlv(
    byte_writer& w, tlv_layout layout, std::uint16_t type, std::uint8_t flags, std::span<const std::uint8_t> value, bool pad, const std::string& path);

// Begins a record whose value is written in place; finish_tlv fills in the length.
[[nodiscard]] std::size_t begin_tlv(byte_writer& w, tlv_layout layout, std::uint16_t type, std::uint8_t flags);
[[nodiscard]] std::expected<void, codec_error> finish_tlv(byte_writer& w, std::size_t start, bool pad, const std::string& path);

// Value size checks shared by the record decoders: too short is truncated,
// anything else that does not fit is an invalid length.
[[nodiscard]] std::expected<void, codec_error> check_exact_length(std::size_t actual, std::size_t expected, const std::string& path);
[[nodiscard]] std::expected<void, codec_error> check_min_length(std::size_t actual, std::size_t minimum, const std::string& path);
[[nodiscard]] std::expected<void, codec_error> check_record_multiple(std::size_t actual, std::size_t record_size, const std::string& path);

[[nodiscard]] std::string child_path(const std::string& parent, const char* name, std::size_t index);

}    // namespace sctp

#endif
