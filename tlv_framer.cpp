#include <span>
#include <string>
#include <cstdint>
#include <expected>
#include <algorithm>

#include "log.h"
#include "constants.h"
#include "tlv_framer.h"
#include "byte_cursor.h"
#include "codec_error.h"

namespace sctp
{

namespace
{

[[nodiscard]] const char* layout_name(const tlv_layout layout)
{
    switch (layout)
    {
        case tlv_layout::kChunk:
            return "chunk";
        case tlv_layout::kParameter:
            return "parameter";
        case tlv_layout::kCause:
            return "cause";
    }
    return "record";
}

[[nodiscard]] bool read_header(byte_reader& r, const tlv_layout layout, tlv_record& out, std::uint16_t& length)
{
    if (layout == tlv_layout::kChunk)
    {
        std::uint8_t type = 0;
        if (!r.read_u8(type) || !r.read_u8(out.flags) || !r.read_u16(length))
        {
            return false;
        }
        out.type = type;
        return true;
    }
    out.flags = 0;
    return r.read_u16(out.type) && r.read_u16(length);
}

[[nodiscard]] std::expected<void, codec_error> read_padding(
    byte_reader& r, const std::size_t value_len, const tail_padding tail, const codec_options& opts, const std::string& path)
{
    const std::size_t padding = padding_for(value_len);
    if (padding == 0)
    {
        return {};
    }
    if (tail == tail_padding::kOptionalAtEnd && r.empty())
    {
        return {};
    }
    std::span<const std::uint8_t> pad_bytes;
    if (!r.read(padding, pad_bytes))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "missing " + std::to_string(padding) + " padding bytes"));
    }
    if (!opts.tolerate_nonzero_padding && std::any_of(pad_bytes.begin(), pad_bytes.end(), [](const std::uint8_t b) { return b != 0; }))
    {
        return std::unexpected(make_codec_error(errc::kMalformedValue, path, "nonzero padding"));
    }
    return {};
}

}    // namespace

std::expected<tlv_record, codec_error> read_tlv(
    byte_reader& r, const tlv_layout layout, const tail_padding tail, const codec_options& opts, const std::string& path)
{
    tlv_record record;
    std::uint16_t length = 0;
    if (!read_header(r, layout, record, length))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, std::string("dangling partial ") + layout_name(layout) + " header"));
    }
    if (length < constants::wire::CHUNK_HEADER_SIZE)
    {
        LOG_DEBUG("{} {} length {} below header size", layout_name(layout), path, length);
        return std::unexpected(make_codec_error(errc::kInvalidLength, path, "length " + std::to_string(length) + " below header size"));
    }
    const std::size_t value_len = static_cast<std::size_t>(length) - constants::wire::CHUNK_HEADER_SIZE;
    if (!r.read(value_len, record.value))
    {
        LOG_DEBUG("{} {} length {} exceeds remaining {}", layout_name(layout), path, length, r.remaining() + constants::wire::CHUNK_HEADER_SIZE);
        return std::unexpected(make_codec_error(errc::kInvalidLength, path, "length " + std::to_string(length) + " exceeds remaining bytes"));
    }
    if (auto padded = read_padding(r, value_len, tail, opts, path); !padded)
    {
        return std::unexpected(padded.error());
    }
    return record;
}

std::size_t begin_tlv(byte_writer& w, const tlv_layout layout, const std::uint16_t type, const std::uint8_t flags)
{
    const std::size_t start = w.size();
    if (layout == tlv_layout::kChunk)
    {
        w.push_u8(static_cast<std::uint8_t>(type & 0xFF));
        w.push_u8(flags);
    }
    else
    {
        w.push_u16(type);
    }
    w.push_u16(0);
    return start;
}

std::expected<void, codec_error> finish_tlv(byte_writer& w, const std::size_t start, const bool pad, const std::string& path)
{
    const std::size_t length = w.size() - start;
    if (length > constants::wire::MAX_TLV_LENGTH)
    {
        return std::unexpected(make_codec_error(errc::kInvalidLength, path, "encoded length " + std::to_string(length) + " exceeds 65535"));
    }
    if (!w.patch_u16(start + 2, static_cast<std::uint16_t>(length)))
    {
        return std::unexpected(make_codec_error(errc::kTruncated, path, "record header missing"));
    }
    if (pad)
    {
        w.push_zeros(padding_for(length));
    }
    return {};
}

std::expected<void, codec_error> write_tlv(byte_writer& w,
                                           const tlv_layout layout,
                                           const std::uint16_t type,
                                           const std::uint8_t flags,
                                           const std::span<const std::uint8_t> value,
                                           const bool pad,
                                           const std::string& path)
{
    if (value.size() > constants::wire::MAX_TLV_LENGTH - constants::wire::CHUNK_HEADER_SIZE)
    {
        return std::unexpected(make_codec_error(errc::kInvalidLength, path, "value of " + std::to_string(value.size()) + " bytes does not fit"));
    }
    const std::size_t start = begin_tlv(w, layout, type, flags);
    w.push_bytes(value);
    return finish_tlv(w, start, pad, path);
}

std::expected<void, codec_error> check_exact_length(const std::size_t actual, const std::size_t expected, const std::string& path)
{
    if (actual < expected)
    {
        return std::unexpected(
            make_codec_error(errc::kTruncated, path, "value needs " + std::to_string(expected) + " bytes got " + std::to_string(actual)));
    }
    if (actual > expected)
    {
        return std::unexpected(
            make_codec_error(errc::kInvalidLength, path, "value must be " + std::to_string(expected) + " bytes got " + std::to_string(actual)));
    }
    return {};
}

std::expected<void, codec_error> check_min_length(const std::size_t actual, const std::size_t minimum, const std::string& path)
{
    if (actual < minimum)
    {
        return std::unexpected(
            make_codec_error(errc::kTruncated, path, "value needs at least " + std::to_string(minimum) + " bytes got " + std::to_string(actual)));
    }
    return {};
}

std::expected<void, codec_error> check_record_multiple(const std::size_t actual, const std::size_t record_size, const std::string& path)
{
    if (actual % record_size != 0)
    {
        return std::unexpected(make_codec_error(
            errc::kInvalidLength, path, std::to_string(actual) + " bytes is not a multiple of record size " + std::to_string(record_size)));
    }
    return {};
}

std::string child_path(const std::string& parent, const char* name, const std::size_t index)
{
    std::string path = parent == "/" ? std::string() : parent;
    path += "/";
    path += name;
    path += "/";
    path += std::to_string(index);
    return path;
}

}    // namespace sctp
