#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>

#include "byte_cursor.h"

namespace sctp
{

bool byte_reader::skip(const std::size_t n)
{
    if (!has(n))
    {
        return false;
    }
    pos_ += n;
    return true;
}

bool byte_reader::read_u8(std::uint8_t& out)
{
    if (!has(1))
    {
        return false;
    }
    out = data_[pos_];
    pos_ += 1;
    return true;
}

bool byte_reader::read_u16(std::uint16_t& out)
{
    if (!has(2))
    {
        return false;
    }
    out = load_u16(data_.data() + pos_);
    pos_ += 2;
    return true;
}

bool byte_reader::read_u32(std::uint32_t& out)
{
    if (!has(4))
    {
        return false;
    }
    out = load_u32(data_.data() + pos_);
    pos_ += 4;
    return true;
}

bool byte_reader::read(const std::size_t n, std::span<const std::uint8_t>& out)
{
    if (!has(n))
    {
        return false;
    }
    out = data_.subspan(pos_, n);
    pos_ += n;
    return true;
}

bool byte_reader::read_vector(const std::size_t n, std::vector<std::uint8_t>& out)
{
    std::span<const std::uint8_t> bytes;
    if (!read(n, bytes))
    {
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

byte_reader byte_reader::slice(const std::size_t n)
{
    std::span<const std::uint8_t> bytes;
    if (!read(n, bytes))
    {
        return invalid_reader();
    }
    return byte_reader(bytes);
}

void byte_writer::push_u16(const std::uint16_t val)
{
    buf_.push_back(static_cast<std::uint8_t>((val >> 8) & 0xFF));
    buf_.push_back(static_cast<std::uint8_t>(val & 0xFF));
}

void byte_writer::push_u32(const std::uint32_t val)
{
    buf_.push_back(static_cast<std::uint8_t>((val >> 24) & 0xFF));
    buf_.push_back(static_cast<std::uint8_t>((val >> 16) & 0xFF));
    buf_.push_back(static_cast<std::uint8_t>((val >> 8) & 0xFF));
    buf_.push_back(static_cast<std::uint8_t>(val & 0xFF));
}

bool byte_writer::patch_u16(const std::size_t offset, const std::uint16_t val)
{
    if (offset > buf_.size() || buf_.size() - offset < 2)
    {
        return false;
    }
    buf_[offset] = static_cast<std::uint8_t>((val >> 8) & 0xFF);
    buf_[offset + 1] = static_cast<std::uint8_t>(val & 0xFF);
    return true;
}

bool byte_writer::patch_u32(const std::size_t offset, const std::uint32_t val)
{
    if (offset > buf_.size() || buf_.size() - offset < 4)
    {
        return false;
    }
    buf_[offset] = static_cast<std::uint8_t>((val >> 24) & 0xFF);
    buf_[offset + 1] = static_cast<std::uint8_t>((val >> 16) & 0xFF);
    buf_[offset + 2] = static_cast<std::uint8_t>((val >> 8) & 0xFF);
    buf_[offset + 3] = static_cast<std::uint8_t>(val & 0xFF);
    return true;
}

}    // namespace sctp
