#ifndef BYTE_CURSOR_H
#define BYTE_CURSOR_H

#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace sctp
{

// Read cursor over a borrowed buffer. Every read checks the remaining size
// first and leaves the cursor untouched when it fails.
class byte_reader
{
   public:
    byte_reader() = default;
    explicit byte_reader(std::span<const std::uint8_t> data) : data_(data) {}

    [[nodiscard]] bool valid() const { return valid_; }
    [[nodiscard]] bool has(const std::size_t n) const { return n <= remaining(); }
    [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }
    [[nodiscard]] std::size_t offset() const { return pos_; }
    [[nodiscard]] bool empty() const { return remaining() == 0; }
    [[nodiscard]] std::span<const std::uint8_t> rest() const { return data_.subspan(pos_); }

    bool skip(std::size_t n);
    bool read_u8(std::uint8_t& out);
    bool read_u16(std::uint16_t& out);
    bool read_u32(std::uint32_t& out);
    bool read(std::size_t n, std::span<const std::uint8_t>& out);
    bool read_vector(std::size_t n, std::vector<std::uint8_t>& out);

    // Splits off the next n bytes as an independent reader. On failure the
    // returned reader is invalid and this cursor does not move.
    [[nodiscard]] byte_reader slice(std::size_t n);

   private:
    static byte_reader invalid_reader()
    {
        byte_reader r;
        r.valid_ = false;
        return r;
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
    bool valid_ = true;
};

// Append-only writer. Back-patching is limited to bytes already written.
class byte_writer
{
   public:
    explicit byte_writer(std::vector<std::uint8_t>& buf) : buf_(buf) {}

    [[nodiscard]] std::size_t size() const { return buf_.size(); }

    void push_u8(const std::uint8_t val) { buf_.push_back(val); }
    void push_u16(std::uint16_t val);
    void push_u32(std::uint32_t val);
    void push_bytes(std::span<const std::uint8_t> data) { buf_.insert(buf_.end(), data.begin(), data.end()); }
    void push_zeros(std::size_t n) { buf_.insert(buf_.end(), n, 0); }

    bool patch_u16(std::size_t offset, std::uint16_t val);
    bool patch_u32(std::size_t offset, std::uint32_t val);

   private:
    std::vector<std::uint8_t>& buf_;
};

[[nodiscard]] constexpr std::size_t padding_for(const std::size_t len) { return (4 - (len % 4)) % 4; }

[[nodiscard]] inline std::uint16_t load_u16(const std::uint8_t* p) { return static_cast<std::uint16_t>((p[0] << 8) | p[1]); }

[[nodiscard]] inline std::uint32_t load_u32(const std::uint8_t* p)
{
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) | (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

}    // namespace sctp

#endif
