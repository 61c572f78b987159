#pragma once

#include <cstddef>
#include <cstdint>
#include <huewire/errors.hpp>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace huewire::wire
{

// ─── Little-endian helpers ───────────────────────────────────────────────────

inline void store_u16_le(uint8_t* p, uint16_t v)
{
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline uint16_t load_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0]) | static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8);
}

// ─── ByteWriter ─────────────────────────────────────────────────────────────
// Writes into a buffer that was sized up front. Running past the end is a
// bug in the length computation, not bad input, so it throws logic_error.

class ByteWriter
{
   public:
    ByteWriter(std::vector<uint8_t>& buf, size_t start) : buf_(buf), pos_(start) {}

    void put_u8(uint8_t v)
    {
        reserve(1);
        buf_[pos_++] = v;
    }

    void put_u16_le(uint16_t v)
    {
        reserve(2);
        store_u16_le(&buf_[pos_], v);
        pos_ += 2;
    }

    void put_bytes(std::span<const uint8_t> bytes)
    {
        reserve(bytes.size());
        for (uint8_t b : bytes)
            buf_[pos_++] = b;
    }

    // Leave `n` bytes at their zero-initialized value.
    void skip(size_t n)
    {
        reserve(n);
        pos_ += n;
    }

    size_t position() const { return pos_; }

   private:
    void reserve(size_t n) const
    {
        if (pos_ + n > buf_.size())
            throw std::logic_error("ByteWriter overflow: need " + std::to_string(pos_ + n)
                                   + " bytes, buffer holds " + std::to_string(buf_.size()));
    }

    std::vector<uint8_t>& buf_;
    size_t                pos_;
};

// ─── ByteReader ─────────────────────────────────────────────────────────────
// Forward-only cursor over untrusted input. Every read is bounds-checked and
// throws LengthError naming the field being read.

class ByteReader
{
   public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    uint8_t get_u8(const char* what)
    {
        require(1, what);
        return data_[pos_++];
    }

    uint16_t get_u16_le(const char* what)
    {
        require(2, what);
        uint16_t v = load_u16_le(&data_[pos_]);
        pos_ += 2;
        return v;
    }

    // View of the next `n` bytes; the cursor moves past them.
    std::span<const uint8_t> take(size_t n, const char* what)
    {
        require(n, what);
        auto view = data_.subspan(pos_, n);
        pos_ += n;
        return view;
    }

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }

   private:
    void require(size_t n, const char* what) const
    {
        if (n > remaining())
            throw LengthError(std::string("truncated message: ") + what + " needs "
                              + std::to_string(n) + " byte(s) at offset " + std::to_string(pos_)
                              + ", only " + std::to_string(remaining()) + " left");
    }

    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

}  // namespace huewire::wire
