#pragma once

#include "nbt/nbt.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace nbt {

// Forward-only, bounds-checked big-endian reader over a borrowed buffer.
// A failed read throws UnexpectedEndOfData and leaves the position unchanged.
class Cursor {
public:
    Cursor(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size) {}

    std::size_t position() const noexcept { return pos_; }
    std::size_t size() const noexcept { return size_; }
    std::size_t remaining() const noexcept { return size_ - pos_; }

    std::uint8_t read_u8() { return read_be<std::uint8_t>(); }
    std::int8_t read_i8() { return read_be<std::int8_t>(); }
    std::uint16_t read_u16() { return read_be<std::uint16_t>(); }
    std::int16_t read_i16() { return read_be<std::int16_t>(); }
    std::uint32_t read_u32() { return read_be<std::uint32_t>(); }
    std::int32_t read_i32() { return read_be<std::int32_t>(); }
    std::uint64_t read_u64() { return read_be<std::uint64_t>(); }
    std::int64_t read_i64() { return read_be<std::int64_t>(); }

    float read_f32() {
        std::uint32_t bits = read_u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double read_f64() {
        std::uint64_t bits = read_u64();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    /// Consume `n` bytes and return a pointer to the first one.
    const std::uint8_t* take(std::size_t n) {
        require(n);
        const std::uint8_t* p = data_ + pos_;
        pos_ += n;
        return p;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};

    void require(std::size_t n) const {
        if (n > size_ - pos_) {
            throw NbtError(ErrorKind::UnexpectedEndOfData,
                           "unexpected end of data: need " + std::to_string(n) + " bytes at offset " +
                           std::to_string(pos_) + ", " + std::to_string(size_ - pos_) + " left");
        }
    }

    template <typename T>
    T read_be() {
        require(sizeof(T));
        T v = detail::load_be<T>(data_ + pos_);
        pos_ += sizeof(T);
        return v;
    }
};

/// u16 length-prefixed UTF-8 text. Validated before the view is returned.
std::string_view read_text(Cursor& cur);

/// Decode the payload of a tag whose type byte was already consumed.
/// `depth` is the nesting level of the enclosing container (0 for a root payload).
Tag read_payload(Cursor& cur, TagType type, const ParseOptions& opts, std::size_t depth = 0);

} // namespace nbt
