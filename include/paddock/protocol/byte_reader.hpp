#pragma once

#include "paddock/protocol/errors.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace paddock::protocol {

/// Forward-only little-endian cursor over a datagram.
/// Every read is bounds-checked and throws DecodeError(Truncated) instead of
/// reading past the end, whatever the host byte order.
class ByteReader {
  public:
    ByteReader(std::span<const uint8_t> bytes, std::string_view what)
        : bytes_(bytes), what_(what) {}

    /// Fail unless at least n bytes remain.
    void require(size_t n) const {
        if (remaining() < n) {
            throw DecodeError::truncated(what_, pos_ + n, bytes_.size());
        }
    }

    uint8_t u8() { return read_le<uint8_t>(); }
    int8_t i8() { return std::bit_cast<int8_t>(read_le<uint8_t>()); }
    uint16_t u16() { return read_le<uint16_t>(); }
    int16_t i16() { return std::bit_cast<int16_t>(read_le<uint16_t>()); }
    uint32_t u32() { return read_le<uint32_t>(); }
    uint64_t u64() { return read_le<uint64_t>(); }
    float f32() { return std::bit_cast<float>(read_le<uint32_t>()); }
    double f64() { return std::bit_cast<double>(read_le<uint64_t>()); }
    bool flag() { return u8() != 0; }

    /// Fixed-width NUL-padded text field. Stops at the first NUL, always consumes n bytes.
    std::string fixed_string(size_t n) {
        auto raw = take(n);
        size_t len = 0;
        while (len < raw.size() && raw[len] != 0) {
            ++len;
        }
        return std::string(reinterpret_cast<const char *>(raw.data()), len);
    }

    std::span<const uint8_t> take(size_t n) {
        require(n);
        auto out = bytes_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    void skip(size_t n) {
        require(n);
        pos_ += n;
    }

    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return bytes_.size() - pos_; }
    [[nodiscard]] std::span<const uint8_t> rest() const { return bytes_.subspan(pos_); }

  private:
    template <typename T> T read_le() {
        require(sizeof(T));
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(static_cast<T>(bytes_[pos_ + i]) << (8 * i));
        }
        pos_ += sizeof(T);
        return value;
    }

    std::span<const uint8_t> bytes_;
    std::string_view what_;
    size_t pos_ = 0;
};

/// Convert a raw wire value to a scoped enum whose valid values are the closed range [lo, hi].
template <typename E, typename Raw>
[[nodiscard]] E enum_in_range(Raw raw, Raw lo, Raw hi, std::string_view field) {
    if (raw < lo || raw > hi) {
        throw DecodeError::malformed(field, static_cast<long long>(raw));
    }
    return static_cast<E>(raw);
}

} // namespace paddock::protocol
