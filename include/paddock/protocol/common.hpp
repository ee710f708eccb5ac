#pragma once

#include "paddock/protocol/byte_reader.hpp"

#include <cstddef>
#include <cstdint>

namespace paddock::protocol {

/// Every F1 2020 per-car array has exactly this many slots.
inline constexpr size_t kMaxCars = 22;

/// Length of the fixed participant / lobby name field (UTF-8, NUL-padded).
inline constexpr size_t kNameLength = 48;

/// Per-wheel values, always in wire order: rear-left, rear-right, front-left, front-right.
template <typename T> struct Wheels {
    T rear_left{};
    T rear_right{};
    T front_left{};
    T front_right{};

    bool operator==(const Wheels &) const = default;
};

enum class ZoneFlag : int8_t { Unknown = -1, None = 0, Green = 1, Blue = 2, Yellow = 3, Red = 4 };

enum class ResultStatus : uint8_t {
    Invalid = 0,
    Inactive = 1,
    Active = 2,
    Finished = 3,
    Disqualified = 4,
    NotClassified = 5,
    Retired = 6,
};

/// Compound actually fitted (F1 Modern C1-C5 plus classic and F2 compounds).
enum class ActualTyreCompound : uint8_t {
    Unknown = 0,
    Inter = 7,
    Wet = 8,
    ClassicDry = 9,
    ClassicWet = 10,
    F2SuperSoft = 11,
    F2Soft = 12,
    F2Medium = 13,
    F2Hard = 14,
    F2Wet = 15,
    C5 = 16,
    C4 = 17,
    C3 = 18,
    C2 = 19,
    C1 = 20,
    NotSet = 255,
};

/// Compound as shown on the HUD.
enum class VisualTyreCompound : uint8_t {
    Unknown = 0,
    Inter = 7,
    Wet = 8,
    ClassicDry = 9,
    ClassicWet = 10,
    F2SuperSoft = 11,
    F2Soft = 12,
    F2Medium = 13,
    F2Hard = 14,
    F2Wet = 15,
    Soft = 16,
    Medium = 17,
    Hard = 18,
    NotSet = 255,
};

inline Wheels<float> read_wheels_f32(ByteReader &r) {
    Wheels<float> w;
    w.rear_left = r.f32();
    w.rear_right = r.f32();
    w.front_left = r.f32();
    w.front_right = r.f32();
    return w;
}

inline Wheels<uint16_t> read_wheels_u16(ByteReader &r) {
    Wheels<uint16_t> w;
    w.rear_left = r.u16();
    w.rear_right = r.u16();
    w.front_left = r.u16();
    w.front_right = r.u16();
    return w;
}

inline Wheels<uint8_t> read_wheels_u8(ByteReader &r) {
    Wheels<uint8_t> w;
    w.rear_left = r.u8();
    w.rear_right = r.u8();
    w.front_left = r.u8();
    w.front_right = r.u8();
    return w;
}

inline ZoneFlag read_zone_flag(ByteReader &r, std::string_view field) {
    return enum_in_range<ZoneFlag, int8_t>(r.i8(), -1, 4, field);
}

inline ResultStatus read_result_status(ByteReader &r, std::string_view field) {
    return enum_in_range<ResultStatus, uint8_t>(r.u8(), 0, 6, field);
}

inline ActualTyreCompound read_actual_compound(ByteReader &r, std::string_view field) {
    const uint8_t raw = r.u8();
    if (raw == 0 || raw == 255 || (raw >= 7 && raw <= 20)) {
        return static_cast<ActualTyreCompound>(raw);
    }
    throw DecodeError::malformed(field, raw);
}

inline VisualTyreCompound read_visual_compound(ByteReader &r, std::string_view field) {
    const uint8_t raw = r.u8();
    if (raw == 0 || raw == 255 || (raw >= 7 && raw <= 18)) {
        return static_cast<VisualTyreCompound>(raw);
    }
    throw DecodeError::malformed(field, raw);
}

/// Read a count byte that prefixes a reserved array of `capacity` slots.
inline size_t read_count(ByteReader &r, size_t capacity, std::string_view field) {
    const uint8_t count = r.u8();
    if (count > capacity) {
        throw DecodeError::malformed(field, count);
    }
    return count;
}

} // namespace paddock::protocol
