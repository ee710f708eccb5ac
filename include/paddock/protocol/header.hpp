#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace paddock::protocol {

/// Packet header: 24 bytes, little-endian, prefixes every datagram.
/// Layout: format(u16) major(u8) minor(u8) packet_version(u8) packet_id(u8)
///         session_uid(u64) session_time(f32) frame(u32) player(u8) secondary_player(u8)
inline constexpr size_t kHeaderSize = 24;

/// Default UDP port the game sends to.
inline constexpr uint16_t kDefaultPort = 20777;

inline constexpr uint16_t kFormat2020 = 2020;

enum class PacketId : uint8_t {
    Motion = 0,
    Session = 1,
    LapData = 2,
    Event = 3,
    Participants = 4,
    CarSetups = 5,
    CarTelemetry = 6,
    CarStatus = 7,
    FinalClassification = 8,
    LobbyInfo = 9,
};

inline constexpr size_t kPacketIdCount = 10;

struct PacketHeader {
    uint16_t packet_format = 0;
    uint8_t game_major_version = 0;
    uint8_t game_minor_version = 0;
    uint8_t packet_version = 0;
    uint8_t packet_id = 0; // raw; see to_packet_id()
    uint64_t session_uid = 0;
    float session_time = 0.0f;
    uint32_t frame_identifier = 0;
    uint8_t player_car_index = 0;
    uint8_t secondary_player_car_index = 255; // 255 if no second player

    bool operator==(const PacketHeader &) const = default;
};

/// Map a raw packet id byte to the enumeration, nullopt if out of range.
[[nodiscard]] std::optional<PacketId> to_packet_id(uint8_t raw);

/// Parse the 24 header bytes without checking the format version.
/// Throws DecodeError(Truncated) if fewer than kHeaderSize bytes are given.
PacketHeader read_header(std::span<const uint8_t> bytes);

/// Parse the header and reject unsupported format versions (default dispatcher's set).
/// On success `body` is set to the bytes after the header.
/// Throws DecodeError(Truncated) or DecodeError(UnsupportedVersion).
PacketHeader decode_header(std::span<const uint8_t> bytes, std::span<const uint8_t> &body);

} // namespace paddock::protocol
