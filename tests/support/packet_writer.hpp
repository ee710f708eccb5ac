#pragma once

#include "paddock/protocol/car_setup.hpp"
#include "paddock/protocol/car_status.hpp"
#include "paddock/protocol/car_telemetry.hpp"
#include "paddock/protocol/event.hpp"
#include "paddock/protocol/final_classification.hpp"
#include "paddock/protocol/header.hpp"
#include "paddock/protocol/lap.hpp"
#include "paddock/protocol/lobby_info.hpp"
#include "paddock/protocol/motion.hpp"
#include "paddock/protocol/participants.hpp"
#include "paddock/protocol/session.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace paddock::test {

/// Little-endian datagram builder for decoder tests.
class PacketWriter {
  public:
    PacketWriter &u8(uint8_t v) {
        buf_.push_back(v);
        return *this;
    }
    PacketWriter &i8(int8_t v) { return u8(std::bit_cast<uint8_t>(v)); }
    PacketWriter &u16(uint16_t v) { return le(v); }
    PacketWriter &i16(int16_t v) { return le(std::bit_cast<uint16_t>(v)); }
    PacketWriter &u32(uint32_t v) { return le(v); }
    PacketWriter &u64(uint64_t v) { return le(v); }
    PacketWriter &f32(float v) { return le(std::bit_cast<uint32_t>(v)); }
    PacketWriter &f64(double v) { return le(std::bit_cast<uint64_t>(v)); }

    PacketWriter &zeros(size_t n) {
        buf_.insert(buf_.end(), n, 0);
        return *this;
    }

    /// NUL-padded fixed-width text field.
    PacketWriter &text(std::string_view s, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            u8(i < s.size() ? static_cast<uint8_t>(s[i]) : 0);
        }
        return *this;
    }

    PacketWriter &append(std::span<const uint8_t> bytes) {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    /// Overwrite one byte already written.
    PacketWriter &patch(size_t offset, uint8_t v) {
        buf_.at(offset) = v;
        return *this;
    }

    [[nodiscard]] size_t size() const { return buf_.size(); }
    [[nodiscard]] const std::vector<uint8_t> &bytes() const { return buf_; }
    [[nodiscard]] std::span<const uint8_t> span() const { return buf_; }

  private:
    template <typename T> PacketWriter &le(T v) {
        for (size_t i = 0; i < sizeof(T); ++i) {
            buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
        return *this;
    }

    std::vector<uint8_t> buf_;
};

struct HeaderSpec {
    uint16_t packet_format = protocol::kFormat2020;
    uint8_t game_major_version = 1;
    uint8_t game_minor_version = 18;
    uint8_t packet_version = 1;
    uint8_t packet_id = 0;
    uint64_t session_uid = 0x0123456789ABCDEFull;
    float session_time = 12.5f;
    uint32_t frame_identifier = 812;
    uint8_t player_car_index = 0;
    uint8_t secondary_player_car_index = 255;
};

inline PacketWriter &write_header(PacketWriter &w, const HeaderSpec &h) {
    return w.u16(h.packet_format)
        .u8(h.game_major_version)
        .u8(h.game_minor_version)
        .u8(h.packet_version)
        .u8(h.packet_id)
        .u64(h.session_uid)
        .f32(h.session_time)
        .u32(h.frame_identifier)
        .u8(h.player_car_index)
        .u8(h.secondary_player_car_index);
}

/// Body size of each packet kind. All-zero bodies of this size decode successfully,
/// except Event, whose code must be valid.
inline size_t body_size(protocol::PacketId id) {
    using namespace paddock::protocol;
    switch (id) {
    case PacketId::Motion:
        return kMotionBodySize;
    case PacketId::Session:
        return kSessionBodySize;
    case PacketId::LapData:
        return kLapBodySize;
    case PacketId::Event:
        return kEventBodySize;
    case PacketId::Participants:
        return kParticipantsBodySize;
    case PacketId::CarSetups:
        return kCarSetupsBodySize;
    case PacketId::CarTelemetry:
        return kCarTelemetryBodySize;
    case PacketId::CarStatus:
        return kCarStatusBodySize;
    case PacketId::FinalClassification:
        return kFinalClassificationBodySize;
    case PacketId::LobbyInfo:
        return kLobbyInfoBodySize;
    }
    return 0;
}

/// Header followed by `body`.
inline std::vector<uint8_t> make_datagram(const HeaderSpec &h, std::span<const uint8_t> body) {
    PacketWriter w;
    write_header(w, h).append(body);
    return w.bytes();
}

/// Header followed by a valid minimal body for `id` (zeros; "SSTA" for Event).
inline std::vector<uint8_t> make_datagram(protocol::PacketId id, HeaderSpec h = {}) {
    h.packet_id = static_cast<uint8_t>(id);
    PacketWriter body;
    if (id == protocol::PacketId::Event) {
        body.text("SSTA", 4).zeros(protocol::kEventDetailsSize);
    } else {
        body.zeros(body_size(id));
    }
    return make_datagram(h, body.span());
}

} // namespace paddock::test
