#pragma once

#include "paddock/protocol/common.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace paddock::protocol {

inline constexpr size_t kParticipantSize = 5 + kNameLength + 1;
inline constexpr size_t kParticipantsBodySize = 1 + kMaxCars * kParticipantSize;

enum class TelemetrySetting : uint8_t { Restricted, Public };

struct ParticipantData {
    bool ai_controlled = false;
    uint8_t driver_id = 0; // 100+ for network humans
    uint8_t team_id = 0;   // see team_name()
    uint8_t race_number = 0;
    uint8_t nationality = 0;
    std::string name;
    TelemetrySetting your_telemetry = TelemetrySetting::Restricted;
};

struct PacketParticipantsData {
    uint8_t num_active_cars = 0;
    std::vector<ParticipantData> participants; // num_active_cars entries
};

PacketParticipantsData decode_participants(std::span<const uint8_t> body);

} // namespace paddock::protocol
