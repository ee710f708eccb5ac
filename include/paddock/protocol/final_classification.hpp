#pragma once

#include "paddock/protocol/common.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace paddock::protocol {

inline constexpr size_t kMaxTyreStints = 8;
inline constexpr size_t kFinalClassificationSize = 21 + 2 * kMaxTyreStints;
inline constexpr size_t kFinalClassificationBodySize = 1 + kMaxCars * kFinalClassificationSize;

struct FinalClassificationData {
    uint8_t position = 0;
    uint8_t num_laps = 0;
    uint8_t grid_position = 0;
    uint8_t points = 0;
    uint8_t num_pit_stops = 0;
    ResultStatus result_status = ResultStatus::Invalid;
    float best_lap_time = 0.0f;    // seconds
    double total_race_time = 0.0;  // seconds, without penalties
    uint8_t penalties_time = 0;    // seconds
    uint8_t num_penalties = 0;
    uint8_t num_tyre_stints = 0;
    std::array<ActualTyreCompound, kMaxTyreStints> tyre_stints_actual{};
    std::array<VisualTyreCompound, kMaxTyreStints> tyre_stints_visual{};
};

struct PacketFinalClassificationData {
    uint8_t num_cars = 0;
    std::vector<FinalClassificationData> classification; // num_cars entries
};

PacketFinalClassificationData decode_final_classification(std::span<const uint8_t> body);

} // namespace paddock::protocol
