#pragma once

#include "paddock/protocol/common.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace paddock::protocol {

inline constexpr size_t kLapDataSize = 53;
inline constexpr size_t kLapBodySize = kMaxCars * kLapDataSize;

enum class PitStatus : uint8_t { None, Pitting, InPitArea };

enum class DriverStatus : uint8_t { InGarage, FlyingLap, InLap, OutLap, OnTrack };

/// Lap timing for one car. Lap times are float seconds, sector times uint16 milliseconds,
/// exactly as sent.
struct LapData {
    float last_lap_time = 0.0f;
    float current_lap_time = 0.0f;
    uint16_t sector1_time_ms = 0;
    uint16_t sector2_time_ms = 0;
    float best_lap_time = 0.0f;
    uint8_t best_lap_num = 0;
    uint16_t best_lap_sector1_time_ms = 0;
    uint16_t best_lap_sector2_time_ms = 0;
    uint16_t best_lap_sector3_time_ms = 0;
    uint16_t best_overall_sector1_time_ms = 0;
    uint8_t best_overall_sector1_lap_num = 0;
    uint16_t best_overall_sector2_time_ms = 0;
    uint8_t best_overall_sector2_lap_num = 0;
    uint16_t best_overall_sector3_time_ms = 0;
    uint8_t best_overall_sector3_lap_num = 0;
    float lap_distance = 0.0f; // metres, may be negative before the line
    float total_distance = 0.0f;
    float safety_car_delta = 0.0f;
    uint8_t car_position = 0;
    uint8_t current_lap_num = 0;
    PitStatus pit_status = PitStatus::None;
    uint8_t sector = 0; // 0 = sector1, 1 = sector2, 2 = sector3
    bool current_lap_invalid = false;
    uint8_t penalties = 0; // accumulated time penalties in seconds
    uint8_t grid_position = 0;
    DriverStatus driver_status = DriverStatus::InGarage;
    ResultStatus result_status = ResultStatus::Invalid;
};

struct PacketLapData {
    std::array<LapData, kMaxCars> lap_data{};
};

PacketLapData decode_lap_data(std::span<const uint8_t> body);

} // namespace paddock::protocol
