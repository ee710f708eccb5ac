#pragma once

#include "paddock/protocol/common.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace paddock::protocol {

inline constexpr size_t kCarSetupSize = 49;
inline constexpr size_t kCarSetupsBodySize = kMaxCars * kCarSetupSize;

struct CarSetupData {
    uint8_t front_wing = 0;
    uint8_t rear_wing = 0;
    uint8_t on_throttle = 0;  // differential adjustment, percent
    uint8_t off_throttle = 0; // differential adjustment, percent
    float front_camber = 0.0f;
    float rear_camber = 0.0f;
    float front_toe = 0.0f;
    float rear_toe = 0.0f;
    uint8_t front_suspension = 0;
    uint8_t rear_suspension = 0;
    uint8_t front_anti_roll_bar = 0;
    uint8_t rear_anti_roll_bar = 0;
    uint8_t front_suspension_height = 0;
    uint8_t rear_suspension_height = 0;
    uint8_t brake_pressure = 0; // percent
    uint8_t brake_bias = 0;     // percent
    Wheels<float> tyre_pressure; // PSI
    uint8_t ballast = 0;
    float fuel_load = 0.0f;
};

struct PacketCarSetupData {
    std::array<CarSetupData, kMaxCars> car_setups{};
};

PacketCarSetupData decode_car_setups(std::span<const uint8_t> body);

} // namespace paddock::protocol
