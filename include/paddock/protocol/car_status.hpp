#pragma once

#include "paddock/protocol/common.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace paddock::protocol {

inline constexpr size_t kCarStatusSize = 60;
inline constexpr size_t kCarStatusBodySize = kMaxCars * kCarStatusSize;

enum class TractionControl : uint8_t { Off, Low, High };

enum class FuelMix : uint8_t { Lean, Standard, Rich, Max };

enum class DrsAllowed : int8_t { Unknown = -1, NotAllowed = 0, Allowed = 1 };

enum class ErsDeployMode : uint8_t { None, Medium, Overtake, Hotlap };

struct CarStatusData {
    TractionControl traction_control = TractionControl::Off;
    bool anti_lock_brakes = false;
    FuelMix fuel_mix = FuelMix::Lean;
    uint8_t front_brake_bias = 0; // percent
    bool pit_limiter_status = false;
    float fuel_in_tank = 0.0f;
    float fuel_capacity = 0.0f;
    float fuel_remaining_laps = 0.0f;
    uint16_t max_rpm = 0;
    uint16_t idle_rpm = 0;
    uint8_t max_gears = 0;
    DrsAllowed drs_allowed = DrsAllowed::NotAllowed;
    uint16_t drs_activation_distance = 0; // metres, 0 = DRS not available
    Wheels<uint8_t> tyres_wear;           // percent
    ActualTyreCompound actual_tyre_compound = ActualTyreCompound::Unknown;
    VisualTyreCompound visual_tyre_compound = VisualTyreCompound::Unknown;
    uint8_t tyres_age_laps = 0;
    Wheels<uint8_t> tyres_damage; // percent
    uint8_t front_left_wing_damage = 0;
    uint8_t front_right_wing_damage = 0;
    uint8_t rear_wing_damage = 0;
    bool drs_fault = false;
    uint8_t engine_damage = 0;
    uint8_t gear_box_damage = 0;
    ZoneFlag vehicle_fia_flags = ZoneFlag::None;
    float ers_store_energy = 0.0f; // joules
    ErsDeployMode ers_deploy_mode = ErsDeployMode::None;
    float ers_harvested_this_lap_mguk = 0.0f;
    float ers_harvested_this_lap_mguh = 0.0f;
    float ers_deployed_this_lap = 0.0f;
};

struct PacketCarStatusData {
    std::array<CarStatusData, kMaxCars> car_status_data{};
};

PacketCarStatusData decode_car_status(std::span<const uint8_t> body);

} // namespace paddock::protocol
