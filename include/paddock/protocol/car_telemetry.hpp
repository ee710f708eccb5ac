#pragma once

#include "paddock/protocol/common.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace paddock::protocol {

inline constexpr size_t kCarTelemetrySize = 58;
inline constexpr size_t kCarTelemetryBodySize = kMaxCars * kCarTelemetrySize + 7;

enum class SurfaceType : uint8_t {
    Tarmac,
    RumbleStrip,
    Concrete,
    Rock,
    Gravel,
    Mud,
    Sand,
    Grass,
    Water,
    Cobblestone,
    Metal,
    Ridged,
};

enum class MfdPanel : uint8_t {
    CarSetup = 0,
    Pits = 1,
    Damage = 2,
    Engine = 3,
    Temperatures = 4,
    Closed = 255,
};

struct CarTelemetryData {
    uint16_t speed = 0; // km/h
    float throttle = 0.0f; // 0.0 - 1.0
    float steer = 0.0f;    // -1.0 (full left) - 1.0 (full right)
    float brake = 0.0f;
    uint8_t clutch = 0; // 0 - 100
    int8_t gear = 0;    // -1 = R, 0 = N
    uint16_t engine_rpm = 0;
    bool drs = false;
    uint8_t rev_lights_percent = 0;
    Wheels<uint16_t> brakes_temperature;
    Wheels<uint8_t> tyres_surface_temperature;
    Wheels<uint8_t> tyres_inner_temperature;
    uint16_t engine_temperature = 0;
    Wheels<float> tyres_pressure;
    Wheels<SurfaceType> surface_type;
};

struct PacketCarTelemetryData {
    std::array<CarTelemetryData, kMaxCars> car_telemetry_data{};
    uint32_t button_status = 0; // bit flags of pressed buttons
    MfdPanel mfd_panel_index = MfdPanel::Closed;
    MfdPanel mfd_panel_index_secondary_player = MfdPanel::Closed;
    int8_t suggested_gear = 0; // 0 if no suggestion
};

PacketCarTelemetryData decode_car_telemetry(std::span<const uint8_t> body);

} // namespace paddock::protocol
