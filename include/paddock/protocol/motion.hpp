#pragma once

#include "paddock/protocol/common.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace paddock::protocol {

/// Motion body: 22 x 60-byte car records + 120 bytes of player-only data.
inline constexpr size_t kCarMotionSize = 60;
inline constexpr size_t kMotionBodySize = kMaxCars * kCarMotionSize + 120;

struct CarMotionData {
    float world_position_x = 0.0f; // metres
    float world_position_y = 0.0f;
    float world_position_z = 0.0f;
    float world_velocity_x = 0.0f; // metres per second
    float world_velocity_y = 0.0f;
    float world_velocity_z = 0.0f;
    // Direction vectors normalised to 32767.
    int16_t world_forward_dir_x = 0;
    int16_t world_forward_dir_y = 0;
    int16_t world_forward_dir_z = 0;
    int16_t world_right_dir_x = 0;
    int16_t world_right_dir_y = 0;
    int16_t world_right_dir_z = 0;
    float g_force_lateral = 0.0f;
    float g_force_longitudinal = 0.0f;
    float g_force_vertical = 0.0f;
    float yaw = 0.0f; // radians
    float pitch = 0.0f;
    float roll = 0.0f;
};

struct PacketMotionData {
    std::array<CarMotionData, kMaxCars> car_motion_data{};

    // Player car only.
    Wheels<float> suspension_position;
    Wheels<float> suspension_velocity;
    Wheels<float> suspension_acceleration;
    Wheels<float> wheel_speed;
    Wheels<float> wheel_slip;
    float local_velocity_x = 0.0f;
    float local_velocity_y = 0.0f;
    float local_velocity_z = 0.0f;
    float angular_velocity_x = 0.0f;
    float angular_velocity_y = 0.0f;
    float angular_velocity_z = 0.0f;
    float angular_acceleration_x = 0.0f;
    float angular_acceleration_y = 0.0f;
    float angular_acceleration_z = 0.0f;
    float front_wheels_angle = 0.0f; // radians
};

PacketMotionData decode_motion(std::span<const uint8_t> body);

} // namespace paddock::protocol
