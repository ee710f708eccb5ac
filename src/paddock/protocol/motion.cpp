#include "paddock/protocol/motion.hpp"

namespace paddock::protocol {

namespace {

CarMotionData read_car_motion(ByteReader &r) {
    CarMotionData car;
    car.world_position_x = r.f32();
    car.world_position_y = r.f32();
    car.world_position_z = r.f32();
    car.world_velocity_x = r.f32();
    car.world_velocity_y = r.f32();
    car.world_velocity_z = r.f32();
    car.world_forward_dir_x = r.i16();
    car.world_forward_dir_y = r.i16();
    car.world_forward_dir_z = r.i16();
    car.world_right_dir_x = r.i16();
    car.world_right_dir_y = r.i16();
    car.world_right_dir_z = r.i16();
    car.g_force_lateral = r.f32();
    car.g_force_longitudinal = r.f32();
    car.g_force_vertical = r.f32();
    car.yaw = r.f32();
    car.pitch = r.f32();
    car.roll = r.f32();
    return car;
}

} // namespace

PacketMotionData decode_motion(std::span<const uint8_t> body) {
    ByteReader r(body, "motion");
    r.require(kMotionBodySize);

    PacketMotionData motion;
    for (auto &car : motion.car_motion_data) {
        car = read_car_motion(r);
    }

    motion.suspension_position = read_wheels_f32(r);
    motion.suspension_velocity = read_wheels_f32(r);
    motion.suspension_acceleration = read_wheels_f32(r);
    motion.wheel_speed = read_wheels_f32(r);
    motion.wheel_slip = read_wheels_f32(r);
    motion.local_velocity_x = r.f32();
    motion.local_velocity_y = r.f32();
    motion.local_velocity_z = r.f32();
    motion.angular_velocity_x = r.f32();
    motion.angular_velocity_y = r.f32();
    motion.angular_velocity_z = r.f32();
    motion.angular_acceleration_x = r.f32();
    motion.angular_acceleration_y = r.f32();
    motion.angular_acceleration_z = r.f32();
    motion.front_wheels_angle = r.f32();
    return motion;
}

} // namespace paddock::protocol
