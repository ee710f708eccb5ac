#include "paddock/protocol/car_status.hpp"

namespace paddock::protocol {

namespace {

CarStatusData read_car_status(ByteReader &r) {
    CarStatusData car;
    car.traction_control =
        enum_in_range<TractionControl, uint8_t>(r.u8(), 0, 2, "car_status.traction_control");
    car.anti_lock_brakes = r.flag();
    car.fuel_mix = enum_in_range<FuelMix, uint8_t>(r.u8(), 0, 3, "car_status.fuel_mix");
    car.front_brake_bias = r.u8();
    car.pit_limiter_status = r.flag();
    car.fuel_in_tank = r.f32();
    car.fuel_capacity = r.f32();
    car.fuel_remaining_laps = r.f32();
    car.max_rpm = r.u16();
    car.idle_rpm = r.u16();
    car.max_gears = r.u8();
    car.drs_allowed = enum_in_range<DrsAllowed, int8_t>(r.i8(), -1, 1, "car_status.drs_allowed");
    car.drs_activation_distance = r.u16();
    car.tyres_wear = read_wheels_u8(r);
    car.actual_tyre_compound = read_actual_compound(r, "car_status.actual_tyre_compound");
    car.visual_tyre_compound = read_visual_compound(r, "car_status.visual_tyre_compound");
    car.tyres_age_laps = r.u8();
    car.tyres_damage = read_wheels_u8(r);
    car.front_left_wing_damage = r.u8();
    car.front_right_wing_damage = r.u8();
    car.rear_wing_damage = r.u8();
    car.drs_fault = r.flag();
    car.engine_damage = r.u8();
    car.gear_box_damage = r.u8();
    car.vehicle_fia_flags = read_zone_flag(r, "car_status.vehicle_fia_flags");
    car.ers_store_energy = r.f32();
    car.ers_deploy_mode =
        enum_in_range<ErsDeployMode, uint8_t>(r.u8(), 0, 3, "car_status.ers_deploy_mode");
    car.ers_harvested_this_lap_mguk = r.f32();
    car.ers_harvested_this_lap_mguh = r.f32();
    car.ers_deployed_this_lap = r.f32();
    return car;
}

} // namespace

PacketCarStatusData decode_car_status(std::span<const uint8_t> body) {
    ByteReader r(body, "car status");
    r.require(kCarStatusBodySize);

    PacketCarStatusData data;
    for (auto &car : data.car_status_data) {
        car = read_car_status(r);
    }
    return data;
}

} // namespace paddock::protocol
