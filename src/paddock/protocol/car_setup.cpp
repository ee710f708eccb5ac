#include "paddock/protocol/car_setup.hpp"

namespace paddock::protocol {

PacketCarSetupData decode_car_setups(std::span<const uint8_t> body) {
    ByteReader r(body, "car setups");
    r.require(kCarSetupsBodySize);

    PacketCarSetupData data;
    for (auto &setup : data.car_setups) {
        setup.front_wing = r.u8();
        setup.rear_wing = r.u8();
        setup.on_throttle = r.u8();
        setup.off_throttle = r.u8();
        setup.front_camber = r.f32();
        setup.rear_camber = r.f32();
        setup.front_toe = r.f32();
        setup.rear_toe = r.f32();
        setup.front_suspension = r.u8();
        setup.rear_suspension = r.u8();
        setup.front_anti_roll_bar = r.u8();
        setup.rear_anti_roll_bar = r.u8();
        setup.front_suspension_height = r.u8();
        setup.rear_suspension_height = r.u8();
        setup.brake_pressure = r.u8();
        setup.brake_bias = r.u8();
        setup.tyre_pressure = read_wheels_f32(r);
        setup.ballast = r.u8();
        setup.fuel_load = r.f32();
    }
    return data;
}

} // namespace paddock::protocol
