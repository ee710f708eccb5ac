#include "paddock/protocol/car_telemetry.hpp"

namespace paddock::protocol {

namespace {

SurfaceType read_surface(ByteReader &r) {
    return enum_in_range<SurfaceType, uint8_t>(r.u8(), 0, 11, "car_telemetry.surface_type");
}

MfdPanel read_mfd_panel(ByteReader &r, std::string_view field) {
    const uint8_t raw = r.u8();
    if (raw <= 4 || raw == 255) {
        return static_cast<MfdPanel>(raw);
    }
    throw DecodeError::malformed(field, raw);
}

CarTelemetryData read_car_telemetry(ByteReader &r) {
    CarTelemetryData car;
    car.speed = r.u16();
    car.throttle = r.f32();
    car.steer = r.f32();
    car.brake = r.f32();
    car.clutch = r.u8();
    car.gear = r.i8();
    car.engine_rpm = r.u16();
    car.drs = r.flag();
    car.rev_lights_percent = r.u8();
    car.brakes_temperature = read_wheels_u16(r);
    car.tyres_surface_temperature = read_wheels_u8(r);
    car.tyres_inner_temperature = read_wheels_u8(r);
    car.engine_temperature = r.u16();
    car.tyres_pressure = read_wheels_f32(r);
    car.surface_type.rear_left = read_surface(r);
    car.surface_type.rear_right = read_surface(r);
    car.surface_type.front_left = read_surface(r);
    car.surface_type.front_right = read_surface(r);
    return car;
}

} // namespace

PacketCarTelemetryData decode_car_telemetry(std::span<const uint8_t> body) {
    ByteReader r(body, "car telemetry");
    r.require(kCarTelemetryBodySize);

    PacketCarTelemetryData data;
    for (auto &car : data.car_telemetry_data) {
        car = read_car_telemetry(r);
    }
    data.button_status = r.u32();
    data.mfd_panel_index = read_mfd_panel(r, "car_telemetry.mfd_panel_index");
    data.mfd_panel_index_secondary_player =
        read_mfd_panel(r, "car_telemetry.mfd_panel_index_secondary_player");
    data.suggested_gear = r.i8();
    return data;
}

} // namespace paddock::protocol
