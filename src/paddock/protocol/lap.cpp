#include "paddock/protocol/lap.hpp"

namespace paddock::protocol {

namespace {

LapData read_lap(ByteReader &r) {
    LapData lap;
    lap.last_lap_time = r.f32();
    lap.current_lap_time = r.f32();
    lap.sector1_time_ms = r.u16();
    lap.sector2_time_ms = r.u16();
    lap.best_lap_time = r.f32();
    lap.best_lap_num = r.u8();
    lap.best_lap_sector1_time_ms = r.u16();
    lap.best_lap_sector2_time_ms = r.u16();
    lap.best_lap_sector3_time_ms = r.u16();
    lap.best_overall_sector1_time_ms = r.u16();
    lap.best_overall_sector1_lap_num = r.u8();
    lap.best_overall_sector2_time_ms = r.u16();
    lap.best_overall_sector2_lap_num = r.u8();
    lap.best_overall_sector3_time_ms = r.u16();
    lap.best_overall_sector3_lap_num = r.u8();
    lap.lap_distance = r.f32();
    lap.total_distance = r.f32();
    lap.safety_car_delta = r.f32();
    lap.car_position = r.u8();
    lap.current_lap_num = r.u8();
    lap.pit_status = enum_in_range<PitStatus, uint8_t>(r.u8(), 0, 2, "lap.pit_status");
    lap.sector = r.u8();
    lap.current_lap_invalid = r.flag();
    lap.penalties = r.u8();
    lap.grid_position = r.u8();
    lap.driver_status = enum_in_range<DriverStatus, uint8_t>(r.u8(), 0, 4, "lap.driver_status");
    lap.result_status = read_result_status(r, "lap.result_status");
    return lap;
}

} // namespace

PacketLapData decode_lap_data(std::span<const uint8_t> body) {
    ByteReader r(body, "lap data");
    r.require(kLapBodySize);

    PacketLapData laps;
    for (auto &lap : laps.lap_data) {
        lap = read_lap(r);
    }
    return laps;
}

} // namespace paddock::protocol
