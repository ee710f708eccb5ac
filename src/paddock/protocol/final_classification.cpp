#include "paddock/protocol/final_classification.hpp"

namespace paddock::protocol {

PacketFinalClassificationData decode_final_classification(std::span<const uint8_t> body) {
    ByteReader r(body, "final classification");

    PacketFinalClassificationData data;
    const size_t count = read_count(r, kMaxCars, "final_classification.num_cars");
    data.num_cars = static_cast<uint8_t>(count);
    r.require(count * kFinalClassificationSize);

    data.classification.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        FinalClassificationData car;
        car.position = r.u8();
        car.num_laps = r.u8();
        car.grid_position = r.u8();
        car.points = r.u8();
        car.num_pit_stops = r.u8();
        car.result_status = read_result_status(r, "final_classification.result_status");
        car.best_lap_time = r.f32();
        car.total_race_time = r.f64();
        car.penalties_time = r.u8();
        car.num_penalties = r.u8();
        car.num_tyre_stints = static_cast<uint8_t>(
            read_count(r, kMaxTyreStints, "final_classification.num_tyre_stints"));
        for (auto &stint : car.tyre_stints_actual) {
            stint = read_actual_compound(r, "final_classification.tyre_stints_actual");
        }
        for (auto &stint : car.tyre_stints_visual) {
            stint = read_visual_compound(r, "final_classification.tyre_stints_visual");
        }
        data.classification.push_back(car);
    }
    return data;
}

} // namespace paddock::protocol
