#include "paddock/protocol/participants.hpp"

#include <utility>

namespace paddock::protocol {

PacketParticipantsData decode_participants(std::span<const uint8_t> body) {
    ByteReader r(body, "participants");

    PacketParticipantsData data;
    const size_t count = read_count(r, kMaxCars, "participants.num_active_cars");
    data.num_active_cars = static_cast<uint8_t>(count);
    r.require(count * kParticipantSize);

    data.participants.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        ParticipantData p;
        p.ai_controlled = r.flag();
        p.driver_id = r.u8();
        p.team_id = r.u8();
        p.race_number = r.u8();
        p.nationality = r.u8();
        p.name = r.fixed_string(kNameLength);
        p.your_telemetry =
            enum_in_range<TelemetrySetting, uint8_t>(r.u8(), 0, 1, "participants.your_telemetry");
        data.participants.push_back(std::move(p));
    }
    return data;
}

} // namespace paddock::protocol
