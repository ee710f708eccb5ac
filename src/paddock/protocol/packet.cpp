#include "paddock/protocol/packet.hpp"
#include "paddock/protocol/names.hpp"

#include <cstdio>
#include <string>

namespace paddock::protocol {

namespace {

template <typename... Fs> struct Overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs> Overloaded(Fs...) -> Overloaded<Fs...>;

std::string format(const char *fmt, auto... args) {
    char buf[160];
    const int n = std::snprintf(buf, sizeof(buf), fmt, args...);
    if (n < 0) {
        return {};
    }
    return std::string(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n)
                                                                 : sizeof(buf) - 1);
}

std::string highlight(const PacketEventData &event) {
    std::string out = " event=" + std::string(event.code());
    std::visit(Overloaded{
                   [](const auto &) {},
                   [&](const FastestLap &d) {
                       out += format(" car=%u lap=%.3fs", d.vehicle_idx, d.lap_time);
                   },
                   [&](const Retirement &d) { out += format(" car=%u", d.vehicle_idx); },
                   [&](const TeamMateInPits &d) { out += format(" car=%u", d.vehicle_idx); },
                   [&](const RaceWinner &d) { out += format(" car=%u", d.vehicle_idx); },
                   [&](const Penalty &d) {
                       out += format(" car=%u penalty=%u infringement=%u", d.vehicle_idx,
                                     static_cast<unsigned>(d.penalty_type),
                                     static_cast<unsigned>(d.infringement_type));
                   },
                   [&](const SpeedTrap &d) {
                       out += format(" car=%u speed=%.1fkm/h", d.vehicle_idx, d.speed);
                   },
               },
               event.details);
    return out;
}

} // namespace

std::string describe(const Packet &packet) {
    const PacketHeader &h = packet.header;
    const size_t player = h.player_car_index;
    const bool has_player = player < kMaxCars;

    std::string line = std::string(packet_id_name(packet.id()));
    line += format(" f%u frame=%u t=%.3fs player=%u", h.packet_format, h.frame_identifier,
                   static_cast<double>(h.session_time), h.player_car_index);

    std::visit(
        Overloaded{
            [&](const PacketMotionData &m) {
                if (has_player) {
                    const CarMotionData &car = m.car_motion_data[player];
                    line += format(" pos=(%.1f,%.1f,%.1f) g_lat=%.2f", car.world_position_x,
                                   car.world_position_y, car.world_position_z,
                                   car.g_force_lateral);
                }
            },
            [&](const PacketSessionData &s) {
                line += " track=" + std::string(track_name(s.track_id));
                line += format(" laps=%u air=%dC track=%dC", s.total_laps, s.air_temperature,
                               s.track_temperature);
            },
            [&](const PacketLapData &l) {
                if (has_player) {
                    const LapData &lap = l.lap_data[player];
                    line += format(" P%u lap=%u last=%.3fs", lap.car_position,
                                   lap.current_lap_num, lap.last_lap_time);
                }
            },
            [&](const PacketEventData &e) { line += highlight(e); },
            [&](const PacketParticipantsData &p) {
                line += format(" cars=%u", p.num_active_cars);
                if (player < p.participants.size()) {
                    const ParticipantData &d = p.participants[player];
                    line += " driver=\"" + d.name + "\" team=" + std::string(team_name(d.team_id));
                }
            },
            [&](const PacketCarSetupData &c) {
                if (has_player) {
                    const CarSetupData &s = c.car_setups[player];
                    line += format(" wings=%u/%u fuel=%.1fkg", s.front_wing, s.rear_wing,
                                   s.fuel_load);
                }
            },
            [&](const PacketCarTelemetryData &t) {
                if (has_player) {
                    const CarTelemetryData &car = t.car_telemetry_data[player];
                    line += format(" speed=%ukm/h gear=%d rpm=%u", car.speed, car.gear,
                                   car.engine_rpm);
                }
            },
            [&](const PacketCarStatusData &c) {
                if (has_player) {
                    const CarStatusData &s = c.car_status_data[player];
                    line += format(" fuel=%.2fkg tyre=", s.fuel_in_tank);
                    line += compound_label(s.visual_tyre_compound);
                    line += format(" age=%u", s.tyres_age_laps);
                }
            },
            [&](const PacketFinalClassificationData &f) {
                line += format(" cars=%u", f.num_cars);
                if (player < f.classification.size()) {
                    const FinalClassificationData &d = f.classification[player];
                    line += format(" P%u points=%u", d.position, d.points);
                }
            },
            [&](const PacketLobbyInfoData &l) { line += format(" players=%u", l.num_players); },
        },
        packet.body);
    return line;
}

} // namespace paddock::protocol
