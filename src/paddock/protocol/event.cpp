#include "paddock/protocol/event.hpp"

#include "paddock/protocol/byte_reader.hpp"

#include <cstdio>
#include <string>

namespace paddock::protocol {

namespace {

/// Printable form of a raw event code; bytes outside ASCII 0x20..0x7e become \xNN.
std::string escape_code(std::string_view code) {
    std::string out;
    for (char c : code) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x20 && byte < 0x7f) {
            out += c;
        } else {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "\\x%02x", byte);
            out += hex;
        }
    }
    return out;
}

} // namespace

PacketEventData decode_event(std::span<const uint8_t> body) {
    ByteReader r(body, "event");
    r.require(kEventBodySize);

    PacketEventData event;
    for (auto &c : event.event_code) {
        c = static_cast<char>(r.u8());
    }

    // Details are read from the union bytes; unused trailing union bytes are ignored.
    const std::string_view code = event.code();
    if (code == "SSTA") {
        event.details = SessionStarted{};
    } else if (code == "SEND") {
        event.details = SessionEnded{};
    } else if (code == "FTLP") {
        FastestLap d;
        d.vehicle_idx = r.u8();
        d.lap_time = r.f32();
        event.details = d;
    } else if (code == "RTMT") {
        event.details = Retirement{r.u8()};
    } else if (code == "DRSE") {
        event.details = DrsEnabled{};
    } else if (code == "DRSD") {
        event.details = DrsDisabled{};
    } else if (code == "TMPT") {
        event.details = TeamMateInPits{r.u8()};
    } else if (code == "CHQF") {
        event.details = ChequeredFlag{};
    } else if (code == "RCWN") {
        event.details = RaceWinner{r.u8()};
    } else if (code == "PENA") {
        Penalty d;
        d.penalty_type = enum_in_range<PenaltyType, uint8_t>(r.u8(), 0, 17, "event.penalty_type");
        d.infringement_type =
            enum_in_range<InfringementType, uint8_t>(r.u8(), 0, 51, "event.infringement_type");
        d.vehicle_idx = r.u8();
        d.other_vehicle_idx = r.u8();
        d.time = r.u8();
        d.lap_num = r.u8();
        d.places_gained = r.u8();
        event.details = d;
    } else if (code == "SPTP") {
        SpeedTrap d;
        d.vehicle_idx = r.u8();
        d.speed = r.f32();
        event.details = d;
    } else {
        throw DecodeError(ErrorKind::MalformedField,
                          "Unknown event code '" + escape_code(code) + "'", "event.event_code");
    }
    return event;
}

} // namespace paddock::protocol
