#include "paddock/protocol/event.hpp"
#include "paddock/protocol/errors.hpp"
#include "support/packet_writer.hpp"

#include <gtest/gtest.h>

using namespace paddock;
using namespace paddock::protocol;
using paddock::test::PacketWriter;

namespace {

PacketWriter event(std::string_view code) {
    PacketWriter w;
    w.text(code, kEventCodeSize);
    return w;
}

std::vector<uint8_t> padded(PacketWriter w) {
    w.zeros(kEventBodySize - w.size());
    return w.bytes();
}

} // namespace

TEST(EventDecoder, MarkerEventsCarryNoDetails) {
    const auto body = padded(event("SSTA"));
    const PacketEventData e = decode_event(body);
    EXPECT_EQ(e.code(), "SSTA");
    EXPECT_TRUE(std::holds_alternative<SessionStarted>(e.details));

    EXPECT_TRUE(std::holds_alternative<SessionEnded>(decode_event(padded(event("SEND"))).details));
    EXPECT_TRUE(std::holds_alternative<DrsEnabled>(decode_event(padded(event("DRSE"))).details));
    EXPECT_TRUE(std::holds_alternative<DrsDisabled>(decode_event(padded(event("DRSD"))).details));
    EXPECT_TRUE(
        std::holds_alternative<ChequeredFlag>(decode_event(padded(event("CHQF"))).details));
}

TEST(EventDecoder, FastestLap) {
    const auto body = padded(event("FTLP").u8(7).f32(78.123f));
    const PacketEventData e = decode_event(body);
    const auto *d = std::get_if<FastestLap>(&e.details);
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->vehicle_idx, 7);
    EXPECT_FLOAT_EQ(d->lap_time, 78.123f);
}

TEST(EventDecoder, VehicleEvents) {
    EXPECT_EQ(std::get<Retirement>(decode_event(padded(event("RTMT").u8(4))).details).vehicle_idx,
              4);
    EXPECT_EQ(
        std::get<TeamMateInPits>(decode_event(padded(event("TMPT").u8(9))).details).vehicle_idx,
        9);
    EXPECT_EQ(std::get<RaceWinner>(decode_event(padded(event("RCWN").u8(0))).details).vehicle_idx,
              0);
}

TEST(EventDecoder, Penalty) {
    const auto body = padded(event("PENA").u8(4).u8(17).u8(3).u8(255).u8(5).u8(12).u8(0));
    const auto d = std::get<Penalty>(decode_event(body).details);
    EXPECT_EQ(d.penalty_type, PenaltyType::TimePenalty);
    EXPECT_EQ(d.infringement_type, InfringementType::PitLaneSpeeding);
    EXPECT_EQ(d.vehicle_idx, 3);
    EXPECT_EQ(d.other_vehicle_idx, 255);
    EXPECT_EQ(d.time, 5);
    EXPECT_EQ(d.lap_num, 12);
    EXPECT_EQ(d.places_gained, 0);
}

TEST(EventDecoder, SpeedTrap) {
    const auto body = padded(event("SPTP").u8(11).f32(331.7f));
    const auto d = std::get<SpeedTrap>(decode_event(body).details);
    EXPECT_EQ(d.vehicle_idx, 11);
    EXPECT_FLOAT_EQ(d.speed, 331.7f);
}

TEST(EventDecoder, UnknownCodeIsMalformed) {
    try {
        decode_event(padded(event("XXXX")));
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedField);
        EXPECT_EQ(e.field(), "event.event_code");
    }
}

TEST(EventDecoder, UnprintableCodeIsEscapedInMessage) {
    PacketWriter w;
    w.u8('S').u8(0).u8(0x7f).u8('A');
    try {
        decode_event(padded(w));
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        const std::string what = e.what();
        EXPECT_EQ(what.find('\0'), std::string::npos);
        EXPECT_NE(what.find("'S\\x00\\x7fA'"), std::string::npos) << what;
    }
}

TEST(EventDecoder, BadPenaltyTypeIsMalformed) {
    try {
        decode_event(padded(event("PENA").u8(18)));
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.field(), "event.penalty_type");
    }
}

TEST(EventDecoder, ShortBodyIsTruncated) {
    // A bare code without the details union.
    const auto w = event("SSTA");
    try {
        decode_event(w.span());
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Truncated);
    }
}
