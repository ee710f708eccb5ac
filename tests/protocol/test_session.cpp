#include "paddock/protocol/session.hpp"
#include "support/packet_writer.hpp"

#include <gtest/gtest.h>

using namespace paddock;
using namespace paddock::protocol;
using paddock::test::PacketWriter;

namespace {

struct SessionBody {
    uint8_t weather = 3;
    uint8_t num_zones = 2;
    uint8_t num_samples = 3;
    int8_t zone_flag = 3;
};

std::vector<uint8_t> session_body(const SessionBody &s = {}) {
    PacketWriter w;
    w.u8(s.weather).i8(31).i8(22).u8(58).u16(5891);
    w.u8(10)   // Race
        .i8(7) // Silverstone
        .u8(0)
        .u16(3600)
        .u16(7200)
        .u8(80)
        .u8(0)
        .u8(0)
        .u8(0)
        .u8(0);
    w.u8(s.num_zones);
    for (size_t i = 0; i < kMaxMarshalZones; ++i) {
        w.f32(static_cast<float>(i) / 21.0f).i8(i == 1 ? s.zone_flag : 0);
    }
    w.u8(2).u8(1); // virtual safety car, online
    w.u8(s.num_samples);
    for (size_t i = 0; i < kMaxWeatherForecastSamples; ++i) {
        w.u8(10).u8(static_cast<uint8_t>(i * 5)).u8(4).i8(30).i8(-2);
    }
    return w.bytes();
}

} // namespace

TEST(SessionDecoder, BodySizeMatchesLayout) {
    EXPECT_EQ(kSessionBodySize, 227u);
    EXPECT_EQ(session_body().size(), kSessionBodySize);
}

TEST(SessionDecoder, DecodesFields) {
    const PacketSessionData s = decode_session(session_body());

    EXPECT_EQ(s.weather, Weather::LightRain);
    EXPECT_EQ(s.track_temperature, 31);
    EXPECT_EQ(s.air_temperature, 22);
    EXPECT_EQ(s.total_laps, 58);
    EXPECT_EQ(s.track_length, 5891);
    EXPECT_EQ(s.session_type, SessionType::Race);
    EXPECT_EQ(s.track_id, Track::Silverstone);
    EXPECT_EQ(s.formula, Formula::F1Modern);
    EXPECT_EQ(s.session_time_left, 3600);
    EXPECT_EQ(s.session_duration, 7200);
    EXPECT_EQ(s.pit_speed_limit, 80);
    EXPECT_EQ(s.safety_car_status, SafetyCarStatus::Virtual);
    EXPECT_EQ(s.network_game, NetworkGame::Online);

    ASSERT_EQ(s.marshal_zones.size(), 2u);
    EXPECT_FLOAT_EQ(s.marshal_zones[1].zone_start, 1.0f / 21.0f);
    EXPECT_EQ(s.marshal_zones[1].zone_flag, ZoneFlag::Yellow);

    ASSERT_EQ(s.weather_forecast_samples.size(), 3u);
    EXPECT_EQ(s.weather_forecast_samples[2].session_type, SessionType::Race);
    EXPECT_EQ(s.weather_forecast_samples[2].time_offset, 10);
    EXPECT_EQ(s.weather_forecast_samples[2].weather, Weather::HeavyRain);
    EXPECT_EQ(s.weather_forecast_samples[2].air_temperature, -2);
}

TEST(SessionDecoder, UnknownTrackIsAccepted) {
    auto body = session_body();
    body[7] = 0xFF; // track_id -1
    EXPECT_EQ(decode_session(body).track_id, Track::Unknown);
}

TEST(SessionDecoder, BadWeatherIsMalformed) {
    SessionBody spec;
    spec.weather = 6;
    try {
        decode_session(session_body(spec));
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedField);
        EXPECT_EQ(e.field(), "session.weather");
    }
}

TEST(SessionDecoder, TooManyMarshalZonesIsMalformed) {
    SessionBody spec;
    spec.num_zones = 22;
    try {
        decode_session(session_body(spec));
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedField);
        EXPECT_EQ(e.field(), "session.num_marshal_zones");
    }
}

TEST(SessionDecoder, UnusedZoneSlotsAreNotValidated) {
    SessionBody spec;
    spec.num_zones = 1;
    spec.zone_flag = 99; // lives in slot 1, beyond num_zones
    const PacketSessionData s = decode_session(session_body(spec));
    EXPECT_EQ(s.marshal_zones.size(), 1u);
}

TEST(SessionDecoder, BadZoneFlagIsMalformed) {
    SessionBody spec;
    spec.zone_flag = 5;
    try {
        decode_session(session_body(spec));
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.field(), "session.marshal_zones.zone_flag");
    }
}

TEST(SessionDecoder, ShortBodyIsTruncated) {
    const auto body = session_body();
    EXPECT_THROW(decode_session(std::span<const uint8_t>(body.data(), kSessionBodySize - 1)),
                 DecodeError);
}
