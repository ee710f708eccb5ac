#include "paddock/protocol/session.hpp"

namespace paddock::protocol {

namespace {

Weather read_weather(ByteReader &r, std::string_view field) {
    return enum_in_range<Weather, uint8_t>(r.u8(), 0, 5, field);
}

SessionType read_session_type(ByteReader &r, std::string_view field) {
    return enum_in_range<SessionType, uint8_t>(r.u8(), 0, 12, field);
}

} // namespace

PacketSessionData decode_session(std::span<const uint8_t> body) {
    ByteReader r(body, "session");
    r.require(kSessionBodySize);

    PacketSessionData session;
    session.weather = read_weather(r, "session.weather");
    session.track_temperature = r.i8();
    session.air_temperature = r.i8();
    session.total_laps = r.u8();
    session.track_length = r.u16();
    session.session_type = read_session_type(r, "session.session_type");
    session.track_id = enum_in_range<Track, int8_t>(r.i8(), -1, 26, "session.track_id");
    session.formula = enum_in_range<Formula, uint8_t>(r.u8(), 0, 3, "session.formula");
    session.session_time_left = r.u16();
    session.session_duration = r.u16();
    session.pit_speed_limit = r.u8();
    session.game_paused = r.u8();
    session.is_spectating = r.u8();
    session.spectator_car_index = r.u8();
    session.sli_pro_native_support = r.u8();

    const size_t num_zones = read_count(r, kMaxMarshalZones, "session.num_marshal_zones");
    session.marshal_zones.reserve(num_zones);
    for (size_t i = 0; i < num_zones; ++i) {
        MarshalZone zone;
        zone.zone_start = r.f32();
        zone.zone_flag = read_zone_flag(r, "session.marshal_zones.zone_flag");
        session.marshal_zones.push_back(zone);
    }
    r.skip((kMaxMarshalZones - num_zones) * kMarshalZoneSize);

    session.safety_car_status =
        enum_in_range<SafetyCarStatus, uint8_t>(r.u8(), 0, 2, "session.safety_car_status");
    session.network_game =
        enum_in_range<NetworkGame, uint8_t>(r.u8(), 0, 1, "session.network_game");

    const size_t num_samples =
        read_count(r, kMaxWeatherForecastSamples, "session.num_weather_forecast_samples");
    session.weather_forecast_samples.reserve(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        WeatherForecastSample sample;
        sample.session_type = read_session_type(r, "session.weather_forecast.session_type");
        sample.time_offset = r.u8();
        sample.weather = read_weather(r, "session.weather_forecast.weather");
        sample.track_temperature = r.i8();
        sample.air_temperature = r.i8();
        session.weather_forecast_samples.push_back(sample);
    }
    r.skip((kMaxWeatherForecastSamples - num_samples) * kWeatherForecastSampleSize);

    return session;
}

} // namespace paddock::protocol
