#pragma once

#include "paddock/protocol/common.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace paddock::protocol {

inline constexpr size_t kMaxMarshalZones = 21;
inline constexpr size_t kMaxWeatherForecastSamples = 20;
inline constexpr size_t kMarshalZoneSize = 5;
inline constexpr size_t kWeatherForecastSampleSize = 5;

/// 19 fixed bytes, 21 reserved zone slots, 3 bytes, 20 reserved forecast slots.
inline constexpr size_t kSessionBodySize = 19 + kMaxMarshalZones * kMarshalZoneSize + 3 +
                                           kMaxWeatherForecastSamples * kWeatherForecastSampleSize;

enum class Weather : uint8_t { Clear, LightCloud, Overcast, LightRain, HeavyRain, Storm };

enum class SessionType : uint8_t {
    Unknown,
    P1,
    P2,
    P3,
    ShortPractice,
    Q1,
    Q2,
    Q3,
    ShortQualifying,
    OneShotQualifying,
    Race,
    Race2,
    TimeTrial,
};

enum class Track : int8_t {
    Unknown = -1,
    Melbourne = 0,
    PaulRicard,
    Shanghai,
    Sakhir,
    Catalunya,
    Monaco,
    Montreal,
    Silverstone,
    Hockenheim,
    Hungaroring,
    Spa,
    Monza,
    Singapore,
    Suzuka,
    AbuDhabi,
    Texas,
    Brazil,
    Austria,
    Sochi,
    Mexico,
    Baku,
    SakhirShort,
    SilverstoneShort,
    TexasShort,
    SuzukaShort,
    Hanoi,
    Zandvoort,
};

enum class Formula : uint8_t { F1Modern, F1Classic, F2, F1Generic };

enum class SafetyCarStatus : uint8_t { None, Full, Virtual };

enum class NetworkGame : uint8_t { Offline, Online };

struct MarshalZone {
    float zone_start = 0.0f; // fraction (0..1) of the lap
    ZoneFlag zone_flag = ZoneFlag::None;
};

struct WeatherForecastSample {
    SessionType session_type = SessionType::Unknown;
    uint8_t time_offset = 0; // minutes
    Weather weather = Weather::Clear;
    int8_t track_temperature = 0;
    int8_t air_temperature = 0;
};

struct PacketSessionData {
    Weather weather = Weather::Clear;
    int8_t track_temperature = 0; // degrees celsius
    int8_t air_temperature = 0;
    uint8_t total_laps = 0;
    uint16_t track_length = 0; // metres
    SessionType session_type = SessionType::Unknown;
    Track track_id = Track::Unknown;
    Formula formula = Formula::F1Modern;
    uint16_t session_time_left = 0; // seconds
    uint16_t session_duration = 0;  // seconds
    uint8_t pit_speed_limit = 0;    // km/h
    uint8_t game_paused = 0;
    uint8_t is_spectating = 0;
    uint8_t spectator_car_index = 0;
    uint8_t sli_pro_native_support = 0;
    std::vector<MarshalZone> marshal_zones; // num_marshal_zones entries
    SafetyCarStatus safety_car_status = SafetyCarStatus::None;
    NetworkGame network_game = NetworkGame::Offline;
    std::vector<WeatherForecastSample> weather_forecast_samples;
};

/// Decode a session body. Only the first num_marshal_zones / num_weather_forecast_samples
/// reserved slots are decoded; the remaining slots are skipped unvalidated.
PacketSessionData decode_session(std::span<const uint8_t> body);

} // namespace paddock::protocol
