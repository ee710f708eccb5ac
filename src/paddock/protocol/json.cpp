#include "paddock/protocol/json.hpp"
#include "paddock/protocol/names.hpp"

#include <string>
#include <utility>

namespace paddock::protocol {

template <typename T> void to_json(nlohmann::json &j, const Wheels<T> &w) {
    j = nlohmann::json{{"rear_left", w.rear_left},
                       {"rear_right", w.rear_right},
                       {"front_left", w.front_left},
                       {"front_right", w.front_right}};
}

template <typename T> void from_json(const nlohmann::json &j, Wheels<T> &w) {
    j.at("rear_left").get_to(w.rear_left);
    j.at("rear_right").get_to(w.rear_right);
    j.at("front_left").get_to(w.front_left);
    j.at("front_right").get_to(w.front_right);
}

// --- Enumerations --------------------------------------------------------------

NLOHMANN_JSON_SERIALIZE_ENUM(ZoneFlag, {
                                           {ZoneFlag::Unknown, "Unknown"},
                                           {ZoneFlag::None, "None"},
                                           {ZoneFlag::Green, "Green"},
                                           {ZoneFlag::Blue, "Blue"},
                                           {ZoneFlag::Yellow, "Yellow"},
                                           {ZoneFlag::Red, "Red"},
                                       })

NLOHMANN_JSON_SERIALIZE_ENUM(ResultStatus, {
                                               {ResultStatus::Invalid, "Invalid"},
                                               {ResultStatus::Inactive, "Inactive"},
                                               {ResultStatus::Active, "Active"},
                                               {ResultStatus::Finished, "Finished"},
                                               {ResultStatus::Disqualified, "Disqualified"},
                                               {ResultStatus::NotClassified, "NotClassified"},
                                               {ResultStatus::Retired, "Retired"},
                                           })

NLOHMANN_JSON_SERIALIZE_ENUM(ActualTyreCompound,
                             {
                                 {ActualTyreCompound::Unknown, "Unknown"},
                                 {ActualTyreCompound::Inter, "Inter"},
                                 {ActualTyreCompound::Wet, "Wet"},
                                 {ActualTyreCompound::ClassicDry, "ClassicDry"},
                                 {ActualTyreCompound::ClassicWet, "ClassicWet"},
                                 {ActualTyreCompound::F2SuperSoft, "F2SuperSoft"},
                                 {ActualTyreCompound::F2Soft, "F2Soft"},
                                 {ActualTyreCompound::F2Medium, "F2Medium"},
                                 {ActualTyreCompound::F2Hard, "F2Hard"},
                                 {ActualTyreCompound::F2Wet, "F2Wet"},
                                 {ActualTyreCompound::C5, "C5"},
                                 {ActualTyreCompound::C4, "C4"},
                                 {ActualTyreCompound::C3, "C3"},
                                 {ActualTyreCompound::C2, "C2"},
                                 {ActualTyreCompound::C1, "C1"},
                                 {ActualTyreCompound::NotSet, "NotSet"},
                             })

NLOHMANN_JSON_SERIALIZE_ENUM(VisualTyreCompound,
                             {
                                 {VisualTyreCompound::Unknown, "Unknown"},
                                 {VisualTyreCompound::Inter, "Inter"},
                                 {VisualTyreCompound::Wet, "Wet"},
                                 {VisualTyreCompound::ClassicDry, "ClassicDry"},
                                 {VisualTyreCompound::ClassicWet, "ClassicWet"},
                                 {VisualTyreCompound::F2SuperSoft, "F2SuperSoft"},
                                 {VisualTyreCompound::F2Soft, "F2Soft"},
                                 {VisualTyreCompound::F2Medium, "F2Medium"},
                                 {VisualTyreCompound::F2Hard, "F2Hard"},
                                 {VisualTyreCompound::F2Wet, "F2Wet"},
                                 {VisualTyreCompound::Soft, "Soft"},
                                 {VisualTyreCompound::Medium, "Medium"},
                                 {VisualTyreCompound::Hard, "Hard"},
                                 {VisualTyreCompound::NotSet, "NotSet"},
                             })

NLOHMANN_JSON_SERIALIZE_ENUM(Weather, {
                                          {Weather::Clear, "Clear"},
                                          {Weather::LightCloud, "LightCloud"},
                                          {Weather::Overcast, "Overcast"},
                                          {Weather::LightRain, "LightRain"},
                                          {Weather::HeavyRain, "HeavyRain"},
                                          {Weather::Storm, "Storm"},
                                      })

NLOHMANN_JSON_SERIALIZE_ENUM(SessionType, {
                                              {SessionType::Unknown, "Unknown"},
                                              {SessionType::P1, "P1"},
                                              {SessionType::P2, "P2"},
                                              {SessionType::P3, "P3"},
                                              {SessionType::ShortPractice, "ShortPractice"},
                                              {SessionType::Q1, "Q1"},
                                              {SessionType::Q2, "Q2"},
                                              {SessionType::Q3, "Q3"},
                                              {SessionType::ShortQualifying, "ShortQualifying"},
                                              {SessionType::OneShotQualifying, "OneShotQualifying"},
                                              {SessionType::Race, "Race"},
                                              {SessionType::Race2, "Race2"},
                                              {SessionType::TimeTrial, "TimeTrial"},
                                          })

NLOHMANN_JSON_SERIALIZE_ENUM(Track, {
                                        {Track::Unknown, "Unknown"},
                                        {Track::Melbourne, "Melbourne"},
                                        {Track::PaulRicard, "PaulRicard"},
                                        {Track::Shanghai, "Shanghai"},
                                        {Track::Sakhir, "Sakhir"},
                                        {Track::Catalunya, "Catalunya"},
                                        {Track::Monaco, "Monaco"},
                                        {Track::Montreal, "Montreal"},
                                        {Track::Silverstone, "Silverstone"},
                                        {Track::Hockenheim, "Hockenheim"},
                                        {Track::Hungaroring, "Hungaroring"},
                                        {Track::Spa, "Spa"},
                                        {Track::Monza, "Monza"},
                                        {Track::Singapore, "Singapore"},
                                        {Track::Suzuka, "Suzuka"},
                                        {Track::AbuDhabi, "AbuDhabi"},
                                        {Track::Texas, "Texas"},
                                        {Track::Brazil, "Brazil"},
                                        {Track::Austria, "Austria"},
                                        {Track::Sochi, "Sochi"},
                                        {Track::Mexico, "Mexico"},
                                        {Track::Baku, "Baku"},
                                        {Track::SakhirShort, "SakhirShort"},
                                        {Track::SilverstoneShort, "SilverstoneShort"},
                                        {Track::TexasShort, "TexasShort"},
                                        {Track::SuzukaShort, "SuzukaShort"},
                                        {Track::Hanoi, "Hanoi"},
                                        {Track::Zandvoort, "Zandvoort"},
                                    })

NLOHMANN_JSON_SERIALIZE_ENUM(Formula, {
                                          {Formula::F1Modern, "F1Modern"},
                                          {Formula::F1Classic, "F1Classic"},
                                          {Formula::F2, "F2"},
                                          {Formula::F1Generic, "F1Generic"},
                                      })

NLOHMANN_JSON_SERIALIZE_ENUM(SafetyCarStatus, {
                                                  {SafetyCarStatus::None, "None"},
                                                  {SafetyCarStatus::Full, "Full"},
                                                  {SafetyCarStatus::Virtual, "Virtual"},
                                              })

NLOHMANN_JSON_SERIALIZE_ENUM(NetworkGame, {
                                              {NetworkGame::Offline, "Offline"},
                                              {NetworkGame::Online, "Online"},
                                          })

NLOHMANN_JSON_SERIALIZE_ENUM(PitStatus, {
                                            {PitStatus::None, "None"},
                                            {PitStatus::Pitting, "Pitting"},
                                            {PitStatus::InPitArea, "InPitArea"},
                                        })

NLOHMANN_JSON_SERIALIZE_ENUM(DriverStatus, {
                                               {DriverStatus::InGarage, "InGarage"},
                                               {DriverStatus::FlyingLap, "FlyingLap"},
                                               {DriverStatus::InLap, "InLap"},
                                               {DriverStatus::OutLap, "OutLap"},
                                               {DriverStatus::OnTrack, "OnTrack"},
                                           })

NLOHMANN_JSON_SERIALIZE_ENUM(PenaltyType,
                             {
                                 {PenaltyType::DriveThrough, "DriveThrough"},
                                 {PenaltyType::StopGo, "StopGo"},
                                 {PenaltyType::GridPenalty, "GridPenalty"},
                                 {PenaltyType::PenaltyReminder, "PenaltyReminder"},
                                 {PenaltyType::TimePenalty, "TimePenalty"},
                                 {PenaltyType::Warning, "Warning"},
                                 {PenaltyType::Disqualified, "Disqualified"},
                                 {PenaltyType::RemovedFromFormationLap, "RemovedFromFormationLap"},
                                 {PenaltyType::ParkedTooLongTimer, "ParkedTooLongTimer"},
                                 {PenaltyType::TyreRegulations, "TyreRegulations"},
                                 {PenaltyType::ThisLapInvalidated, "ThisLapInvalidated"},
                                 {PenaltyType::ThisAndNextLapInvalidated,
                                  "ThisAndNextLapInvalidated"},
                                 {PenaltyType::ThisLapInvalidatedWithoutReason,
                                  "ThisLapInvalidatedWithoutReason"},
                                 {PenaltyType::ThisAndNextLapInvalidatedWithoutReason,
                                  "ThisAndNextLapInvalidatedWithoutReason"},
                                 {PenaltyType::ThisAndPreviousLapInvalidated,
                                  "ThisAndPreviousLapInvalidated"},
                                 {PenaltyType::ThisAndPreviousLapInvalidatedWithoutReason,
                                  "ThisAndPreviousLapInvalidatedWithoutReason"},
                                 {PenaltyType::Retired, "Retired"},
                                 {PenaltyType::BlackFlagTimer, "BlackFlagTimer"},
                             })

NLOHMANN_JSON_SERIALIZE_ENUM(
    InfringementType,
    {
        {InfringementType::BlockingBySlowDriving, "BlockingBySlowDriving"},
        {InfringementType::BlockingByWrongWayDriving, "BlockingByWrongWayDriving"},
        {InfringementType::ReversingOffTheStartLine, "ReversingOffTheStartLine"},
        {InfringementType::BigCollision, "BigCollision"},
        {InfringementType::SmallCollision, "SmallCollision"},
        {InfringementType::CollisionFailedToHandBackPositionSingle,
         "CollisionFailedToHandBackPositionSingle"},
        {InfringementType::CollisionFailedToHandBackPositionMultiple,
         "CollisionFailedToHandBackPositionMultiple"},
        {InfringementType::CornerCuttingGainedTime, "CornerCuttingGainedTime"},
        {InfringementType::CornerCuttingOvertakeSingle, "CornerCuttingOvertakeSingle"},
        {InfringementType::CornerCuttingOvertakeMultiple, "CornerCuttingOvertakeMultiple"},
        {InfringementType::CrossedPitExitLane, "CrossedPitExitLane"},
        {InfringementType::IgnoringBlueFlags, "IgnoringBlueFlags"},
        {InfringementType::IgnoringYellowFlags, "IgnoringYellowFlags"},
        {InfringementType::IgnoringDriveThrough, "IgnoringDriveThrough"},
        {InfringementType::TooManyDriveThroughs, "TooManyDriveThroughs"},
        {InfringementType::DriveThroughReminderServeWithinNLaps,
         "DriveThroughReminderServeWithinNLaps"},
        {InfringementType::DriveThroughReminderServeThisLap, "DriveThroughReminderServeThisLap"},
        {InfringementType::PitLaneSpeeding, "PitLaneSpeeding"},
        {InfringementType::ParkedForTooLong, "ParkedForTooLong"},
        {InfringementType::IgnoringTyreRegulations, "IgnoringTyreRegulations"},
        {InfringementType::TooManyPenalties, "TooManyPenalties"},
        {InfringementType::MultipleWarnings, "MultipleWarnings"},
        {InfringementType::ApproachingDisqualification, "ApproachingDisqualification"},
        {InfringementType::TyreRegulationsSelectSingle, "TyreRegulationsSelectSingle"},
        {InfringementType::TyreRegulationsSelectMultiple, "TyreRegulationsSelectMultiple"},
        {InfringementType::LapInvalidatedCornerCutting, "LapInvalidatedCornerCutting"},
        {InfringementType::LapInvalidatedRunningWide, "LapInvalidatedRunningWide"},
        {InfringementType::CornerCuttingRanWideGainedTimeMinor,
         "CornerCuttingRanWideGainedTimeMinor"},
        {InfringementType::CornerCuttingRanWideGainedTimeSignificant,
         "CornerCuttingRanWideGainedTimeSignificant"},
        {InfringementType::CornerCuttingRanWideGainedTimeExtreme,
         "CornerCuttingRanWideGainedTimeExtreme"},
        {InfringementType::LapInvalidatedWallRiding, "LapInvalidatedWallRiding"},
        {InfringementType::LapInvalidatedFlashbackUsed, "LapInvalidatedFlashbackUsed"},
        {InfringementType::LapInvalidatedResetToTrack, "LapInvalidatedResetToTrack"},
        {InfringementType::BlockingThePitlane, "BlockingThePitlane"},
        {InfringementType::JumpStart, "JumpStart"},
        {InfringementType::SafetyCarToCarCollision, "SafetyCarToCarCollision"},
        {InfringementType::SafetyCarIllegalOvertake, "SafetyCarIllegalOvertake"},
        {InfringementType::SafetyCarExceedingAllowedPace, "SafetyCarExceedingAllowedPace"},
        {InfringementType::VirtualSafetyCarExceedingAllowedPace,
         "VirtualSafetyCarExceedingAllowedPace"},
        {InfringementType::FormationLapBelowAllowedSpeed, "FormationLapBelowAllowedSpeed"},
        {InfringementType::RetiredMechanicalFailure, "RetiredMechanicalFailure"},
        {InfringementType::RetiredTerminallyDamaged, "RetiredTerminallyDamaged"},
        {InfringementType::SafetyCarFallingTooFarBack, "SafetyCarFallingTooFarBack"},
        {InfringementType::BlackFlagTimer, "BlackFlagTimer"},
        {InfringementType::UnservedStopGoPenalty, "UnservedStopGoPenalty"},
        {InfringementType::UnservedDriveThroughPenalty, "UnservedDriveThroughPenalty"},
        {InfringementType::EngineComponentChange, "EngineComponentChange"},
        {InfringementType::GearboxChange, "GearboxChange"},
        {InfringementType::LeagueGridPenalty, "LeagueGridPenalty"},
        {InfringementType::RetryPenalty, "RetryPenalty"},
        {InfringementType::IllegalTimeGain, "IllegalTimeGain"},
        {InfringementType::MandatoryPitstop, "MandatoryPitstop"},
    })

NLOHMANN_JSON_SERIALIZE_ENUM(TelemetrySetting, {
                                                   {TelemetrySetting::Restricted, "Restricted"},
                                                   {TelemetrySetting::Public, "Public"},
                                               })

NLOHMANN_JSON_SERIALIZE_ENUM(SurfaceType, {
                                              {SurfaceType::Tarmac, "Tarmac"},
                                              {SurfaceType::RumbleStrip, "RumbleStrip"},
                                              {SurfaceType::Concrete, "Concrete"},
                                              {SurfaceType::Rock, "Rock"},
                                              {SurfaceType::Gravel, "Gravel"},
                                              {SurfaceType::Mud, "Mud"},
                                              {SurfaceType::Sand, "Sand"},
                                              {SurfaceType::Grass, "Grass"},
                                              {SurfaceType::Water, "Water"},
                                              {SurfaceType::Cobblestone, "Cobblestone"},
                                              {SurfaceType::Metal, "Metal"},
                                              {SurfaceType::Ridged, "Ridged"},
                                          })

NLOHMANN_JSON_SERIALIZE_ENUM(MfdPanel, {
                                           {MfdPanel::Closed, "Closed"},
                                           {MfdPanel::CarSetup, "CarSetup"},
                                           {MfdPanel::Pits, "Pits"},
                                           {MfdPanel::Damage, "Damage"},
                                           {MfdPanel::Engine, "Engine"},
                                           {MfdPanel::Temperatures, "Temperatures"},
                                       })

NLOHMANN_JSON_SERIALIZE_ENUM(TractionControl, {
                                                  {TractionControl::Off, "Off"},
                                                  {TractionControl::Low, "Low"},
                                                  {TractionControl::High, "High"},
                                              })

NLOHMANN_JSON_SERIALIZE_ENUM(FuelMix, {
                                          {FuelMix::Lean, "Lean"},
                                          {FuelMix::Standard, "Standard"},
                                          {FuelMix::Rich, "Rich"},
                                          {FuelMix::Max, "Max"},
                                      })

NLOHMANN_JSON_SERIALIZE_ENUM(DrsAllowed, {
                                             {DrsAllowed::Unknown, "Unknown"},
                                             {DrsAllowed::NotAllowed, "NotAllowed"},
                                             {DrsAllowed::Allowed, "Allowed"},
                                         })

NLOHMANN_JSON_SERIALIZE_ENUM(ErsDeployMode, {
                                                {ErsDeployMode::None, "None"},
                                                {ErsDeployMode::Medium, "Medium"},
                                                {ErsDeployMode::Overtake, "Overtake"},
                                                {ErsDeployMode::Hotlap, "Hotlap"},
                                            })

NLOHMANN_JSON_SERIALIZE_ENUM(ReadyStatus, {
                                              {ReadyStatus::NotReady, "NotReady"},
                                              {ReadyStatus::Ready, "Ready"},
                                              {ReadyStatus::Spectating, "Spectating"},
                                          })

// --- Records ---------------------------------------------------------------------

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CarMotionData, world_position_x, world_position_y,
                                   world_position_z, world_velocity_x, world_velocity_y,
                                   world_velocity_z, world_forward_dir_x, world_forward_dir_y,
                                   world_forward_dir_z, world_right_dir_x, world_right_dir_y,
                                   world_right_dir_z, g_force_lateral, g_force_longitudinal,
                                   g_force_vertical, yaw, pitch, roll)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketMotionData, car_motion_data, suspension_position,
                                   suspension_velocity, suspension_acceleration, wheel_speed,
                                   wheel_slip, local_velocity_x, local_velocity_y,
                                   local_velocity_z, angular_velocity_x, angular_velocity_y,
                                   angular_velocity_z, angular_acceleration_x,
                                   angular_acceleration_y, angular_acceleration_z,
                                   front_wheels_angle)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MarshalZone, zone_start, zone_flag)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(WeatherForecastSample, session_type, time_offset, weather,
                                   track_temperature, air_temperature)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketSessionData, weather, track_temperature, air_temperature,
                                   total_laps, track_length, session_type, track_id, formula,
                                   session_time_left, session_duration, pit_speed_limit,
                                   game_paused, is_spectating, spectator_car_index,
                                   sli_pro_native_support, marshal_zones, safety_car_status,
                                   network_game, weather_forecast_samples)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LapData, last_lap_time, current_lap_time, sector1_time_ms,
                                   sector2_time_ms, best_lap_time, best_lap_num,
                                   best_lap_sector1_time_ms, best_lap_sector2_time_ms,
                                   best_lap_sector3_time_ms, best_overall_sector1_time_ms,
                                   best_overall_sector1_lap_num, best_overall_sector2_time_ms,
                                   best_overall_sector2_lap_num, best_overall_sector3_time_ms,
                                   best_overall_sector3_lap_num, lap_distance, total_distance,
                                   safety_car_delta, car_position, current_lap_num, pit_status,
                                   sector, current_lap_invalid, penalties, grid_position,
                                   driver_status, result_status)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketLapData, lap_data)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FastestLap, vehicle_idx, lap_time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Retirement, vehicle_idx)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TeamMateInPits, vehicle_idx)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RaceWinner, vehicle_idx)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Penalty, penalty_type, infringement_type, vehicle_idx,
                                   other_vehicle_idx, time, lap_num, places_gained)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SpeedTrap, vehicle_idx, speed)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ParticipantData, ai_controlled, driver_id, team_id,
                                   race_number, nationality, name, your_telemetry)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketParticipantsData, num_active_cars, participants)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CarSetupData, front_wing, rear_wing, on_throttle,
                                   off_throttle, front_camber, rear_camber, front_toe, rear_toe,
                                   front_suspension, rear_suspension, front_anti_roll_bar,
                                   rear_anti_roll_bar, front_suspension_height,
                                   rear_suspension_height, brake_pressure, brake_bias,
                                   tyre_pressure, ballast, fuel_load)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketCarSetupData, car_setups)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CarTelemetryData, speed, throttle, steer, brake, clutch, gear,
                                   engine_rpm, drs, rev_lights_percent, brakes_temperature,
                                   tyres_surface_temperature, tyres_inner_temperature,
                                   engine_temperature, tyres_pressure, surface_type)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketCarTelemetryData, car_telemetry_data, button_status,
                                   mfd_panel_index, mfd_panel_index_secondary_player,
                                   suggested_gear)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CarStatusData, traction_control, anti_lock_brakes, fuel_mix,
                                   front_brake_bias, pit_limiter_status, fuel_in_tank,
                                   fuel_capacity, fuel_remaining_laps, max_rpm, idle_rpm,
                                   max_gears, drs_allowed, drs_activation_distance, tyres_wear,
                                   actual_tyre_compound, visual_tyre_compound, tyres_age_laps,
                                   tyres_damage, front_left_wing_damage, front_right_wing_damage,
                                   rear_wing_damage, drs_fault, engine_damage, gear_box_damage,
                                   vehicle_fia_flags, ers_store_energy, ers_deploy_mode,
                                   ers_harvested_this_lap_mguk, ers_harvested_this_lap_mguh,
                                   ers_deployed_this_lap)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketCarStatusData, car_status_data)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FinalClassificationData, position, num_laps, grid_position,
                                   points, num_pit_stops, result_status, best_lap_time,
                                   total_race_time, penalties_time, num_penalties,
                                   num_tyre_stints, tyre_stints_actual, tyre_stints_visual)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketFinalClassificationData, num_cars, classification)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LobbyInfoData, ai_controlled, team_id, nationality, name,
                                   ready_status)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PacketLobbyInfoData, num_players, lobby_players)

namespace {

template <typename... Fs> struct Overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs> Overloaded(Fs...) -> Overloaded<Fs...>;

nlohmann::json event_to_json(const PacketEventData &event) {
    nlohmann::json details = std::visit(
        Overloaded{
            [](const SessionStarted &) { return nlohmann::json{{"type", "SessionStarted"}}; },
            [](const SessionEnded &) { return nlohmann::json{{"type", "SessionEnded"}}; },
            [](const DrsEnabled &) { return nlohmann::json{{"type", "DrsEnabled"}}; },
            [](const DrsDisabled &) { return nlohmann::json{{"type", "DrsDisabled"}}; },
            [](const ChequeredFlag &) { return nlohmann::json{{"type", "ChequeredFlag"}}; },
            [](const FastestLap &d) {
                nlohmann::json j = d;
                j["type"] = "FastestLap";
                return j;
            },
            [](const Retirement &d) {
                nlohmann::json j = d;
                j["type"] = "Retirement";
                return j;
            },
            [](const TeamMateInPits &d) {
                nlohmann::json j = d;
                j["type"] = "TeamMateInPits";
                return j;
            },
            [](const RaceWinner &d) {
                nlohmann::json j = d;
                j["type"] = "RaceWinner";
                return j;
            },
            [](const Penalty &d) {
                nlohmann::json j = d;
                j["type"] = "Penalty";
                return j;
            },
            [](const SpeedTrap &d) {
                nlohmann::json j = d;
                j["type"] = "SpeedTrap";
                return j;
            },
        },
        event.details);

    return nlohmann::json{{"event_code", std::string(event.code())}, {"details", details}};
}

} // namespace

nlohmann::json header_to_json(const PacketHeader &header) {
    return nlohmann::json{
        {"packet_format", header.packet_format},
        {"game_major_version", header.game_major_version},
        {"game_minor_version", header.game_minor_version},
        {"packet_version", header.packet_version},
        {"packet_id", header.packet_id},
        {"session_uid", header.session_uid},
        {"session_time", header.session_time},
        {"frame_identifier", header.frame_identifier},
        {"player_car_index", header.player_car_index},
        {"secondary_player_car_index", header.secondary_player_car_index},
    };
}

nlohmann::json packet_to_json(const Packet &packet) {
    nlohmann::json body = std::visit(
        Overloaded{
            [](const PacketEventData &event) { return event_to_json(event); },
            [](const auto &record) -> nlohmann::json { return record; },
        },
        packet.body);

    nlohmann::json out;
    out["kind"] = std::string(packet_id_name(packet.id()));
    out["header"] = header_to_json(packet.header);
    out["body"] = std::move(body);
    return out;
}

} // namespace paddock::protocol
