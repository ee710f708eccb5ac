#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

namespace paddock::protocol {

/// Event body: 4-byte ASCII code + 7-byte details union (sized for the largest, Penalty).
inline constexpr size_t kEventCodeSize = 4;
inline constexpr size_t kEventDetailsSize = 7;
inline constexpr size_t kEventBodySize = kEventCodeSize + kEventDetailsSize;

enum class PenaltyType : uint8_t {
    DriveThrough,
    StopGo,
    GridPenalty,
    PenaltyReminder,
    TimePenalty,
    Warning,
    Disqualified,
    RemovedFromFormationLap,
    ParkedTooLongTimer,
    TyreRegulations,
    ThisLapInvalidated,
    ThisAndNextLapInvalidated,
    ThisLapInvalidatedWithoutReason,
    ThisAndNextLapInvalidatedWithoutReason,
    ThisAndPreviousLapInvalidated,
    ThisAndPreviousLapInvalidatedWithoutReason,
    Retired,
    BlackFlagTimer,
};

enum class InfringementType : uint8_t {
    BlockingBySlowDriving,
    BlockingByWrongWayDriving,
    ReversingOffTheStartLine,
    BigCollision,
    SmallCollision,
    CollisionFailedToHandBackPositionSingle,
    CollisionFailedToHandBackPositionMultiple,
    CornerCuttingGainedTime,
    CornerCuttingOvertakeSingle,
    CornerCuttingOvertakeMultiple,
    CrossedPitExitLane,
    IgnoringBlueFlags,
    IgnoringYellowFlags,
    IgnoringDriveThrough,
    TooManyDriveThroughs,
    DriveThroughReminderServeWithinNLaps,
    DriveThroughReminderServeThisLap,
    PitLaneSpeeding,
    ParkedForTooLong,
    IgnoringTyreRegulations,
    TooManyPenalties,
    MultipleWarnings,
    ApproachingDisqualification,
    TyreRegulationsSelectSingle,
    TyreRegulationsSelectMultiple,
    LapInvalidatedCornerCutting,
    LapInvalidatedRunningWide,
    CornerCuttingRanWideGainedTimeMinor,
    CornerCuttingRanWideGainedTimeSignificant,
    CornerCuttingRanWideGainedTimeExtreme,
    LapInvalidatedWallRiding,
    LapInvalidatedFlashbackUsed,
    LapInvalidatedResetToTrack,
    BlockingThePitlane,
    JumpStart,
    SafetyCarToCarCollision,
    SafetyCarIllegalOvertake,
    SafetyCarExceedingAllowedPace,
    VirtualSafetyCarExceedingAllowedPace,
    FormationLapBelowAllowedSpeed,
    RetiredMechanicalFailure,
    RetiredTerminallyDamaged,
    SafetyCarFallingTooFarBack,
    BlackFlagTimer,
    UnservedStopGoPenalty,
    UnservedDriveThroughPenalty,
    EngineComponentChange,
    GearboxChange,
    LeagueGridPenalty,
    RetryPenalty,
    IllegalTimeGain,
    MandatoryPitstop,
};

struct SessionStarted {};
struct SessionEnded {};
struct DrsEnabled {};
struct DrsDisabled {};
struct ChequeredFlag {};

struct FastestLap {
    uint8_t vehicle_idx = 0;
    float lap_time = 0.0f; // seconds
};

struct Retirement {
    uint8_t vehicle_idx = 0;
};

struct TeamMateInPits {
    uint8_t vehicle_idx = 0;
};

struct RaceWinner {
    uint8_t vehicle_idx = 0;
};

struct Penalty {
    PenaltyType penalty_type = PenaltyType::DriveThrough;
    InfringementType infringement_type = InfringementType::BlockingBySlowDriving;
    uint8_t vehicle_idx = 0;
    uint8_t other_vehicle_idx = 0;
    uint8_t time = 0; // seconds, 255 if not applicable
    uint8_t lap_num = 0;
    uint8_t places_gained = 0;
};

struct SpeedTrap {
    uint8_t vehicle_idx = 0;
    float speed = 0.0f; // km/h
};

using EventDetails = std::variant<SessionStarted, SessionEnded, FastestLap, Retirement, DrsEnabled,
                                  DrsDisabled, TeamMateInPits, ChequeredFlag, RaceWinner, Penalty,
                                  SpeedTrap>;

struct PacketEventData {
    std::array<char, kEventCodeSize> event_code{};
    EventDetails details;

    [[nodiscard]] std::string_view code() const {
        return std::string_view(event_code.data(), event_code.size());
    }
};

/// Decode an event body. Unknown event codes are DecodeError(MalformedField).
PacketEventData decode_event(std::span<const uint8_t> body);

} // namespace paddock::protocol
