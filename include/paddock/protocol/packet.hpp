#pragma once

#include "paddock/protocol/car_setup.hpp"
#include "paddock/protocol/car_status.hpp"
#include "paddock/protocol/car_telemetry.hpp"
#include "paddock/protocol/event.hpp"
#include "paddock/protocol/final_classification.hpp"
#include "paddock/protocol/header.hpp"
#include "paddock/protocol/lap.hpp"
#include "paddock/protocol/lobby_info.hpp"
#include "paddock/protocol/motion.hpp"
#include "paddock/protocol/participants.hpp"
#include "paddock/protocol/session.hpp"

#include <string>
#include <variant>

namespace paddock::protocol {

/// Decoded body of one datagram. Alternative index == PacketId value.
using PacketBody =
    std::variant<PacketMotionData, PacketSessionData, PacketLapData, PacketEventData,
                 PacketParticipantsData, PacketCarSetupData, PacketCarTelemetryData,
                 PacketCarStatusData, PacketFinalClassificationData, PacketLobbyInfoData>;

static_assert(std::variant_size_v<PacketBody> == kPacketIdCount);

/// One decoded datagram: header plus exactly one typed body.
struct Packet {
    PacketHeader header;
    PacketBody body;

    [[nodiscard]] PacketId id() const { return static_cast<PacketId>(body.index()); }

    template <typename T> [[nodiscard]] const T *get_if() const { return std::get_if<T>(&body); }
};

/// One-line human-readable summary, e.g.
/// "CarTelemetry f2020 frame=812 t=41.250s player=0 speed=287km/h gear=7".
std::string describe(const Packet &packet);

} // namespace paddock::protocol
