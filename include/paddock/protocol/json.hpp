#pragma once

#include "paddock/protocol/packet.hpp"

#include <nlohmann/json.hpp>

namespace paddock::protocol {

/// Header fields by name; packet_id stays numeric.
nlohmann::json header_to_json(const PacketHeader &header);

/// Full rendering of a decoded packet:
///   {"kind": "CarTelemetry", "header": {...}, "body": {...}}
/// Enumerations are rendered by name, per-wheel values as
/// {"rear_left", "rear_right", "front_left", "front_right"} objects and
/// event details as {"type": "...", ...fields}.
nlohmann::json packet_to_json(const Packet &packet);

} // namespace paddock::protocol
