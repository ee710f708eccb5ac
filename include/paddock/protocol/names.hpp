#pragma once

#include "paddock/protocol/common.hpp"
#include "paddock/protocol/header.hpp"
#include "paddock/protocol/session.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace paddock::protocol {

/// "Motion", "Session", ... "LobbyInfo".
[[nodiscard]] std::string_view packet_id_name(PacketId id);

/// Inverse of packet_id_name(), case-sensitive.
[[nodiscard]] std::optional<PacketId> parse_packet_id(std::string_view name);

/// Team name for a participant / lobby team id, "[N/A]" for unknown ids.
[[nodiscard]] std::string_view team_name(uint8_t team_id);

/// Livery colour as "#RRGGBB" for the current F1 grid, "#000000" otherwise.
[[nodiscard]] std::string_view team_color(uint8_t team_id);

[[nodiscard]] std::string_view track_name(Track track);

/// HUD label of a visual compound ("Soft", "Medium", "Hard", "Inter", "Wet", ...).
[[nodiscard]] std::string_view compound_label(VisualTyreCompound compound);

} // namespace paddock::protocol
