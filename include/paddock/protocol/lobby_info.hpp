#pragma once

#include "paddock/protocol/common.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace paddock::protocol {

inline constexpr size_t kLobbyPlayerSize = 3 + kNameLength + 1;
inline constexpr size_t kLobbyInfoBodySize = 1 + kMaxCars * kLobbyPlayerSize;

enum class ReadyStatus : uint8_t { NotReady, Ready, Spectating };

struct LobbyInfoData {
    bool ai_controlled = false;
    uint8_t team_id = 0; // 255 if no team selected yet
    uint8_t nationality = 0;
    std::string name;
    ReadyStatus ready_status = ReadyStatus::NotReady;
};

struct PacketLobbyInfoData {
    uint8_t num_players = 0;
    std::vector<LobbyInfoData> lobby_players; // num_players entries
};

PacketLobbyInfoData decode_lobby_info(std::span<const uint8_t> body);

} // namespace paddock::protocol
