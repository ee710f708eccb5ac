#include "paddock/protocol/lobby_info.hpp"

#include <utility>

namespace paddock::protocol {

PacketLobbyInfoData decode_lobby_info(std::span<const uint8_t> body) {
    ByteReader r(body, "lobby info");

    PacketLobbyInfoData data;
    const size_t count = read_count(r, kMaxCars, "lobby_info.num_players");
    data.num_players = static_cast<uint8_t>(count);
    r.require(count * kLobbyPlayerSize);

    data.lobby_players.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        LobbyInfoData player;
        player.ai_controlled = r.flag();
        player.team_id = r.u8();
        player.nationality = r.u8();
        player.name = r.fixed_string(kNameLength);
        player.ready_status =
            enum_in_range<ReadyStatus, uint8_t>(r.u8(), 0, 2, "lobby_info.ready_status");
        data.lobby_players.push_back(std::move(player));
    }
    return data;
}

} // namespace paddock::protocol
