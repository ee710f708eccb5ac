#include "paddock/protocol/header.hpp"

#include "paddock/protocol/byte_reader.hpp"
#include "paddock/protocol/dispatcher.hpp"

namespace paddock::protocol {

std::optional<PacketId> to_packet_id(uint8_t raw) {
    if (raw >= kPacketIdCount) {
        return std::nullopt;
    }
    return static_cast<PacketId>(raw);
}

PacketHeader read_header(std::span<const uint8_t> bytes) {
    ByteReader r(bytes, "header");
    r.require(kHeaderSize);

    PacketHeader hdr;
    hdr.packet_format = r.u16();
    hdr.game_major_version = r.u8();
    hdr.game_minor_version = r.u8();
    hdr.packet_version = r.u8();
    hdr.packet_id = r.u8();
    hdr.session_uid = r.u64();
    hdr.session_time = r.f32();
    hdr.frame_identifier = r.u32();
    hdr.player_car_index = r.u8();
    hdr.secondary_player_car_index = r.u8();
    return hdr;
}

PacketHeader decode_header(std::span<const uint8_t> bytes, std::span<const uint8_t> &body) {
    return default_dispatcher().decode_header(bytes, body);
}

} // namespace paddock::protocol
