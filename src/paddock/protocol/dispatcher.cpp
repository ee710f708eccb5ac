#include "paddock/protocol/dispatcher.hpp"

#include <string>

namespace paddock::protocol {

namespace {

// Adapt a typed decoder to the BodyDecoder signature.
template <auto Decode> PacketBody decode_as_body(std::span<const uint8_t> body) {
    return PacketBody(Decode(body));
}

} // namespace

void Dispatcher::register_decoder(uint16_t packet_format, uint8_t packet_id,
                                  BodyDecoder decoder) {
    decoders_[{packet_format, packet_id}] = decoder;
    formats_.insert(packet_format);
}

bool Dispatcher::supports_format(uint16_t packet_format) const {
    return formats_.count(packet_format) != 0;
}

PacketHeader Dispatcher::decode_header(std::span<const uint8_t> bytes,
                                       std::span<const uint8_t> &body) const {
    PacketHeader header = read_header(bytes);
    if (!supports_format(header.packet_format)) {
        throw DecodeError(ErrorKind::UnsupportedVersion,
                          "Unsupported packet format " + std::to_string(header.packet_format));
    }
    body = bytes.subspan(kHeaderSize);
    return header;
}

Packet Dispatcher::dispatch(const PacketHeader &header, std::span<const uint8_t> body) const {
    auto it = decoders_.find({header.packet_format, header.packet_id});
    if (it == decoders_.end()) {
        throw DecodeError(ErrorKind::UnknownPacketId,
                          "No decoder for packet id " + std::to_string(header.packet_id) +
                              " in format " + std::to_string(header.packet_format));
    }
    return Packet{header, it->second(body)};
}

Packet Dispatcher::decode(std::span<const uint8_t> datagram) const {
    std::span<const uint8_t> body;
    const PacketHeader header = decode_header(datagram, body);
    return dispatch(header, body);
}

void register_f1_2020(Dispatcher &dispatcher) {
    auto add = [&](PacketId id, BodyDecoder decoder) {
        dispatcher.register_decoder(kFormat2020, static_cast<uint8_t>(id), decoder);
    };
    add(PacketId::Motion, &decode_as_body<decode_motion>);
    add(PacketId::Session, &decode_as_body<decode_session>);
    add(PacketId::LapData, &decode_as_body<decode_lap_data>);
    add(PacketId::Event, &decode_as_body<decode_event>);
    add(PacketId::Participants, &decode_as_body<decode_participants>);
    add(PacketId::CarSetups, &decode_as_body<decode_car_setups>);
    add(PacketId::CarTelemetry, &decode_as_body<decode_car_telemetry>);
    add(PacketId::CarStatus, &decode_as_body<decode_car_status>);
    add(PacketId::FinalClassification, &decode_as_body<decode_final_classification>);
    add(PacketId::LobbyInfo, &decode_as_body<decode_lobby_info>);
}

const Dispatcher &default_dispatcher() {
    static const Dispatcher instance = [] {
        Dispatcher d;
        register_f1_2020(d);
        return d;
    }();
    return instance;
}

Packet decode_packet(std::span<const uint8_t> datagram) {
    return default_dispatcher().decode(datagram);
}

} // namespace paddock::protocol
