#pragma once

#include "paddock/protocol/packet.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <span>
#include <utility>

namespace paddock::protocol {

/// Body decoder: maps the bytes after the header to one PacketBody alternative.
/// Must be pure and must throw DecodeError instead of reading out of bounds.
using BodyDecoder = PacketBody (*)(std::span<const uint8_t> body);

/// Registry of body decoders keyed by (packet_format, packet_id).
/// Supporting a new game format or packet kind is one register_decoder() call;
/// the listener and the other decoders do not change.
class Dispatcher {
  public:
    void register_decoder(uint16_t packet_format, uint8_t packet_id, BodyDecoder decoder);

    /// True if at least one decoder is registered for this format.
    [[nodiscard]] bool supports_format(uint16_t packet_format) const;

    [[nodiscard]] const std::set<uint16_t> &formats() const { return formats_; }

    /// Parse the header, rejecting formats with no registered decoders.
    /// Throws DecodeError(Truncated | UnsupportedVersion).
    PacketHeader decode_header(std::span<const uint8_t> bytes,
                               std::span<const uint8_t> &body) const;

    /// Route body bytes to the decoder for the header's (format, id).
    /// Throws DecodeError(UnknownPacketId); body decoder errors propagate unchanged.
    Packet dispatch(const PacketHeader &header, std::span<const uint8_t> body) const;

    /// decode_header() followed by dispatch().
    Packet decode(std::span<const uint8_t> datagram) const;

  private:
    std::map<std::pair<uint16_t, uint8_t>, BodyDecoder> decoders_;
    std::set<uint16_t> formats_;
};

/// Register the ten F1 2020 body decoders.
void register_f1_2020(Dispatcher &dispatcher);

/// Process-wide dispatcher holding the F1 2020 table. Immutable after first use.
const Dispatcher &default_dispatcher();

/// Decode one datagram with the default dispatcher.
Packet decode_packet(std::span<const uint8_t> datagram);

} // namespace paddock::protocol
