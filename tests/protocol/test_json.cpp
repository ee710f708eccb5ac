#include "paddock/protocol/json.hpp"
#include "paddock/protocol/dispatcher.hpp"
#include "paddock/protocol/names.hpp"
#include "support/packet_writer.hpp"

#include <gtest/gtest.h>

using namespace paddock::protocol;
using paddock::test::HeaderSpec;
using paddock::test::PacketWriter;

TEST(PacketJson, HeaderAndKind) {
    HeaderSpec spec;
    spec.frame_identifier = 99;
    spec.secondary_player_car_index = 255;
    const Packet packet = decode_packet(paddock::test::make_datagram(PacketId::LapData, spec));

    const nlohmann::json j = packet_to_json(packet);
    EXPECT_EQ(j["kind"], "LapData");
    EXPECT_EQ(j["header"]["packet_format"], 2020);
    EXPECT_EQ(j["header"]["frame_identifier"], 99);
    EXPECT_EQ(j["header"]["session_uid"].get<uint64_t>(), 0x0123456789ABCDEFull);
    EXPECT_EQ(j["header"]["secondary_player_car_index"], 255);
    ASSERT_TRUE(j["body"]["lap_data"].is_array());
    EXPECT_EQ(j["body"]["lap_data"].size(), kMaxCars);
    EXPECT_EQ(j["body"]["lap_data"][0]["driver_status"], "InGarage");
    EXPECT_EQ(j["body"]["lap_data"][0]["current_lap_invalid"], false);
}

TEST(PacketJson, EnumsAndWheelsByName) {
    PacketWriter body;
    for (size_t i = 0; i < kMaxCars; ++i) {
        body.u8(0).u8(0).u8(3).u8(50).u8(1);
        body.zeros(12 + 8);
        body.u8(0).u8(0).u8(0).u8(99); // wear
        body.u8(16).u8(16).u8(2);
        body.zeros(4 + 7 + 4);
        body.u8(3).zeros(12);
    }
    HeaderSpec spec;
    spec.packet_id = static_cast<uint8_t>(PacketId::CarStatus);
    const Packet packet = decode_packet(paddock::test::make_datagram(spec, body.span()));

    const nlohmann::json car = packet_to_json(packet)["body"]["car_status_data"][0];
    EXPECT_EQ(car["fuel_mix"], "Max");
    EXPECT_EQ(car["actual_tyre_compound"], "C5");
    EXPECT_EQ(car["visual_tyre_compound"], "Soft");
    EXPECT_EQ(car["ers_deploy_mode"], "Hotlap");
    EXPECT_EQ(car["tyres_wear"]["front_right"], 99);
    EXPECT_EQ(car["tyres_wear"]["rear_left"], 0);
    EXPECT_EQ(car["pit_limiter_status"], true);
}

TEST(PacketJson, EventDetailsTagged) {
    PacketWriter body;
    body.text("SPTP", 4).u8(5).f32(320.5f).zeros(2);
    HeaderSpec spec;
    spec.packet_id = static_cast<uint8_t>(PacketId::Event);
    const Packet packet = decode_packet(paddock::test::make_datagram(spec, body.span()));

    const nlohmann::json j = packet_to_json(packet);
    EXPECT_EQ(j["body"]["event_code"], "SPTP");
    EXPECT_EQ(j["body"]["details"]["type"], "SpeedTrap");
    EXPECT_EQ(j["body"]["details"]["vehicle_idx"], 5);
    EXPECT_FLOAT_EQ(j["body"]["details"]["speed"].get<float>(), 320.5f);
}

TEST(PacketJson, SessionTrackAndVectors) {
    const Packet packet = decode_packet(paddock::test::make_datagram(PacketId::Session));
    const nlohmann::json j = packet_to_json(packet);
    EXPECT_EQ(j["body"]["track_id"], "Melbourne");
    EXPECT_EQ(j["body"]["weather"], "Clear");
    EXPECT_TRUE(j["body"]["marshal_zones"].is_array());
    EXPECT_TRUE(j["body"]["marshal_zones"].empty());
}

TEST(PacketJson, EveryKindSerializes) {
    for (uint8_t raw = 0; raw < kPacketIdCount; ++raw) {
        const PacketId id = static_cast<PacketId>(raw);
        const Packet packet = decode_packet(paddock::test::make_datagram(id));
        const nlohmann::json j = packet_to_json(packet);
        EXPECT_EQ(j["kind"], std::string(packet_id_name(id)));
        EXPECT_TRUE(j["body"].is_object());
        EXPECT_FALSE(j.dump().empty());
    }
}
