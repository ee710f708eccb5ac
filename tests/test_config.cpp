#include "paddock/config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace paddock;
using paddock::protocol::PacketId;
using json = nlohmann::json;

namespace {

std::string write_temp(const std::string &name, const std::string &contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

} // namespace

TEST(Config, Defaults) {
    Config config;
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 20777);
    EXPECT_EQ(config.receive_buffer_size, 2048u);
    EXPECT_EQ(config.queue_capacity, 256u);
    EXPECT_EQ(config.output, OutputFormat::Summary);
    EXPECT_TRUE(config.packets.empty());
    EXPECT_TRUE(config.wants(PacketId::Motion));
    EXPECT_TRUE(config.wants(PacketId::LobbyInfo));
}

TEST(Config, ParseFullDocument) {
    auto doc = json::parse(R"({
        "host": "0.0.0.0",
        "port": 20888,
        "receive_buffer_size": 4096,
        "queue_capacity": 32,
        "output": "json",
        "packets": ["CarTelemetry", "LapData"]
    })");

    Config config = parse_config(doc);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 20888);
    EXPECT_EQ(config.receive_buffer_size, 4096u);
    EXPECT_EQ(config.queue_capacity, 32u);
    EXPECT_EQ(config.output, OutputFormat::Json);
    ASSERT_EQ(config.packets.size(), 2u);
    EXPECT_TRUE(config.wants(PacketId::CarTelemetry));
    EXPECT_TRUE(config.wants(PacketId::LapData));
    EXPECT_FALSE(config.wants(PacketId::Motion));
}

TEST(Config, OverlaysOnlyPresentKeys) {
    Config base;
    base.host = "10.0.0.5";
    base.queue_capacity = 8;

    Config config = parse_config(json::parse(R"({"port": 0, "unrelated": true})"), base);
    EXPECT_EQ(config.host, "10.0.0.5");
    EXPECT_EQ(config.queue_capacity, 8u);
    EXPECT_EQ(config.port, 0);
}

TEST(Config, RejectsNonObject) {
    EXPECT_THROW(parse_config(json::array()), std::runtime_error);
}

TEST(Config, RejectsBadValues) {
    EXPECT_THROW(parse_config(json::parse(R"({"host": 5})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"port": "20777"})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"port": 70000})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"port": -1})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"receive_buffer_size": 10})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"queue_capacity": 0})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"output": "xml"})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"packets": "Motion"})")), std::runtime_error);
    EXPECT_THROW(parse_config(json::parse(R"({"packets": [3]})")), std::runtime_error);
}

TEST(Config, ErrorNamesTheKey) {
    try {
        (void)parse_config(json::parse(R"({"packets": ["Motion", "Weather"]})"));
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error &e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("packets"), std::string::npos) << what;
        EXPECT_NE(what.find("Weather"), std::string::npos) << what;
    }
}

TEST(Config, LoadFromFile) {
    const auto path = write_temp("paddock_config_ok.json", R"({"port": 21000, "output": "json"})");
    Config config = load_config(path);
    EXPECT_EQ(config.port, 21000);
    EXPECT_EQ(config.output, OutputFormat::Json);
    std::remove(path.c_str());
}

TEST(Config, LoadMissingFileThrows) {
    EXPECT_THROW(load_config("/nonexistent/paddock/config.json"), std::runtime_error);
}

TEST(Config, LoadInvalidJsonThrows) {
    const auto path = write_temp("paddock_config_bad.json", "{ \"port\": ");
    EXPECT_THROW(load_config(path), std::runtime_error);
    std::remove(path.c_str());
}
