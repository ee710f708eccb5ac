#include "paddock/config.hpp"
#include "paddock/protocol/names.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace paddock {

namespace {

constexpr size_t kMinReceiveBuffer = protocol::kHeaderSize;
constexpr size_t kMaxReceiveBuffer = 65536;

size_t read_size(const nlohmann::json &doc, const char *key, size_t lo, size_t hi) {
    const auto &value = doc[key];
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::string("Config '") + key + "' must be a positive integer");
    }
    const auto n = value.get<uint64_t>();
    if (n < lo || n > hi) {
        throw std::runtime_error(std::string("Config '") + key + "' must be between " +
                                 std::to_string(lo) + " and " + std::to_string(hi));
    }
    return static_cast<size_t>(n);
}

} // namespace

bool Config::wants(protocol::PacketId id) const {
    return packets.empty() || std::find(packets.begin(), packets.end(), id) != packets.end();
}

Config parse_config(const nlohmann::json &doc, Config base) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    Config config = std::move(base);

    if (doc.contains("host")) {
        if (!doc["host"].is_string()) {
            throw std::runtime_error("Config 'host' must be a string");
        }
        config.host = doc["host"].get<std::string>();
    }

    if (doc.contains("port")) {
        config.port = static_cast<uint16_t>(read_size(doc, "port", 0, 65535));
    }

    if (doc.contains("receive_buffer_size")) {
        config.receive_buffer_size =
            read_size(doc, "receive_buffer_size", kMinReceiveBuffer, kMaxReceiveBuffer);
    }

    if (doc.contains("queue_capacity")) {
        config.queue_capacity = read_size(doc, "queue_capacity", 1, 1 << 20);
    }

    if (doc.contains("output")) {
        const auto &output = doc["output"];
        if (output == "summary") {
            config.output = OutputFormat::Summary;
        } else if (output == "json") {
            config.output = OutputFormat::Json;
        } else {
            throw std::runtime_error("Config 'output' must be \"summary\" or \"json\"");
        }
    }

    if (doc.contains("packets")) {
        if (!doc["packets"].is_array()) {
            throw std::runtime_error("Config 'packets' must be an array of packet names");
        }
        config.packets.clear();
        for (const auto &name : doc["packets"]) {
            if (!name.is_string()) {
                throw std::runtime_error("Config 'packets' entries must be strings");
            }
            auto id = protocol::parse_packet_id(name.get<std::string>());
            if (!id) {
                throw std::runtime_error("Config 'packets' has unknown packet kind '" +
                                         name.get<std::string>() + "'");
            }
            config.packets.push_back(*id);
        }
    }

    return config;
}

Config load_config(const std::string &path, Config base) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file '" + path + "'");
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("Config file '" + path + "' is not valid JSON");
    }
    return parse_config(doc, std::move(base));
}

} // namespace paddock
