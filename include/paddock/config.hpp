#pragma once

#include "paddock/protocol/header.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace paddock {

enum class OutputFormat { Summary, Json };

struct Config {
    std::string host = "127.0.0.1";
    uint16_t port = protocol::kDefaultPort;
    size_t receive_buffer_size = 2048;
    size_t queue_capacity = 256;
    OutputFormat output = OutputFormat::Summary;
    std::vector<protocol::PacketId> packets; // empty = print every kind

    /// True if `id` passes the `packets` filter.
    [[nodiscard]] bool wants(protocol::PacketId id) const;
};

/// Overlay keys present in `doc` onto `base`. Unknown keys are ignored.
/// Throws std::runtime_error naming the key on a wrong type or out-of-range value.
Config parse_config(const nlohmann::json &doc, Config base = {});

/// Read and parse a JSON configuration file.
/// Throws std::runtime_error if the file cannot be read or is not valid JSON.
Config load_config(const std::string &path, Config base = {});

} // namespace paddock
