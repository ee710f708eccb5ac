#pragma once

#include "paddock/config.hpp"
#include "paddock/net/stream.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace paddock {

/// Command line as typed; resolved against the config file by resolve_config().
struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    bool json = false;
    std::vector<protocol::PacketId> packets;
    bool help = false;
};

/// Application entry point and lifecycle management.
/// Binds the listener, prints every decoded packet and reports decode errors
/// until interrupted.
class App {
  public:
    App();
    ~App();

    /// Run the listen loop. Returns exit code (0 = success).
    int run(int argc, char *argv[]);

    /// Throws std::runtime_error on unknown flags or bad values.
    static CommandLine parse_args(int argc, char *argv[]);

    /// Defaults, then the config file (if given), then command-line flags.
    static Config resolve_config(const CommandLine &cli);

    static void print_usage(const char *program);

  private:
    /// Drain both stream queues once. Returns the number of items handled.
    size_t process_queues();

    void print_packet(const protocol::Packet &packet);

    std::unique_ptr<net::TelemetryStream> stream_;
    Config config_;
};

} // namespace paddock
