#include "paddock/app.hpp"
#include "paddock/protocol/json.hpp"
#include "paddock/protocol/names.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace paddock {

namespace {

std::atomic<bool> g_stop_requested{false};

void on_signal(int /*signum*/) { g_stop_requested.store(true); }

[[nodiscard]] uint16_t parse_port(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        throw std::runtime_error("Invalid port '" + std::string(text) + "'");
    }
    unsigned long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::runtime_error("Invalid port '" + std::string(text) + "'");
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > 65535) {
        throw std::runtime_error("Port out of range: " + std::string(text));
    }
    return static_cast<uint16_t>(value);
}

} // namespace

App::App() = default;
App::~App() = default;

CommandLine App::parse_args(int argc, char *argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto next = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + std::string(arg));
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg == "--config") {
            cli.config_path = std::string(next());
        } else if (arg == "--host") {
            cli.host = std::string(next());
        } else if (arg == "--port") {
            cli.port = parse_port(next());
        } else if (arg == "--json") {
            cli.json = true;
        } else if (arg == "--packet") {
            const std::string_view name = next();
            auto id = protocol::parse_packet_id(name);
            if (!id) {
                throw std::runtime_error("Unknown packet kind '" + std::string(name) + "'");
            }
            cli.packets.push_back(*id);
        } else {
            throw std::runtime_error("Unknown argument '" + std::string(arg) + "'");
        }
    }
    return cli;
}

Config App::resolve_config(const CommandLine &cli) {
    Config config;
    if (cli.config_path) {
        config = load_config(*cli.config_path);
    }
    if (cli.host) {
        config.host = *cli.host;
    }
    if (cli.port) {
        config.port = *cli.port;
    }
    if (cli.json) {
        config.output = OutputFormat::Json;
    }
    if (!cli.packets.empty()) {
        config.packets = cli.packets;
    }
    return config;
}

void App::print_usage(const char *program) {
    std::printf("Usage: %s [--config FILE] [--host ADDR] [--port N] [--json] "
                "[--packet KIND]... [--help]\n"
                "\n"
                "Listen for F1 2020 UDP telemetry and print each decoded packet.\n"
                "\n"
                "  --config FILE   JSON configuration file\n"
                "  --host ADDR     numeric address to bind (default 127.0.0.1)\n"
                "  --port N        UDP port (default %u)\n"
                "  --json          print packets as JSON, one per line\n"
                "  --packet KIND   only print this packet kind (repeatable):\n"
                "                  Motion Session LapData Event Participants CarSetups\n"
                "                  CarTelemetry CarStatus FinalClassification LobbyInfo\n",
                program, static_cast<unsigned>(protocol::kDefaultPort));
}

int App::run(int argc, char *argv[]) {
    try {
        const CommandLine cli = parse_args(argc, argv);
        if (cli.help) {
            print_usage(argv[0]);
            return 0;
        }
        config_ = resolve_config(cli);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[Paddock] %s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }

    try {
        stream_ = std::make_unique<net::TelemetryStream>(config_.host, config_.port,
                                                         config_.receive_buffer_size,
                                                         config_.queue_capacity);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[Paddock] %s\n", e.what());
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::printf("[Paddock] Listening on %s:%u\n", config_.host.c_str(),
                static_cast<unsigned>(stream_->local_port()));
    std::fflush(stdout);
    stream_->start();

    while (!g_stop_requested.load()) {
        const size_t handled = process_queues();
        const net::StreamState state = stream_->state();
        if (state == net::StreamState::Error || state == net::StreamState::Closed) {
            process_queues();
            break;
        }
        if (handled == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    stream_->stop();
    process_queues();

    const net::StreamStats stats = stream_->stats();
    std::printf("[Paddock] Stopped: %llu received, %llu decoded, %llu rejected, %llu dropped, "
                "%llu error messages dropped\n",
                static_cast<unsigned long long>(stats.received),
                static_cast<unsigned long long>(stats.decoded),
                static_cast<unsigned long long>(stats.rejected),
                static_cast<unsigned long long>(stats.dropped),
                static_cast<unsigned long long>(stats.errors_dropped));

    return stream_->state() == net::StreamState::Error ? 1 : 0;
}

size_t App::process_queues() {
    size_t handled = 0;
    while (auto packet = stream_->packet_queue().try_pop()) {
        print_packet(*packet);
        ++handled;
    }
    while (auto message = stream_->error_queue().try_pop()) {
        std::fprintf(stderr, "[Paddock] Error: %s\n", message->c_str());
        ++handled;
    }
    std::fflush(stdout);
    return handled;
}

void App::print_packet(const protocol::Packet &packet) {
    if (!config_.wants(packet.id())) {
        return;
    }
    if (config_.output == OutputFormat::Json) {
        std::printf("%s\n", protocol::packet_to_json(packet)
                                  .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                                  .c_str());
    } else {
        std::printf("%s\n", protocol::describe(packet).c_str());
    }
}

} // namespace paddock
