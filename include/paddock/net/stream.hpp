#pragma once

#include "paddock/data/packet_queue.hpp"
#include "paddock/net/client.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

namespace paddock::net {

/// Error messages beyond this many undrained ones are counted, not kept.
inline constexpr size_t kErrorQueueCapacity = 64;

enum class StreamState { Stopped, Listening, Closed, Error };

struct StreamStats {
    uint64_t received = 0; // datagrams taken off the socket
    uint64_t decoded = 0;
    uint64_t rejected = 0; // DecodeError
    uint64_t dropped = 0;  // decoded but the packet queue was full
    uint64_t errors_dropped = 0; // error messages lost to a full error queue
};

/// Runs a TelemetryClient's receive loop on a background thread.
/// Decoded packets go to packet_queue(), decode errors to error_queue() as text.
/// The consumer polls both queues from a single thread.
class TelemetryStream {
  public:
    TelemetryStream(const std::string &host, uint16_t port,
                    size_t receive_buffer_size = kDefaultReceiveBufferSize,
                    size_t queue_capacity = 256);
    ~TelemetryStream();

    TelemetryStream(const TelemetryStream &) = delete;
    TelemetryStream &operator=(const TelemetryStream &) = delete;

    /// Start the receive thread (non-blocking). No-op if already running.
    /// Throws ClientError(Closed) after stop().
    void start();

    /// Close the client and join the receive thread.
    void stop();

    data::PacketQueue &packet_queue() { return packets_; }
    data::ErrorQueue &error_queue() { return errors_; }

    [[nodiscard]] const TelemetryClient &client() const { return client_; }

    [[nodiscard]] uint16_t local_port() const { return client_.local_port(); }

    /// Safe from any thread.
    [[nodiscard]] StreamState state() const { return state_.load(std::memory_order_acquire); }

    [[nodiscard]] StreamStats stats() const;

  private:
    void run();

    TelemetryClient client_;
    data::PacketQueue packets_;
    data::ErrorQueue errors_;
    std::thread thread_;

    std::atomic<StreamState> state_{StreamState::Stopped};
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> decoded_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace paddock::net
