#pragma once

#include "paddock/protocol/dispatcher.hpp"
#include "paddock/protocol/errors.hpp"
#include "paddock/protocol/packet.hpp"

#include <ixwebsocket/IXSelectInterrupt.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace paddock::net {

/// Large enough for every F1 2020 datagram (the biggest, Motion, is 1464 bytes).
inline constexpr size_t kDefaultReceiveBufferSize = 2048;

/// UDP listener for game telemetry.
///
/// Lifecycle: Unbound -> Bound (constructor) -> Receiving (inside receive calls) -> Closed.
/// The constructor binds or throws ClientError(BindError). Each receive call waits for one
/// datagram and returns it decoded; a DecodeError is thrown for that datagram only and the
/// next receive continues normally. close() may be called from any thread and wakes a
/// blocked receive, which then throws ClientError(Closed).
class TelemetryClient {
  public:
    /// `host` must be a numeric IPv4 or IPv6 address; port 0 picks an ephemeral port.
    TelemetryClient(const std::string &host, uint16_t port,
                    size_t receive_buffer_size = kDefaultReceiveBufferSize,
                    const protocol::Dispatcher &dispatcher = protocol::default_dispatcher());
    ~TelemetryClient();

    TelemetryClient(const TelemetryClient &) = delete;
    TelemetryClient &operator=(const TelemetryClient &) = delete;

    /// Block until a datagram arrives, then decode it.
    /// Throws DecodeError for an undecodable datagram, ClientError(Closed) once closed,
    /// ClientError(ConcurrentReceive) if another receive is in flight on this client, and
    /// ClientError(ReceiveFailed) on a socket error.
    protocol::Packet receive();

    /// As receive(), but gives up after `timeout` and returns nullopt.
    std::optional<protocol::Packet> receive_for(std::chrono::milliseconds timeout);

    /// Idempotent. Releases the socket once no receive is using it.
    void close();

    /// Port actually bound (resolves port 0).
    [[nodiscard]] uint16_t local_port() const { return local_port_; }

    [[nodiscard]] const std::string &host() const { return host_; }

    [[nodiscard]] bool is_closed() const { return closed_.load(); }

    [[nodiscard]] bool is_receiving() const { return receiving_.load(); }

  private:
    /// timeout_ms < 0 waits forever.
    std::optional<protocol::Packet> receive_impl(int timeout_ms);

    /// Waits for the socket to become readable; false on timeout.
    bool wait_readable(int timeout_ms);

    void release_socket();

    std::string host_;
    uint16_t local_port_ = 0;
    const protocol::Dispatcher &dispatcher_;
    std::vector<uint8_t> buffer_;

    int fd_ = -1;
    std::mutex fd_mutex_;
    ix::SelectInterruptPtr interrupt_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> receiving_{false};
};

} // namespace paddock::net
