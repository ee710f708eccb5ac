#include "paddock/net/stream.hpp"

#include <utility>

namespace paddock::net {

TelemetryStream::TelemetryStream(const std::string &host, uint16_t port,
                                 size_t receive_buffer_size, size_t queue_capacity)
    : client_(host, port, receive_buffer_size), packets_(queue_capacity),
      errors_(kErrorQueueCapacity) {}

TelemetryStream::~TelemetryStream() { stop(); }

void TelemetryStream::start() {
    if (thread_.joinable()) {
        return;
    }
    if (client_.is_closed()) {
        throw ClientError(ErrorKind::Closed, "Stream was stopped");
    }
    state_.store(StreamState::Listening, std::memory_order_release);
    thread_ = std::thread([this] { run(); });
}

void TelemetryStream::stop() {
    client_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (state_.load(std::memory_order_acquire) != StreamState::Error) {
        state_.store(StreamState::Closed, std::memory_order_release);
    }
}

StreamStats TelemetryStream::stats() const {
    StreamStats s;
    s.received = received_.load(std::memory_order_acquire);
    s.decoded = decoded_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.dropped = packets_.dropped();
    s.errors_dropped = errors_.dropped();
    return s;
}

void TelemetryStream::run() {
    while (true) {
        try {
            protocol::Packet packet = client_.receive();
            packets_.try_push(std::move(packet));
            decoded_.fetch_add(1, std::memory_order_relaxed);
            // Published last: a reader that sees `received` also sees the queued item.
            received_.fetch_add(1, std::memory_order_release);
        } catch (const DecodeError &e) {
            errors_.try_push(std::string(error_kind_name(e.kind())) + ": " + e.what());
            rejected_.fetch_add(1, std::memory_order_relaxed);
            received_.fetch_add(1, std::memory_order_release);
        } catch (const ClientError &e) {
            if (e.kind() == ErrorKind::Closed) {
                state_.store(StreamState::Closed, std::memory_order_release);
            } else {
                errors_.try_push(std::string(error_kind_name(e.kind())) + ": " + e.what());
                state_.store(StreamState::Error, std::memory_order_release);
            }
            return;
        }
    }
}

} // namespace paddock::net
