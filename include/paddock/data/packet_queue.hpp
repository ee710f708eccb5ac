#pragma once

#include "paddock/protocol/packet.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace paddock::data {

/// Bounded single-producer single-consumer ring buffer.
/// Producer: the stream's receive thread. Consumer: whoever drains the stream.
/// Lock-free; head and tail are published with acquire/release.
template <typename T> class SPSCQueue {
  public:
    /// `capacity` items can be queued at once; one extra slot separates full from empty.
    explicit SPSCQueue(size_t capacity) : slots_(capacity + 1), buffer_(capacity + 1) {
        if (capacity == 0) {
            throw std::invalid_argument("SPSCQueue capacity must be at least 1");
        }
    }

    SPSCQueue(const SPSCQueue &) = delete;
    SPSCQueue &operator=(const SPSCQueue &) = delete;

    /// Producer only. When full the item is discarded, counted, and false is returned.
    bool try_push(T item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = (tail + 1) % slots_;
        if (next == head_.load(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        buffer_[tail] = std::move(item);
        tail_.store(next, std::memory_order_release);
        return true;
    }

    /// Consumer only.
    std::optional<T> try_pop() {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(buffer_[head]));
        buffer_[head] = T{};
        head_.store((head + 1) % slots_, std::memory_order_release);
        return item;
    }

    /// Consumer only. Moves everything currently queued into `out`; returns the count.
    size_t drain(std::vector<T> &out) {
        size_t n = 0;
        while (auto item = try_pop()) {
            out.push_back(std::move(*item));
            ++n;
        }
        return n;
    }

    [[nodiscard]] bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    /// Exact only when neither side is active.
    [[nodiscard]] size_t size_approx() const {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_relaxed);
        return (tail + slots_ - head) % slots_;
    }

    [[nodiscard]] size_t capacity() const { return slots_ - 1; }

    /// Items rejected by try_push() because the queue was full.
    [[nodiscard]] uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

  private:
    size_t slots_;
    std::vector<T> buffer_;
    std::atomic<uint64_t> dropped_{0};

    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

/// Decoded packets (receive thread -> consumer).
using PacketQueue = SPSCQueue<protocol::Packet>;

/// Human-readable decode / socket error messages (receive thread -> consumer).
using ErrorQueue = SPSCQueue<std::string>;

} // namespace paddock::data
