#include "paddock/net/client.hpp"

#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXSelectInterruptFactory.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <functional>
#include <limits>
#include <span>
#include <stdexcept>
#include <utility>

namespace paddock::net {

namespace {

constexpr uint64_t kCloseRequest = 1;

/// Binds a UDP socket to a numeric host and port. Returns the fd; throws BindError.
int bind_udp(const std::string &host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo *res = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw ClientError(ErrorKind::BindError,
                          "Invalid address '" + host + "': " + ::gai_strerror(rc));
    }

    int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) {
        const int err = errno;
        ::freeaddrinfo(res);
        throw ClientError(ErrorKind::BindError,
                          std::string("Cannot create UDP socket: ") + std::strerror(err));
    }

    if (::bind(fd, res->ai_addr, res->ai_addrlen) != 0) {
        const int err = errno;
        ::freeaddrinfo(res);
        ::close(fd);
        throw ClientError(ErrorKind::BindError, "Cannot bind " + host + ":" + service + ": " +
                                                    std::strerror(err));
    }

    ::freeaddrinfo(res);
    return fd;
}

uint16_t bound_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
}

/// Clears receiving_ on scope exit and finishes a close() that arrived mid-receive.
class ReceiveGuard {
  public:
    ReceiveGuard(std::atomic<bool> &receiving, std::atomic<bool> &closed,
                 std::function<void()> release)
        : receiving_(receiving), closed_(closed), release_(std::move(release)) {}

    ~ReceiveGuard() {
        receiving_.store(false);
        if (closed_.load()) {
            release_();
        }
    }

    ReceiveGuard(const ReceiveGuard &) = delete;
    ReceiveGuard &operator=(const ReceiveGuard &) = delete;

  private:
    std::atomic<bool> &receiving_;
    std::atomic<bool> &closed_;
    std::function<void()> release_;
};

} // namespace

TelemetryClient::TelemetryClient(const std::string &host, uint16_t port,
                                 size_t receive_buffer_size,
                                 const protocol::Dispatcher &dispatcher)
    : host_(host), dispatcher_(dispatcher), buffer_(receive_buffer_size) {
    if (receive_buffer_size < protocol::kHeaderSize) {
        throw std::invalid_argument("Receive buffer must hold at least a packet header");
    }

    ix::initNetSystem();

    interrupt_ = ix::createSelectInterrupt();
    std::string err;
    if (!interrupt_->init(err)) {
        throw ClientError(ErrorKind::BindError, "Cannot create close notifier: " + err);
    }

    fd_ = bind_udp(host_, port);
    local_port_ = bound_port(fd_);
}

TelemetryClient::~TelemetryClient() { close(); }

protocol::Packet TelemetryClient::receive() {
    // Only a timeout yields no packet.
    return *receive_impl(-1);
}

std::optional<protocol::Packet> TelemetryClient::receive_for(std::chrono::milliseconds timeout) {
    // poll() takes an int; longer waits saturate instead of wrapping.
    const auto ms = std::clamp<std::chrono::milliseconds::rep>(timeout.count(), 0,
                                                               std::numeric_limits<int>::max());
    return receive_impl(static_cast<int>(ms));
}

void TelemetryClient::close() {
    if (closed_.exchange(true)) {
        return;
    }
    interrupt_->notify(kCloseRequest);
    if (!receiving_.load()) {
        release_socket();
    }
}

std::optional<protocol::Packet> TelemetryClient::receive_impl(int timeout_ms) {
    if (closed_.load()) {
        throw ClientError(ErrorKind::Closed, "Client is closed");
    }
    if (receiving_.exchange(true)) {
        throw ClientError(ErrorKind::ConcurrentReceive,
                          "A receive is already in progress on this client");
    }
    ReceiveGuard guard(receiving_, closed_, [this] { release_socket(); });

    if (closed_.load()) {
        throw ClientError(ErrorKind::Closed, "Client is closed");
    }

    while (true) {
        if (!wait_readable(timeout_ms)) {
            return std::nullopt;
        }

        const ssize_t n = ::recvfrom(fd_, buffer_.data(), buffer_.size(), 0, nullptr, nullptr);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw ClientError(ErrorKind::ReceiveFailed,
                              std::string("recvfrom failed: ") + std::strerror(errno));
        }

        return dispatcher_.decode(
            std::span<const uint8_t>(buffer_.data(), static_cast<size_t>(n)));
    }
}

bool TelemetryClient::wait_readable(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        pollfd fds[2] = {};
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[1].fd = interrupt_->getFd();
        fds[1].events = POLLIN;

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }

        const int rc = ::poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ClientError(ErrorKind::ReceiveFailed,
                              std::string("poll failed: ") + std::strerror(errno));
        }
        if (fds[1].revents != 0 || closed_.load()) {
            throw ClientError(ErrorKind::Closed, "Client was closed while receiving");
        }
        if (rc == 0) {
            return false;
        }
        if (fds[0].revents & (POLLERR | POLLNVAL)) {
            throw ClientError(ErrorKind::ReceiveFailed, "Socket error while waiting for data");
        }
        if (fds[0].revents & POLLIN) {
            return true;
        }
    }
}

void TelemetryClient::release_socket() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace paddock::net
