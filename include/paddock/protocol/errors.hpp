#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace paddock {

enum class ErrorKind {
    // Per-datagram decode failures (recoverable).
    Truncated,
    UnsupportedVersion,
    UnknownPacketId,
    MalformedField,
    // Client failures.
    BindError,
    Closed,
    ConcurrentReceive,
    ReceiveFailed,
};

/// Stable name of an error kind, e.g. "Truncated".
[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

/// Base of every error thrown by the library.
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }

    /// Decode errors are local to one datagram. Only BindError and Closed end a client.
    [[nodiscard]] bool recoverable() const {
        return kind_ != ErrorKind::BindError && kind_ != ErrorKind::Closed;
    }

  private:
    ErrorKind kind_;
};

/// A datagram could not be decoded. The listener stays usable.
class DecodeError : public Error {
  public:
    DecodeError(ErrorKind kind, const std::string &message, std::string field = {})
        : Error(kind, message), field_(std::move(field)) {}

    static DecodeError truncated(std::string_view what, size_t needed, size_t available);
    static DecodeError malformed(std::string_view field, long long raw_value);

    /// Name of the offending field for MalformedField, empty otherwise.
    [[nodiscard]] const std::string &field() const { return field_; }

  private:
    std::string field_;
};

/// Socket setup or receive failure, or use after close.
class ClientError : public Error {
  public:
    using Error::Error;
};

} // namespace paddock
