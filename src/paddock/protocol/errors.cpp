#include "paddock/protocol/errors.hpp"

namespace paddock {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Truncated:
        return "Truncated";
    case ErrorKind::UnsupportedVersion:
        return "UnsupportedVersion";
    case ErrorKind::UnknownPacketId:
        return "UnknownPacketId";
    case ErrorKind::MalformedField:
        return "MalformedField";
    case ErrorKind::BindError:
        return "BindError";
    case ErrorKind::Closed:
        return "Closed";
    case ErrorKind::ConcurrentReceive:
        return "ConcurrentReceive";
    case ErrorKind::ReceiveFailed:
        return "ReceiveFailed";
    }
    return "Unknown";
}

DecodeError DecodeError::truncated(std::string_view what, size_t needed, size_t available) {
    return DecodeError(ErrorKind::Truncated, std::string(what) + ": need " +
                                                 std::to_string(needed) + " bytes, have " +
                                                 std::to_string(available));
}

DecodeError DecodeError::malformed(std::string_view field, long long raw_value) {
    return DecodeError(ErrorKind::MalformedField,
                       "Invalid value " + std::to_string(raw_value) + " for '" +
                           std::string(field) + "'",
                       std::string(field));
}

} // namespace paddock
