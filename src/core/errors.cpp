#include "errors.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MalformedRemoteSpec:  return "MalformedRemoteSpec";
    case ErrorKind::AuthenticationFailed: return "AuthenticationFailed";
    case ErrorKind::HostUnreachable:      return "HostUnreachable";
    case ErrorKind::HostKeyRejected:      return "HostKeyRejected";
    case ErrorKind::LoginTimedOut:        return "LoginTimedOut";
    case ErrorKind::CommandTimedOut:      return "CommandTimedOut";
    case ErrorKind::TransportLost:        return "TransportLost";
    case ErrorKind::Cancelled:            return "Cancelled";
    case ErrorKind::Fatal:                return "Fatal";
    }
    return "Fatal";
}

std::string describe(const RemoteError& err) {
    if (err.message.empty()) return error_kind_name(err.kind);
    return fmt::format("{}: {}", error_kind_name(err.kind), err.message);
}
