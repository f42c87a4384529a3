#pragma once

#include <string>
#include <vector>
#include <utility>

// Failure taxonomy of the remote execution core.
enum class ErrorKind {
    MalformedRemoteSpec,   // bad input, local, never retried
    AuthenticationFailed,  // build phase
    HostUnreachable,       // build phase
    HostKeyRejected,       // build phase
    LoginTimedOut,         // build phase
    CommandTimedOut,       // execution phase
    TransportLost,         // execution phase
    Cancelled,             // batch interrupted
    Fatal,                 // anything uncategorized
};

const char* error_kind_name(ErrorKind kind);

struct RemoteError {
    ErrorKind kind = ErrorKind::Fatal;
    std::string message;
};

// Secondary diagnostic: closing hop `hop_index` failed.
struct CleanupError {
    int hop_index = -1;
    std::string host;
    std::string message;
};

// Typed result returned by every fallible core operation.
// cleanup_errors may be non-empty on success and on failure alike; they never
// replace the primary error.
template <typename T>
struct RemoteResult {
    bool success;
    T value;
    RemoteError error;
    std::vector<CleanupError> cleanup_errors;

    static RemoteResult<T> Ok(T val) {
        return {true, std::move(val), RemoteError{}, {}};
    }

    static RemoteResult<T> Err(ErrorKind kind, const std::string& message) {
        return {false, T{}, RemoteError{kind, message}, {}};
    }

    static RemoteResult<T> Err(const RemoteError& err) {
        return {false, T{}, err, {}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

template <>
struct RemoteResult<void> {
    bool success;
    RemoteError error;
    std::vector<CleanupError> cleanup_errors;

    static RemoteResult<void> Ok() {
        return {true, RemoteError{}, {}};
    }

    static RemoteResult<void> Err(ErrorKind kind, const std::string& message) {
        return {false, RemoteError{kind, message}, {}};
    }

    static RemoteResult<void> Err(const RemoteError& err) {
        return {false, err, {}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Human readable "<Kind>: <message>" for logs and output.
std::string describe(const RemoteError& err);
