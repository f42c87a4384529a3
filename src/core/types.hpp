#pragma once

#include <string>
#include <optional>
#include <vector>
#include <utility>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one remote command that ran to completion.
// A non-zero exit_status is data, not an error.
struct CommandResult {
    int exit_status = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::string exit_signal;     // empty unless the process died from a signal

    bool exited_cleanly() const { return exit_status == 0 && exit_signal.empty(); }
};

// Payload attached to structured log lines
using LogFields = std::vector<std::pair<std::string, std::string>>;
