#include "logger.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <functional>
#include <sstream>
#include <thread>

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Error:    return "ERROR";
    case LogLevel::Warning:  return "WARNING";
    case LogLevel::Info:     return "INFO";
    case LogLevel::Debug:    return "DEBUG";
    }
    return "ERROR";
}

LogLevel level_from_verbosity(int verbose, bool quiet) {
    if (quiet) return LogLevel::Critical;
    switch (verbose) {
    case 0:  return LogLevel::Error;
    case 1:  return LogLevel::Warning;
    case 2:  return LogLevel::Info;
    default: return verbose < 0 ? LogLevel::Error : LogLevel::Debug;
    }
}

// ── LogSink ──────────────────────────────────────────────────

LogSink::LogSink(std::ostream& console, LogLevel level)
    : console_(console), level_(level) {}

Result<void> LogSink::open_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.open(path, std::ios::app);
    if (!file_) {
        return Result<void>::Err("Cannot open log file: " + path);
    }
    return Result<void>::Ok();
}

void LogSink::write(LogLevel level, const std::string& line) {
    if (level > level_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    console_ << line << "\n";
    console_.flush();
    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }
}

// ── Redaction ────────────────────────────────────────────────

static bool is_secret_key(const std::string& key) {
    std::string k = to_lower(key);
    return k == "password" || k == "secret" || k == "sudo_password" ||
           k == "passphrase" || k == "pwd";
}

std::string clean_uri(const std::string& value) {
    // userinfo ends at the last '@', as in parse_remote_uri
    auto scheme_end = value.find("://");
    auto auth_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto at = value.rfind('@');
    if (at == std::string::npos || at < auth_start) return value;
    auto colon = value.find(':', auth_start);
    if (colon == std::string::npos || colon > at) return value;
    return value.substr(0, colon + 1) + "***" + value.substr(at);
}

std::string clean_text(const std::string& text) {
    static const char* DELIMS = " \t\n'\"";
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        auto start = text.find_first_not_of(DELIMS, pos);
        out += text.substr(pos, start == std::string::npos ? std::string::npos : start - pos);
        if (start == std::string::npos) break;
        auto end = text.find_first_of(DELIMS, start);
        out += clean_uri(text.substr(start, end == std::string::npos ? std::string::npos : end - start));
        pos = end == std::string::npos ? text.size() : end;
    }
    return out;
}

std::string redact_field(const std::string& key, const std::string& value) {
    if (is_secret_key(key)) return value.empty() ? value : "***";
    return clean_text(value);
}

// ── Logger ───────────────────────────────────────────────────

Logger::Logger(std::string name, std::shared_ptr<LogSink> sink)
    : name_(std::move(name)), sink_(std::move(sink)) {}

Logger Logger::child(const std::string& suffix) const {
    return Logger(name_ + "." + suffix, sink_);
}

bool Logger::enabled(LogLevel level) const {
    return sink_ && level <= sink_->level();
}

void Logger::log(LogLevel level, const std::string& msg, const LogFields& fields) const {
    if (!enabled(level)) return;

    static const std::string host = platform::hostname();
    std::ostringstream tid;
    tid << std::this_thread::get_id();

    std::string line = fmt::format("{} {} {} {:<14} {:<8} {}",
                                   now_iso(), host, tid.str(), name_,
                                   log_level_name(level), clean_text(msg));
    if (!fields.empty()) {
        line += " |";
        for (const auto& [key, value] : fields) {
            line += fmt::format(" {}={}", key, redact_field(key, value));
        }
    }
    sink_->write(level, line);
}
