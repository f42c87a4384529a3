#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

Config::Config()
    : cmd_timeout_(DEFAULT_CMD_TIMEOUT_SECS),
      login_timeout_(DEFAULT_LOGIN_TIMEOUT_SECS),
      strict_host_key_checking_(false),
      known_hosts_(platform::expand_user("~/.ssh/known_hosts").string()),
      identity_files_({platform::expand_user("~/.ssh/id_ed25519").string(),
                       platform::expand_user("~/.ssh/id_ecdsa").string(),
                       platform::expand_user("~/.ssh/id_rsa").string()}),
      max_parallel_(std::max(1u, std::thread::hardware_concurrency())),
      output_format_("txt") {
}

std::vector<fs::path> get_config_search_paths() {
    return {
        fs::path("/etc") / "jumprun" / "rc.yaml",
        platform::home_dir() / ".config" / "jumprun" / "rc.yaml",
        fs::current_path() / "rc.yaml",
    };
}

static Result<int> positive_int(const YAML::Node& node, const char* key) {
    int value = node.as<int>();
    if (value <= 0) {
        return Result<int>::Err(fmt::format("'{}' must be a positive integer", key));
    }
    return Result<int>::Ok(value);
}

Result<void> Config::overlay(const YAML::Node& root, const std::string& source) {
    // An empty document changes nothing
    if (!root || root.IsNull()) {
        sources_.push_back(source);
        return Result<void>::Ok();
    }
    if (!root.IsMap()) {
        return Result<void>::Err(fmt::format("{}: top level must be a mapping", source));
    }

    try {
        if (root["cmd_timeout"]) {
            auto v = positive_int(root["cmd_timeout"], "cmd_timeout");
            if (v.is_err()) return Result<void>::Err(fmt::format("{}: {}", source, v.error));
            cmd_timeout_ = v.value;
        }
        if (root["login_timeout"]) {
            auto v = positive_int(root["login_timeout"], "login_timeout");
            if (v.is_err()) return Result<void>::Err(fmt::format("{}: {}", source, v.error));
            login_timeout_ = v.value;
        }
        if (root["max_parallel"]) {
            auto v = positive_int(root["max_parallel"], "max_parallel");
            if (v.is_err()) return Result<void>::Err(fmt::format("{}: {}", source, v.error));
            max_parallel_ = static_cast<size_t>(v.value);
        }
        if (root["strict_host_key_checking"]) {
            strict_host_key_checking_ = root["strict_host_key_checking"].as<bool>();
        }
        if (root["known_hosts"]) {
            known_hosts_ = platform::expand_user(root["known_hosts"].as<std::string>()).string();
        }
        if (root["identity_files"]) {
            const auto& node = root["identity_files"];
            std::vector<std::string> files;
            if (node.IsScalar()) {
                files.push_back(platform::expand_user(node.as<std::string>()).string());
            } else if (node.IsSequence()) {
                for (const auto& f : node) {
                    files.push_back(platform::expand_user(f.as<std::string>()).string());
                }
            } else {
                return Result<void>::Err(
                    fmt::format("{}: 'identity_files' must be a path or a list of paths", source));
            }
            identity_files_ = files;
        }
        if (root["log_file"]) {
            log_file_ = platform::expand_user(root["log_file"].as<std::string>()).string();
        }
        if (root["output_format"]) {
            std::string fmt_name = root["output_format"].as<std::string>();
            if (fmt_name != "txt" && fmt_name != "yaml") {
                return Result<void>::Err(
                    fmt::format("{}: unknown output_format '{}' (txt or yaml)", source, fmt_name));
            }
            output_format_ = fmt_name;
        }
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("{}: {}", source, e.what()));
    }

    sources_.push_back(source);
    return Result<void>::Ok();
}

Result<void> Config::apply_yaml(const std::string& text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("Failed to parse {}: {}", source, e.what()));
    }
    return overlay(root, source);
}

Result<void> Config::apply_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<void>::Err("Failed to read config file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return apply_yaml(ss.str(), path.string());
}

Result<Config> Config::load(const std::optional<fs::path>& explicit_path) {
    return load(explicit_path, get_config_search_paths());
}

Result<Config> Config::load(const std::optional<fs::path>& explicit_path,
                            const std::vector<fs::path>& layers) {
    Config config;

    for (const auto& path : layers) {
        std::error_code ec;
        if (!fs::exists(path, ec)) continue;
        auto applied = config.apply_file(path);
        if (applied.is_err()) return Result<Config>::Err(applied.error);
    }

    if (explicit_path) {
        if (!fs::exists(*explicit_path)) {
            return Result<Config>::Err("Specified RC file not found: " + explicit_path->string());
        }
        auto applied = config.apply_file(*explicit_path);
        if (applied.is_err()) return Result<Config>::Err(applied.error);
    }

    return Result<Config>::Ok(config);
}
