#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace YAML { class Node; }

namespace fs = std::filesystem;

// Settings from the rc.yaml layers. Later layers override earlier ones
// key by key; command-line options are applied on top by the caller.
class Config {
public:
    // Load every existing file of `layers`, then `explicit_path` (which
    // must exist)
    static Result<Config> load(const std::optional<fs::path>& explicit_path,
                               const std::vector<fs::path>& layers);
    static Result<Config> load(const std::optional<fs::path>& explicit_path = std::nullopt);

    // Overlay one YAML document (used for each layer, and by tests)
    Result<void> apply_yaml(const std::string& text, const std::string& source);
    Result<void> apply_file(const fs::path& path);

    int cmd_timeout() const { return cmd_timeout_; }
    int login_timeout() const { return login_timeout_; }
    bool strict_host_key_checking() const { return strict_host_key_checking_; }
    const std::string& known_hosts() const { return known_hosts_; }
    const std::vector<std::string>& identity_files() const { return identity_files_; }
    size_t max_parallel() const { return max_parallel_; }
    const std::optional<std::string>& log_file() const { return log_file_; }
    const std::string& output_format() const { return output_format_; }

    // Files that contributed, in load order
    const std::vector<std::string>& sources() const { return sources_; }

public:
    Config();

private:
    int cmd_timeout_;
    int login_timeout_;
    bool strict_host_key_checking_;
    std::string known_hosts_;
    std::vector<std::string> identity_files_;
    size_t max_parallel_;
    std::optional<std::string> log_file_;
    std::string output_format_;
    std::vector<std::string> sources_;

    Result<void> overlay(const YAML::Node& root, const std::string& source);
};

// Default layers, lowest precedence first
std::vector<fs::path> get_config_search_paths();
