#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <remote/remote_spec.hpp>

// Everything the command line says, before config files are merged in.
struct CliArguments {
    int verbose = 0;
    bool quiet = false;
    bool version = false;
    bool help = false;
    bool check = false;
    std::optional<std::string> log_file;
    std::optional<std::string> conf;
    std::optional<std::string> output_format;
    std::optional<std::string> output_file;

    std::vector<std::string> remotes;
    std::vector<std::string> jump_hosts;
    bool sudo = false;
    std::optional<int> cmd_timeout;
    std::optional<int> login_timeout;
    bool strict_host_key_checking = false;

    std::string command;
    std::vector<std::string> command_args;
};

// Parse argv (without the program name). Options come before the command;
// everything after the command name belongs to the command.
Result<CliArguments> parse_arguments(const std::vector<std::string>& argv);

// Combine command-line remote options with config defaults
RemoteOptions make_remote_options(const CliArguments& args, int default_cmd_timeout,
                                  int default_login_timeout, bool default_strict);

std::string usage_text();
