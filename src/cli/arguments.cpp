#include "arguments.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

// Options that consume a value
enum class ValueOpt {
    None,
    LogFile,
    Conf,
    OutputFormat,
    OutputFile,
    Remote,
    JumpHost,
    CmdTimeout,
    LoginTimeout,
};

ValueOpt value_option(const std::string& name) {
    if (name == "--log-file") return ValueOpt::LogFile;
    if (name == "-c" || name == "--conf") return ValueOpt::Conf;
    if (name == "-F" || name == "--output-format") return ValueOpt::OutputFormat;
    if (name == "-O" || name == "--output-file") return ValueOpt::OutputFile;
    if (name == "-R" || name == "--remote") return ValueOpt::Remote;
    if (name == "-J" || name == "--jump-host") return ValueOpt::JumpHost;
    if (name == "--cmd-timeout") return ValueOpt::CmdTimeout;
    if (name == "--login-timeout") return ValueOpt::LoginTimeout;
    return ValueOpt::None;
}

Result<int> parse_timeout(const std::string& name, const std::string& value) {
    int v = safe_stoi(value, -1);
    if (v <= 0) {
        return Result<int>::Err(fmt::format("{} expects a positive number of seconds, got '{}'",
                                            name, value));
    }
    return Result<int>::Ok(v);
}

Result<void> apply_value(CliArguments& args, ValueOpt opt, const std::string& name,
                         const std::string& value) {
    switch (opt) {
    case ValueOpt::LogFile:      args.log_file = value; break;
    case ValueOpt::Conf:         args.conf = value; break;
    case ValueOpt::OutputFile:   args.output_file = value; break;
    case ValueOpt::Remote:       args.remotes.push_back(value); break;
    case ValueOpt::JumpHost:     args.jump_hosts.push_back(value); break;
    case ValueOpt::OutputFormat:
        if (value != "txt" && value != "yaml") {
            return Result<void>::Err(fmt::format("{}: invalid choice '{}' (txt, yaml)", name, value));
        }
        args.output_format = value;
        break;
    case ValueOpt::CmdTimeout: {
        auto v = parse_timeout(name, value);
        if (v.is_err()) return Result<void>::Err(v.error);
        args.cmd_timeout = v.value;
        break;
    }
    case ValueOpt::LoginTimeout: {
        auto v = parse_timeout(name, value);
        if (v.is_err()) return Result<void>::Err(v.error);
        args.login_timeout = v.value;
        break;
    }
    case ValueOpt::None:
        break;
    }
    return Result<void>::Ok();
}

} // namespace

Result<CliArguments> parse_arguments(const std::vector<std::string>& argv) {
    CliArguments args;

    size_t i = 0;
    for (; i < argv.size(); i++) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-' || arg == "-") break;  // the command
        if (arg == "--") {
            i++;
            break;
        }

        // --name=value
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        ValueOpt opt = value_option(arg);
        if (opt != ValueOpt::None) {
            std::string value;
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < argv.size()) {
                value = argv[++i];
            } else {
                return Result<CliArguments>::Err(fmt::format("{} expects a value", arg));
            }
            auto applied = apply_value(args, opt, arg, value);
            if (applied.is_err()) return Result<CliArguments>::Err(applied.error);
            continue;
        }

        if (inline_value) {
            return Result<CliArguments>::Err(fmt::format("{} does not take a value", arg));
        }

        if (arg == "--verbose") { args.verbose++; continue; }
        if (arg == "--quiet") { args.quiet = true; continue; }
        if (arg == "--version") { args.version = true; continue; }
        if (arg == "--help") { args.help = true; continue; }
        if (arg == "--sudo") { args.sudo = true; continue; }
        if (arg == "--check") { args.check = true; continue; }
        if (arg == "--strict-host-key-checking") { args.strict_host_key_checking = true; continue; }

        // Bundled short flags: -vvv, -qV
        if (arg.size() >= 2 && arg[1] != '-') {
            bool known = true;
            for (size_t k = 1; k < arg.size() && known; k++) {
                switch (arg[k]) {
                case 'v': args.verbose++; break;
                case 'q': args.quiet = true; break;
                case 'V': args.version = true; break;
                case 'h': args.help = true; break;
                default: known = false; break;
                }
            }
            if (known) continue;
        }

        return Result<CliArguments>::Err(fmt::format("Unknown option: {}", arg));
    }

    if (i < argv.size()) {
        args.command = argv[i];
        args.command_args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i) + 1, argv.end());
    }

    return Result<CliArguments>::Ok(args);
}

RemoteOptions make_remote_options(const CliArguments& args, int default_cmd_timeout,
                                  int default_login_timeout, bool default_strict) {
    RemoteOptions options;
    options.remotes = args.remotes;
    options.jump_hosts = args.jump_hosts;
    options.sudo = args.sudo;
    options.cmd_timeout = args.cmd_timeout.value_or(default_cmd_timeout);
    options.login_timeout = args.login_timeout.value_or(default_login_timeout);
    options.strict_host_key_checking = args.strict_host_key_checking || default_strict;
    return options;
}

std::string usage_text() {
    return
        "Usage: jumprun [options] <command> [args...]\n"
        "\n"
        "Options:\n"
        "  -v, --verbose                  More log output (-v warning, -vv info, -vvv debug)\n"
        "  -q, --quiet                    Only log critical errors\n"
        "      --log-file FILE            Also write logs to FILE\n"
        "  -c, --conf FILE                Read this rc file after the default ones\n"
        "  -F, --output-format FMT        txt or yaml\n"
        "  -O, --output-file FILE         Write output to FILE instead of stdout\n"
        "  -V, --version                  Print version\n"
        "  -h, --help                     Show this help\n"
        "\n"
        "Remote:\n"
        "  -R, --remote URI               ssh://[user[:secret]@]host[:port] or a bare host\n"
        "                                 reusing the previous URI's credentials; repeatable\n"
        "  -J, --jump-host URI            Jump host, in order; repeatable\n"
        "      --sudo                     Run as root; the remote's secret is the sudo password\n"
        "      --cmd-timeout SECS         Command execution timeout\n"
        "      --login-timeout SECS       Timeout for opening the whole chain\n"
        "      --strict-host-key-checking Reject unknown or changed host keys\n"
        "      --check                    Treat a non-zero remote exit status as failure\n";
}
