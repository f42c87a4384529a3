#include "jumprun_cli.hpp"
#include "arguments.hpp"
#include "output.hpp"
#include "theme.hpp"
#include <chain/chain_builder.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/logger.hpp>
#include <dispatch/task_dispatcher.hpp>
#include <exec/command_runner.hpp>
#include <remote/remote_spec.hpp>
#include <ssh/libssh2_transport.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <memory>

JumprunCLI::JumprunCLI(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {
    register_builtin_commands(registry_);
}

int JumprunCLI::usage_error(const std::string& msg) {
    err_ << theme::fail(clean_text(msg));
    err_ << theme::step("Run 'jumprun --help' for usage.");
    return EXIT_CODE_USAGE;
}

int JumprunCLI::run(const std::vector<std::string>& argv, const std::atomic<bool>* cancel) {
    auto parsed = parse_arguments(argv);
    if (parsed.is_err()) return usage_error(parsed.error);
    const CliArguments& args = parsed.value;

    if (args.version) {
        out_ << fmt::format("jumprun {}\n", JUMPRUN_VERSION);
        return EXIT_CODE_OK;
    }
    if (args.help) {
        out_ << usage_text() << "\n" << registry_.help_text();
        return EXIT_CODE_OK;
    }

    std::optional<std::filesystem::path> conf;
    if (args.conf) conf = std::filesystem::path(*args.conf);
    auto config_result = config_layers_ ? Config::load(conf, *config_layers_) : Config::load(conf);
    if (config_result.is_err()) return usage_error(config_result.error);
    const Config& config = config_result.value;

    // Logging
    auto sink = std::make_shared<LogSink>(err_, level_from_verbosity(args.verbose, args.quiet));
    auto log_file = args.log_file ? args.log_file : config.log_file();
    if (log_file) {
        auto opened = sink->open_file(*log_file);
        if (opened.is_err()) return usage_error(opened.error);
    }
    Logger log("jumprun", sink);
    log.debug("Configuration loaded", {{"sources", std::to_string(config.sources().size())}});

    // Command
    if (args.command.empty()) return usage_error("Missing command");
    auto command = registry_.create(args.command);
    if (!command) return usage_error("Unknown command: " + args.command);

    auto request = command->prepare(args.command_args, args.sudo);
    if (request.is_err()) return usage_error(request.error);

    // Remotes
    if (args.remotes.empty()) return usage_error("At least one --remote is required");
    auto options = make_remote_options(args, config.cmd_timeout(), config.login_timeout(),
                                       config.strict_host_key_checking());
    auto specs = resolve_remote_specs(options);
    if (specs.is_err()) {
        log.error("Invalid remote", {{"error", specs.error.message},
                                     {"kind", error_kind_name(specs.error.kind)}});
        return usage_error(describe(specs.error));
    }

    // Output
    auto format = parse_output_format(args.output_format.value_or(config.output_format()));
    if (format.is_err()) return usage_error(format.error);
    std::ofstream file_out;
    if (args.output_file) {
        file_out.open(*args.output_file, std::ios::out | std::ios::trunc);
        if (!file_out) return usage_error("Cannot write output file: " + *args.output_file);
    }
    std::ostream& out = args.output_file ? static_cast<std::ostream&>(file_out) : out_;

    // Dispatch
    std::unique_ptr<Libssh2Transport> own_transport;
    Transport* transport = transport_override_;
    if (!transport) {
        own_transport = std::make_unique<Libssh2Transport>(log.child("ssh"));
        transport = own_transport.get();
    }

    HopOptions hop_options;
    hop_options.known_hosts_path = config.known_hosts();
    hop_options.identity_files = config.identity_files();

    ChainBuilder builder(*transport, hop_options, log.child("chain"));
    CommandRunner runner(log.child("exec"));
    TaskDispatcher dispatcher(builder, log.child("dispatch"), config.max_parallel());

    const CommandRequest& req = request.value;
    RemoteTask task = [&runner, &req](const TaskContext& ctx) {
        return runner.run(ctx.end_host, req, ctx.spec, ctx.cancel);
    };

    auto outcomes = dispatcher.dispatch(specs.value, task, args.command, cancel);
    write_outcomes(out, format.value, outcomes, *command);
    out.flush();

    if (!all_succeeded(outcomes)) return EXIT_CODE_REMOTE_FAILED;
    if (args.check) {
        bool all_clean = std::all_of(outcomes.begin(), outcomes.end(), [](const RemoteOutcome& o) {
            return o.result.value.exited_cleanly();
        });
        if (!all_clean) return EXIT_CODE_REMOTE_FAILED;
    }
    return EXIT_CODE_OK;
}
