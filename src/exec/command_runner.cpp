#include "command_runner.hpp"
#include <core/constants.hpp>
#include <core/deadline.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>

std::string build_command_line(const CommandRequest& request) {
    std::string cmd = request.argv.size() == 1 ? request.argv[0] : join_command(request.argv);
    if (request.sudo) {
        return fmt::format("{} {}", SUDO_PREFIX, cmd);
    }
    return cmd;
}

CommandRunner::CommandRunner(Logger log) : log_(std::move(log)) {
}

RemoteResult<CommandResult> CommandRunner::run(HopConnection& end_host,
                                               const CommandRequest& request,
                                               const RemoteSpec& spec,
                                               const std::atomic<bool>* cancel) const {
    using Outcome = RemoteResult<CommandResult>;

    if (request.argv.empty()) {
        return Outcome::Err(ErrorKind::Fatal, "Empty command");
    }

    std::string input;
    if (request.sudo) {
        if (!spec.sudo_password) {
            return Outcome::Err(ErrorKind::MalformedRemoteSpec,
                                "Privilege escalation requested but no password is available");
        }
        input = *spec.sudo_password + "\n";
    }
    input += request.input;

    std::string command_line = build_command_line(request);
    log_.debug("Running command", {{"remote", spec.identity()}, {"command", command_line},
                                   {"sudo", request.sudo ? "yes" : "no"}});

    // The clock starts at submission, independent of the login phase
    auto deadline = Deadline::after(
        std::chrono::duration_cast<std::chrono::milliseconds>(spec.cmd_timeout), cancel);
    auto result = end_host.execute(command_line, input, deadline);

    if (result.is_err()) {
        if (result.error.kind == ErrorKind::CommandTimedOut) {
            result.error.message = fmt::format("{} (cmd_timeout {}s)", result.error.message,
                                               spec.cmd_timeout.count());
        }
        return result;
    }

    log_.debug("Command finished", {{"remote", spec.identity()},
                                    {"exit_status", std::to_string(result.value.exit_status)}});
    return result;
}
