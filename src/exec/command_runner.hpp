#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include <core/errors.hpp>
#include <core/logger.hpp>
#include <core/types.hpp>
#include <remote/remote_spec.hpp>
#include <ssh/transport.hpp>

// A command to run on the end host.
struct CommandRequest {
    // A single element is passed to the remote shell verbatim; several are
    // shell-quoted one by one and joined.
    std::vector<std::string> argv;
    std::string input;   // written to the remote stdin
    bool sudo = false;
};

// Remote command line for a request, with the escalation prefix if asked
std::string build_command_line(const CommandRequest& request);

// Runs commands on an end-host connection within the remote's cmd_timeout.
//
// With sudo, the password travels as the first stdin line, never on the
// command line. A non-zero exit status is returned as data.
class CommandRunner {
public:
    explicit CommandRunner(Logger log);

    RemoteResult<CommandResult> run(HopConnection& end_host,
                                    const CommandRequest& request,
                                    const RemoteSpec& spec,
                                    const std::atomic<bool>* cancel = nullptr) const;

private:
    Logger log_;
};
