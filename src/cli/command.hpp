#pragma once

#include <string>
#include <vector>
#include <utility>
#include <core/types.hpp>
#include <exec/command_runner.hpp>

// One row of structured command output, fields in display order
using Record = std::vector<std::pair<std::string, std::string>>;

// A sub-command of the jumprun CLI.
class Command {
public:
    virtual ~Command() = default;

    // Check the command's own arguments and build what runs remotely.
    // An error here is a usage error.
    virtual Result<CommandRequest> prepare(const std::vector<std::string>& args, bool sudo) = 0;

    // Structured view of a successful result; empty means show raw output
    virtual std::vector<Record> parse(const CommandResult& result) const {
        (void)result;
        return {};
    }
};
