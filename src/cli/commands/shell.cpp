#include "../command_registry.hpp"
#include "../parsers.hpp"
#include <core/utils.hpp>
#include <sstream>

namespace {

class RunCommand : public Command {
public:
    Result<CommandRequest> prepare(const std::vector<std::string>& args, bool sudo) override {
        if (args.empty()) {
            return Result<CommandRequest>::Err("Usage: jumprun run <cmd> [args...]");
        }
        CommandRequest request;
        request.argv = args;
        request.sudo = sudo;
        return Result<CommandRequest>::Ok(request);
    }
};

class HostnameCommand : public Command {
public:
    Result<CommandRequest> prepare(const std::vector<std::string>& args, bool sudo) override {
        if (!args.empty()) {
            return Result<CommandRequest>::Err("Usage: jumprun hostname");
        }
        CommandRequest request;
        request.argv = {"hostname"};
        request.sudo = sudo;
        return Result<CommandRequest>::Ok(request);
    }
};

class CatCommand : public Command {
public:
    Result<CommandRequest> prepare(const std::vector<std::string>& args, bool sudo) override {
        if (args.size() != 1) {
            return Result<CommandRequest>::Err("Usage: jumprun cat <path>");
        }
        CommandRequest request;
        request.argv = {"cat", "--", args[0]};
        request.sudo = sudo;
        return Result<CommandRequest>::Ok(request);
    }
};

class DfCommand : public Command {
public:
    Result<CommandRequest> prepare(const std::vector<std::string>& args, bool sudo) override {
        bool human = true;
        for (const auto& a : args) {
            if (a == "--no-human") {
                human = false;
            } else {
                return Result<CommandRequest>::Err("Usage: jumprun df [--no-human]");
            }
        }
        CommandRequest request;
        request.argv = human ? std::vector<std::string>{"df", "-P", "-h"}
                             : std::vector<std::string>{"df", "-P"};
        request.sudo = sudo;
        return Result<CommandRequest>::Ok(request);
    }

    std::vector<Record> parse(const CommandResult& result) const override {
        return parse_df(result.stdout_data);
    }
};

} // namespace

// POSIX df output: header line, then six whitespace-separated columns.
// The mount point may contain spaces and takes the rest of the line.
std::vector<Record> parse_df(const std::string& output) {
    static const char* FIELDS[] = {"filesystem", "size", "used", "available", "capacity"};

    std::vector<Record> records;
    std::istringstream in(output);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;
        if (header) {
            header = false;
            continue;
        }
        std::istringstream cols(line);
        Record rec;
        std::string col;
        for (const char* f : FIELDS) {
            if (!(cols >> col)) break;
            rec.emplace_back(f, col);
        }
        if (rec.size() != 5) continue;
        std::string mounted;
        std::getline(cols, mounted);
        trim(mounted);
        rec.emplace_back("mounted_on", mounted);
        records.push_back(rec);
    }
    return records;
}

void register_shell_commands(CommandRegistry& registry) {
    registry.add_command("run", [] { return std::make_unique<RunCommand>(); },
                         "Run a command on every remote");
    registry.add_command("hostname", [] { return std::make_unique<HostnameCommand>(); },
                         "Print the remote host name");
    registry.add_command("cat", [] { return std::make_unique<CatCommand>(); },
                         "Print a remote file");
    registry.add_command("df", [] { return std::make_unique<DfCommand>(); },
                         "Show disk usage");
}
