#include "../command_registry.hpp"
#include "../parsers.hpp"
#include <core/constants.hpp>
#include <sstream>

const std::vector<std::string> AVAHI_FIELDS = {
    "kind", "nic", "proto", "name", "service", "local", "hostname", "addr", "port",
};

std::vector<Record> parse_avahi_browse(const std::string& output) {
    std::vector<Record> records;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        Record rec;
        std::string rest = line;
        for (const auto& field : AVAHI_FIELDS) {
            auto p = rest.find(';');
            if (p == std::string::npos) {
                rec.emplace_back(field, rest);
                break;
            }
            rec.emplace_back(field, rest.substr(0, p));
            rest = rest.substr(p + 1);
        }
        records.push_back(rec);
    }
    return records;
}

namespace {

class AvahiBrowseCommand : public Command {
public:
    Result<CommandRequest> prepare(const std::vector<std::string>& args, bool sudo) override {
        if (!args.empty()) {
            return Result<CommandRequest>::Err("Usage: jumprun avahi-browse");
        }
        CommandRequest request;
        request.argv = {AVAHI_BROWSE_CMD};
        request.sudo = sudo;
        return Result<CommandRequest>::Ok(request);
    }

    std::vector<Record> parse(const CommandResult& result) const override {
        return parse_avahi_browse(result.stdout_data);
    }
};

} // namespace

void register_avahi_commands(CommandRegistry& registry) {
    registry.add_command("avahi-browse", [] { return std::make_unique<AvahiBrowseCommand>(); },
                         "Browse mDNS services on every remote");
}
