#include "../command_registry.hpp"
#include <fstream>
#include <sstream>

namespace {

// Runs a local bash script remotely, fed through stdin
class ScriptCommand : public Command {
public:
    Result<CommandRequest> prepare(const std::vector<std::string>& args, bool sudo) override {
        if (args.size() != 1) {
            return Result<CommandRequest>::Err("Usage: jumprun script <file>");
        }
        std::ifstream in(args[0], std::ios::binary);
        if (!in) {
            return Result<CommandRequest>::Err("Cannot read script file: " + args[0]);
        }
        std::stringstream ss;
        ss << in.rdbuf();

        CommandRequest request;
        request.argv = {"bash -s"};
        request.input = ss.str();
        request.sudo = sudo;
        return Result<CommandRequest>::Ok(request);
    }
};

} // namespace

void register_script_commands(CommandRegistry& registry) {
    registry.add_command("script", [] { return std::make_unique<ScriptCommand>(); },
                         "Run a local bash script on every remote");
}
