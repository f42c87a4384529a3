#include "command_registry.hpp"
#include <fmt/format.h>

void CommandRegistry::add_command(const std::string& name, Factory factory,
                                  const std::string& help) {
    commands_[name] = {std::move(factory), help};
}

std::unique_ptr<Command> CommandRegistry::create(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) return nullptr;
    return it->second.first();
}

std::string CommandRegistry::help_text() const {
    std::string text = "Commands:\n";
    for (const auto& [name, entry] : commands_) {
        text += fmt::format("  {:<14}{}\n", name, entry.second);
    }
    return text;
}

void register_builtin_commands(CommandRegistry& registry) {
    register_shell_commands(registry);
    register_script_commands(registry);
    register_avahi_commands(registry);
}
