#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include "command.hpp"

// Explicit name → factory table for sub-commands.
class CommandRegistry {
public:
    using Factory = std::function<std::unique_ptr<Command>()>;

    void add_command(const std::string& name, Factory factory, const std::string& help);

    bool contains(const std::string& name) const { return commands_.count(name) > 0; }

    // nullptr for an unknown name
    std::unique_ptr<Command> create(const std::string& name) const;

    std::string help_text() const;

private:
    std::map<std::string, std::pair<Factory, std::string>> commands_;
};

// Command registration, one call per group
void register_shell_commands(CommandRegistry& registry);
void register_script_commands(CommandRegistry& registry);
void register_avahi_commands(CommandRegistry& registry);

void register_builtin_commands(CommandRegistry& registry);
