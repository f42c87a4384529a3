#pragma once

#include <atomic>
#include <ostream>
#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <ssh/transport.hpp>
#include "command_registry.hpp"

// Top level of the command-line tool: arguments, config, logging, one
// dispatch batch, output. Returns the process exit code.
class JumprunCLI {
public:
    JumprunCLI(std::ostream& out, std::ostream& err);

    // Use this transport instead of libssh2
    void set_transport(Transport* transport) { transport_override_ = transport; }

    // Replace the default rc.yaml search path
    void set_config_layers(std::vector<std::filesystem::path> layers) { config_layers_ = std::move(layers); }

    int run(const std::vector<std::string>& argv, const std::atomic<bool>* cancel = nullptr);

    const CommandRegistry& registry() const { return registry_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    CommandRegistry registry_;
    Transport* transport_override_ = nullptr;
    std::optional<std::vector<std::filesystem::path>> config_layers_;

    int usage_error(const std::string& msg);
};
