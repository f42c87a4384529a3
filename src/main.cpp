#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include "cli/jumprun_cli.hpp"
#include "cli/theme.hpp"

// Set on SIGINT/SIGTERM; every running remote watches it
static std::atomic<bool> g_cancel{false};

static void on_signal(int) {
    g_cancel.store(true);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    // A dead tunnel peer must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        JumprunCLI cli(std::cout, std::cerr);
        return cli.run(args, &g_cancel);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string("Fatal: ") + e.what());
        return EXIT_CODE_FATAL;
    }
}
