#include <iostream>
#include <vector>
#include <string>
#include "cli/rzterm_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("connect", "<host>", "Interactive shell with rz/sz");
    std::cout << theme::usage_row("exec", "<host> <cmd>", "Run one command");
    std::cout << theme::usage_row("hosts", "", "List configured hosts");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    <host> is an alias from ~/.rzterm/config.yaml or user@host[:port]\n"
              << "    --backend library|async|exec|debug   Transport backend\n"
              << "    -i <key>                             Private key file\n"
              << "    --trace                              Start with byte tracing on (Alt+D toggles)\n"
              << "\n"
              << "    rzterm --version        Show version\n"
              << "    rzterm --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return EXIT_CONFIG_ERROR;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "rzterm"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        auto config = Config::load_default();
        if (config.is_err()) {
            std::cout << theme::fail(describe(config.error));
            return EXIT_CONFIG_ERROR;
        }
        set_rzterm_log_path(config.value.settings().debug_log);

        RztermCLI cli(config.value);
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "connect") {
            return cli.run_connect(args);
        } else if (cmd == "exec") {
            return cli.run_exec(args);
        } else if (cmd == "hosts") {
            return cli.run_hosts();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_TRANSPORT_FAILURE;
    }
}
