#include <iostream>
#include <vector>
#include <string>
#include "cli/fleet_cli.hpp"
#include "cli/theme.hpp"

static void print_usage(const FleetCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    fleetwatch "
              << theme::color::RESET << theme::color::BROWN << "[--config PATH] <command> [hosts...]"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    fleetwatch --version        Show version\n"
              << "    fleetwatch --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::filesystem::path config_path = Config::get_config_path();
        std::string cmd;
        std::vector<std::string> hosts;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (cmd.empty() && arg == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a path.");
                    return 1;
                }
                config_path = argv[++i];
            } else if (cmd.empty()) {
                cmd = arg;
            } else {
                hosts.push_back(arg);
            }
        }

        FleetCLI cli(config_path);

        if (cmd.empty() || cmd == "--help") {
            print_usage(cli);
            return cmd.empty() ? 1 : 0;
        }
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "fleetwatch"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        }

        return cli.run_command(cmd, hosts);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
