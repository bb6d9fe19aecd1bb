#include <iostream>
#include <vector>
#include <string>
#include <core/config.hpp>
#include <core/constants.hpp>
#include "cli/daemon_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner(MPCDEV_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("mpc-daemon serve", "", "Run the daemon until Ctrl-C");
    std::cout << theme::usage_row("mpc-daemon status", "", "Print the environment as JSON");
    std::cout << theme::usage_row("mpc-daemon cluster-status", "", "Probe the kind cluster");
    std::cout << theme::usage_row("mpc-daemon up", "", "Create the cluster and wait for it");
    std::cout << theme::usage_row("mpc-daemon down", "", "Destroy the cluster");
    std::cout << theme::usage_row("mpc-daemon run", "<operation>",
                                  "rebuilding, smoke_testing, deploying_mpc, ...");
    std::cout << theme::usage_row("mpc-daemon prereqs", "", "Check required tools");
    std::cout << theme::usage_row("mpc-daemon init-config", "", "Write a config template");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config PATH         Config file (default ~/.mpcdev/config.yaml)\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::filesystem::path config_path = get_config_path();
        std::vector<std::string> args;

        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a path");
                    return 1;
                }
                config_path = argv[++i];
            } else if (a.rfind("--config=", 0) == 0) {
                config_path = a.substr(9);
            } else {
                args.push_back(a);
            }
        }

        if (args.empty()) {
            print_usage();
            return 1;
        }

        std::string cmd = args[0];

        if (cmd == "--version") {
            std::cout << theme::color::BLUE << theme::color::BOLD << "mpc-daemon"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << MPCDEV_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        }

        DaemonCLI cli(config_path);

        if (cmd == "serve") {
            return cli.run_serve();
        } else if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "cluster-status") {
            return cli.run_cluster_status();
        } else if (cmd == "up") {
            return cli.run_up();
        } else if (cmd == "down") {
            return cli.run_down();
        } else if (cmd == "run") {
            if (args.size() < 2) {
                std::cout << theme::fail("Missing operation name.");
                std::cout << theme::step("Usage: mpc-daemon run <operation>");
                return 1;
            }
            return cli.run_operation(args[1]);
        } else if (cmd == "prereqs") {
            return cli.run_prereqs();
        } else if (cmd == "init-config") {
            return cli.run_init_config();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
