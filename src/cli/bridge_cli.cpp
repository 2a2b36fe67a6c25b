#include "bridge_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <iostream>
#include <fmt/format.h>

BridgeCLI::BridgeCLI() {
    register_all_commands();
}

void BridgeCLI::register_all_commands() {
    register_exec_commands(*this);
    register_sync_commands(*this);
    register_logs_commands(*this);
    register_tunnel_commands(*this);
}

void BridgeCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    bridgectl " << theme::color::RESET
              << theme::color::BROWN << "[--json] <command> [options]"
              << theme::color::RESET << "\n";
    print_help();
    std::cout << theme::color::DIM
              << "    bridgectl --json ...       Machine-readable output\n"
              << "    bridgectl --version        Show version\n"
              << "    bridgectl --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int BridgeCLI::run(const std::vector<std::string>& args) {
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--json") {
            json_output = true;
        } else if (a == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "bridgectl"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << BRIDGECTL_VERSION << theme::color::RESET << "\n";
            return EXIT_OK;
        } else if (a == "--help" || a == "-h") {
            print_usage();
            return EXIT_OK;
        } else {
            break;
        }
    }

    if (i == args.size()) {
        print_usage();
        return EXIT_OK;
    }

    std::string command = args[i];
    std::vector<std::string> rest;
    for (size_t j = i + 1; j < args.size(); ++j) {
        // --json is accepted after the command as well
        if (args[j] == "--json") {
            json_output = true;
            continue;
        }
        rest.push_back(args[j]);
    }
    return execute_command(command, rest);
}
