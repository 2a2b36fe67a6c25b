#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Command registration, one function per command file
void register_exec_commands(BaseCLI& cli);
void register_sync_commands(BaseCLI& cli);
void register_logs_commands(BaseCLI& cli);
void register_tunnel_commands(BaseCLI& cli);

class BridgeCLI : public BaseCLI {
public:
    BridgeCLI();

    // argv without the program name. Global flags (--json, --help,
    // --version) may appear before the command.
    int run(const std::vector<std::string>& args);

    void print_usage() const;

private:
    void register_all_commands();
};
