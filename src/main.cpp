#include <iostream>
#include <vector>
#include <string>
#include "cli/bridge_cli.hpp"
#include "cli/theme.hpp"
#include "core/errors.hpp"

int main(int argc, char** argv) {
    try {
        BridgeCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const ForgeAuthError& e) {
        std::cerr << theme::fail(std::string(e.what()));
        if (!e.hint().empty()) std::cerr << theme::step(e.hint());
        return exit_code_for(e);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return exit_code_for(e);
    }
}
