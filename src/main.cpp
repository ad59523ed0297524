#include <iostream>
#include <vector>
#include <string>
#include "cli/delta_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage() {
    std::cout << theme::banner(DELTA_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    delta "
              << theme::color::RESET << theme::color::BROWN << "[config]"
              << theme::color::RESET << theme::color::DIM
              << "        Load config and enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    delta init "
              << theme::color::RESET << theme::color::BROWN << "[config]"
              << theme::color::RESET << theme::color::DIM
              << "   Write a template config" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Default config: " << get_config_path().string() << "\n"
              << "    delta --version       Show version\n"
              << "    delta --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            DeltaCLI cli;
            cli.run_repl(get_config_path());
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "delta"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << DELTA_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init") {
            DeltaCLI cli;
            cli.run_init(argc >= 3 ? fs::path(argv[2]) : get_config_path());
            return 0;
        } else if (!cmd.empty() && cmd[0] == '-') {
            std::cout << theme::fail("Unknown option: " + cmd);
            print_usage();
            return 1;
        }

        DeltaCLI cli;
        cli.run_repl(fs::path(cmd));
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
