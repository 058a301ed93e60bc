#include <iostream>
#include <vector>
#include <string>
#include "cli/ktun_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage(const KtunCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    cli.print_commands();
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    ktun --version        Show version\n"
              << "    ktun --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        KtunCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "ktun"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << KTUN_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        } else if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage(cli);
            return 1;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
