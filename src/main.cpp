#include <iostream>
#include <string>
#include <vector>
#include "cli/hostlink_cli.hpp"
#include "cli/theme.hpp"

static const char* kVersion = "0.1.0";

static void print_usage(const HostlinkCLI& cli) {
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    hostlink" << theme::color::RESET
              << theme::dim("                    Interactive prompt") << "\n";
    std::cout << theme::color::TEAL << "    hostlink <command> [args]" << theme::color::RESET
              << theme::dim("   Run one command") << "\n";
    cli.print_help();
    std::cout << theme::dim("    hostlink --version           Show version\n"
                            "    hostlink --help              Show this help") << "\n\n";
}

int main(int argc, char** argv) {
    try {
        HostlinkCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::bold("hostlink") << theme::dim(std::string(" version ") + kVersion) << "\n";
            return 0;
        }
        if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.run_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(e.what());
        return 1;
    }
}
