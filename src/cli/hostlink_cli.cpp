#include "hostlink_cli.hpp"
#include "theme.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <readline/readline.h>
#include <readline/history.h>

HostlinkCLI::HostlinkCLI() {
    register_all_commands();
}

void HostlinkCLI::register_all_commands() {
    register_connection_commands(*this);
    register_file_commands(*this);
    register_transfer_commands(*this);
    register_shell_commands(*this);
}

int HostlinkCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    return execute_command(command, args) ? 0 : 1;
}

void HostlinkCLI::run_repl() {
    std::cout << theme::section("hostlink");
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to leave.") << "\n\n";

    while (true) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }
        std::string line = raw;
        free(raw);

        auto args = split_args(line);
        if (args.empty()) continue;
        add_history(line.c_str());

        std::string command = args.front();
        args.erase(args.begin());

        if (command == "quit" || command == "exit") break;
        if (command == "help") {
            print_help();
            continue;
        }
        execute_command(command, args);
    }
}
