#pragma once

#include <string>
#include <vector>
#include "base_cli.hpp"

class HostlinkCLI : public BaseCLI {
public:
    HostlinkCLI();

    // Interactive prompt until EOF, "quit" or "exit".
    void run_repl();

    // One command from argv; returns the process exit code.
    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
};
