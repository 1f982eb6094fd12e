#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/connection_store.hpp>
#include <managers/engine.hpp>
#include <ssh/libssh2_transport.hpp>
#include "console_sink.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<void(BaseCLI&, const Args&)>;

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help);

    // Config, store and engine; prints the problem and returns nullptr when
    // the config cannot be loaded.
    HostlinkEngine* engine();

    bool execute_command(const std::string& command, const Args& args);
    void print_help() const;

    std::string get_prompt_string() const;

    std::optional<Config> config;
    ConsoleEventSink events;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;

    std::unique_ptr<FileConnectionStore> store_;
    Libssh2TransportFactory factory_;
    std::unique_ptr<HostlinkEngine> engine_;
};

// Split a command line on whitespace; single and double quotes group words.
std::vector<std::string> split_args(const std::string& line);

// Join args[from..] with single spaces.
std::string join_args(const std::vector<std::string>& args, size_t from);

// Parse "--name value" out of args, removing both tokens.
std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name);

// Command registration, one function per command group
void register_connection_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);
void register_transfer_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);
