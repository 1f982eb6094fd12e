#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config = config_result.value;
        if (!config->log_file().empty()) set_hostlink_log_path(config->log_file());
    } else {
        std::cout << theme::fail(config_result.error);
    }
}

BaseCLI::~BaseCLI() {
    if (engine_) engine_->shutdown();
}

void BaseCLI::add_command(const std::string& name, CommandHandler handler,
                          const std::string& usage, const std::string& help) {
    commands_[name] = Command{std::move(handler), usage, help};
}

HostlinkEngine* BaseCLI::engine() {
    if (engine_) return engine_.get();
    if (!config) {
        std::cout << theme::fail("No usable config; fix " + get_global_config_path().string());
        return nullptr;
    }
    store_ = std::make_unique<FileConnectionStore>(config->connections_file());
    engine_ = std::make_unique<HostlinkEngine>(*config, *store_, factory_, events);
    return engine_.get();
}

bool BaseCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return false;
    }

    try {
        it->second.handler(*this, args);
        return true;
    } catch (const std::exception& e) {
        std::cout << theme::fail(e.what());
        return false;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connections", {"connections", "test"}},
        {"Files",       {"ls", "home", "cat", "mkdir", "rm", "mv", "glob", "grep", "zip"}},
        {"Transfers",   {"upload", "download"}},
        {"Remote",      {"exec", "shell"}},
    };

    for (const auto& [category, names] : categories) {
        std::cout << theme::section(category);
        for (const auto& name : names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::TEAL << fmt::format("    {:<40}", it->second.usage)
                      << theme::color::RESET << theme::dim(it->second.help) << "\n";
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // \001 and \002 wrap non-printing sequences so readline measures the
    // visible prompt width correctly.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };
    return rl_esc(theme::color::SAND) + "hostlink" + rl_esc(theme::color::RESET) + "> ";
}

// ── Argument helpers ──────────────────────────────────────────

std::vector<std::string> split_args(const std::string& line) {
    std::vector<std::string> out;
    std::string current;
    bool in_word = false;
    char quote = 0;
    for (char c : line) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                current += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                out.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }
    if (in_word) out.push_back(current);
    return out;
}

std::string join_args(const std::vector<std::string>& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                       args.begin() + static_cast<std::ptrdiff_t>(i + 2));
            return value;
        }
    }
    return std::nullopt;
}
