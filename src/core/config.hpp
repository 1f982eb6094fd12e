#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct TerminalConfig {
    std::string term;
    int cols;
    int rows;
};

class Config {
public:
    // Load engine config from ~/.hostlink/config.yaml (defaults when absent)
    static Result<Config> load_global();

    // Load from an explicit file (defaults when absent)
    static Result<Config> load_file(const fs::path& path);

    // Accessors
    const fs::path& connections_file() const { return connections_file_; }
    const std::string& log_file() const { return log_file_; }
    const TerminalConfig& terminal() const { return terminal_; }
    const std::string& remote_tmp_dir() const { return remote_tmp_dir_; }

public:
    Config();

private:
    fs::path connections_file_;
    std::string log_file_;
    TerminalConfig terminal_;
    std::string remote_tmp_dir_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Expand a leading "~/" against the local home directory.
fs::path expand_local_home(const std::string& path);
