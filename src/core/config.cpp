#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".hostlink";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path expand_local_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

Config::Config()
    : connections_file_(get_global_config_dir() / "connections.json"),
      terminal_{DEFAULT_TERM_TYPE, DEFAULT_TERM_COLS, DEFAULT_TERM_ROWS},
      remote_tmp_dir_(DEFAULT_REMOTE_TMP_DIR) {}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    Config config;
    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        if (root["connections_file"] && root["connections_file"].IsScalar()) {
            config.connections_file_ = expand_local_home(root["connections_file"].as<std::string>());
        }
        if (root["log_file"] && root["log_file"].IsScalar()) {
            config.log_file_ = expand_local_home(root["log_file"].as<std::string>()).string();
        }

        auto term = root["terminal"];
        if (term && term.IsMap()) {
            config.terminal_.term = term["term"].as<std::string>(config.terminal_.term);
            config.terminal_.cols = term["cols"].as<int>(config.terminal_.cols);
            config.terminal_.rows = term["rows"].as<int>(config.terminal_.rows);
        }
        if (config.terminal_.cols <= 0) config.terminal_.cols = DEFAULT_TERM_COLS;
        if (config.terminal_.rows <= 0) config.terminal_.rows = DEFAULT_TERM_ROWS;

        auto upload = root["upload"];
        if (upload && upload.IsMap()) {
            config.remote_tmp_dir_ = upload["remote_tmp_dir"].as<std::string>(config.remote_tmp_dir_);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    return Result<Config>::Ok(config);
}
