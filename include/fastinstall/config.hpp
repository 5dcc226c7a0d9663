#pragma once

#include <fastinstall/log.hpp>
#include <fastinstall/result.hpp>
#include <optional>
#include <string>

namespace fastinstall {

// Layered configuration: global -> project -> command line.
// Every field is optional so a layer only overrides what it sets.
struct Config {
    // [install]
    std::optional<std::string> cache_dir;
    std::optional<int> max_tasks;
    std::optional<bool> production;
    std::optional<bool> allow_shrinkwrap;
    std::optional<int> timeout;        // seconds per npm call

    // [runtime]
    std::optional<std::string> arch;
    std::optional<int> abi;
    std::optional<std::string> node;
    std::optional<std::string> npm;

    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> color;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values win)
    void merge(const Config& other);

    // Missing layers are skipped
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

// ~/.fastinstall/config.toml, or "" when HOME is unset
std::string global_config_path();

// <dir>/.fastinstall.toml
std::string project_config_path(const std::string& dir);

// "~" and "~/x" -> $HOME, $HOME/x; anything else unchanged
std::string expand_home(const std::string& path);

} // namespace fastinstall
