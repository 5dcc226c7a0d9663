#include <fastinstall/config.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fastinstall {

// ---------------------------------------------------------------------------
// Typed readers: absent keys are fine, wrong types are Config errors
// ---------------------------------------------------------------------------

static FastInstallError type_error(const char* section, const char* key,
                                   const char* expected) {
    return FastInstallError{FastInstallError::Config,
        std::string("[") + section + "] " + key + " must be " + expected};
}

static Status read_string(const toml::table& tbl, const char* section,
                          const char* key, std::optional<std::string>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<std::string>();
    if (!v) return type_error(section, key, "a string");
    out = *v;
    return ok_status();
}

static Status read_bool(const toml::table& tbl, const char* section,
                        const char* key, std::optional<bool>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<bool>();
    if (!v) return type_error(section, key, "a boolean");
    out = *v;
    return ok_status();
}

static Status read_int(const toml::table& tbl, const char* section,
                       const char* key, int64_t min, std::optional<int>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<int64_t>();
    if (!v || *v < min || *v > 1000000) {
        std::string expected = "an integer >= " + std::to_string(min);
        return type_error(section, key, expected.c_str());
    }
    out = static_cast<int>(*v);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FastInstallError{FastInstallError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [install] section
    if (auto install = doc["install"].as_table()) {
        FASTINSTALL_TRY(read_string(*install, "install", "cache-dir", cfg.cache_dir));
        FASTINSTALL_TRY(read_int(*install, "install", "max-tasks", 1, cfg.max_tasks));
        FASTINSTALL_TRY(read_bool(*install, "install", "production", cfg.production));
        FASTINSTALL_TRY(read_bool(*install, "install", "allow-shrinkwrap",
                                  cfg.allow_shrinkwrap));
        FASTINSTALL_TRY(read_int(*install, "install", "timeout", 0, cfg.timeout));
    }

    // [runtime] section
    if (auto runtime = doc["runtime"].as_table()) {
        FASTINSTALL_TRY(read_string(*runtime, "runtime", "arch", cfg.arch));
        FASTINSTALL_TRY(read_int(*runtime, "runtime", "abi", 1, cfg.abi));
        FASTINSTALL_TRY(read_string(*runtime, "runtime", "node", cfg.node));
        FASTINSTALL_TRY(read_string(*runtime, "runtime", "npm", cfg.npm));
    }

    // [log] section
    if (auto logtbl = doc["log"].as_table()) {
        std::optional<std::string> level;
        FASTINSTALL_TRY(read_string(*logtbl, "log", "level", level));
        if (level) {
            log::Level lvl;
            if (!log::parse_level(*level, lvl)) {
                return FastInstallError{FastInstallError::Config,
                    "[log] unknown level '" + *level + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = lvl;
        }
        FASTINSTALL_TRY(read_bool(*logtbl, "log", "color", cfg.color));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FastInstallError{FastInstallError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) return std::move(cfg).error().wrap(path);
    return cfg;
}

template<typename T>
static void override_with(std::optional<T>& base, const std::optional<T>& top) {
    if (top.has_value()) base = top;
}

void Config::merge(const Config& other) {
    override_with(cache_dir, other.cache_dir);
    override_with(max_tasks, other.max_tasks);
    override_with(production, other.production);
    override_with(allow_shrinkwrap, other.allow_shrinkwrap);
    override_with(timeout, other.timeout);
    override_with(arch, other.arch);
    override_with(abi, other.abi);
    override_with(node, other.node);
    override_with(npm, other.npm);
    override_with(log_level, other.log_level);
    override_with(color, other.color);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.fastinstall/config.toml";
}

std::string project_config_path(const std::string& dir) {
    return (std::filesystem::path(dir) / ".fastinstall.toml").string();
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user is not supported

    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

} // namespace fastinstall
