// fastinstall: install package.json dependencies through a local cache of
// node_modules trees keyed by (name, version, arch, module ABI).

#include <fastinstall/config.hpp>
#include <fastinstall/installer.hpp>
#include <fastinstall/log.hpp>
#include <fastinstall/registry.hpp>
#include <fastinstall/runtime.hpp>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#ifndef FASTINSTALL_VERSION
#define FASTINSTALL_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using namespace fastinstall;

namespace {

struct CliArgs {
    std::string dir;
    std::string cache_dir;
    int max_tasks = 0;
    bool production = false;
    bool allow_shrinkwrap = false;
    std::string config_file;
    bool verbose = false;
    bool trace = false;
    bool quiet = false;
    bool no_color = false;
};

int fail(const FastInstallError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return EXIT_FAILURE;
}

// Global (or --config) layer, then the project layer. Missing files are skipped
// except an explicit --config, which must exist.
Result<Config> load_config(const CliArgs& args, const std::string& project_dir) {
    std::optional<Config> global;
    if (!args.config_file.empty()) {
        auto cfg = Config::load(expand_home(args.config_file));
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    } else {
        std::string path = global_config_path();
        std::error_code ec;
        if (!path.empty() && fs::exists(path, ec)) {
            auto cfg = Config::load(path);
            if (cfg.is_err()) return std::move(cfg).error();
            global = std::move(cfg).value();
        }
    }

    std::optional<Config> project;
    std::string path = project_config_path(project_dir);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto cfg = Config::load(path);
        if (cfg.is_err()) return std::move(cfg).error();
        project = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

void print_modules(const InstallResult& result) {
    for (const auto& [name, mod] : result.modules) {
        std::printf("%s@%s  %s  %s\n", name.c_str(), mod.version.c_str(),
                    mod.from_cache ? "cached " : "fetched", mod.path.c_str());
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"fastinstall - cached npm dependency installer"};

    CliArgs args;
    app.add_option("--dir", args.dir, "Project directory containing package.json");
    auto* cache_opt = app.add_option("--cache-dir", args.cache_dir,
                                     "Cache root (default ~/.fastinstall/cache)");
    auto* tasks_opt = app.add_option("-j,--max-tasks", args.max_tasks,
                                     "Dependencies installed concurrently")
                          ->check(CLI::PositiveNumber);
    auto* prod_opt = app.add_flag("--production", args.production,
                                  "Install only \"dependencies\"");
    auto* shrink_opt = app.add_flag("--allow-shrinkwrap", args.allow_shrinkwrap,
                                    "Let npm honor npm-shrinkwrap.json");
    app.add_option("--config", args.config_file,
                   "Config file used instead of ~/.fastinstall/config.toml");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--trace", args.trace, "Trace logging, including subprocesses");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings and errors");
    app.add_flag("--no-color", args.no_color, "Disable colored log output");
    app.set_version_flag("--version", FASTINSTALL_VERSION);

    CLI11_PARSE(app, argc, argv);

    // Checked before any config is read or subprocess spawned
    auto checked_dir = resolve_project_dir(args.dir);
    if (checked_dir.is_err()) return fail(checked_dir.error());
    std::string project_dir = std::move(checked_dir).value();

    auto loaded = load_config(args, project_dir);
    if (loaded.is_err()) return fail(loaded.error());
    Config cfg = std::move(loaded).value();

    // Command-line values are the top layer
    Config cli;
    if (*cache_opt) cli.cache_dir = args.cache_dir;
    if (*tasks_opt) cli.max_tasks = args.max_tasks;
    if (*prod_opt) cli.production = true;
    if (*shrink_opt) cli.allow_shrinkwrap = true;
    if (args.no_color) cli.color = false;
    if (args.quiet) cli.log_level = log::Warn;
    if (args.verbose) cli.log_level = log::Debug;
    if (args.trace) cli.log_level = log::Trace;
    cfg.merge(cli);

    if (cfg.log_level) log::set_level(*cfg.log_level);
    if (cfg.color) log::set_color_enabled(*cfg.color);

    RuntimeOptions rt_opts;
    if (cfg.node) rt_opts.node = *cfg.node;
    if (cfg.npm) rt_opts.npm = *cfg.npm;
    rt_opts.arch = cfg.arch;
    rt_opts.abi = cfg.abi;

    auto runtime = detect_runtime(rt_opts);
    if (runtime.is_err()) return fail(runtime.error());

    NpmOptions npm_opts;
    if (cfg.npm) npm_opts.npm = *cfg.npm;
    npm_opts.production = cfg.production.value_or(false);
    npm_opts.allow_shrinkwrap = cfg.allow_shrinkwrap.value_or(false);
    if (cfg.timeout) npm_opts.timeout_seconds = *cfg.timeout;
    npm_opts.logger = log::stderr_sink();
    NpmRegistry registry(npm_opts);

    InstallOptions opts;
    opts.dir = project_dir;
    opts.cache_dir = cfg.cache_dir.value_or("");
    opts.max_tasks = cfg.max_tasks.value_or(opts.max_tasks);
    opts.production = cfg.production.value_or(false);
    opts.logger = log::stderr_sink();

    Installer installer(registry, std::move(runtime).value());
    auto result = installer.install(opts);
    if (result.is_err()) return fail(result.error());

    print_modules(result.value());
    return EXIT_SUCCESS;
}
