#include <fastinstall/registry.hpp>
#include <fastinstall/log.hpp>
#include <fastinstall/process.hpp>

#include <nlohmann/json.hpp>

namespace fastinstall {

using json = nlohmann::json;

NpmRegistry::NpmRegistry(NpmOptions options)
    : options_(std::move(options)) {}

std::vector<std::string> NpmRegistry::view_args(const std::string& name) const {
    return {options_.npm, "view", name, "version", "versions", "--json"};
}

std::vector<std::string> NpmRegistry::install_args(const std::string& target_dir,
                                                   const std::string& spec) const {
    std::vector<std::string> args = {
        options_.npm, "install",
        "--prefix", target_dir,
        "--no-save",
        "--no-package-lock",
        "--no-audit",
        "--no-fund",
        "--no-progress",
        "--color=false",
        "--loglevel=silent",
    };
    if (options_.production) args.push_back("--production");
    if (!options_.allow_shrinkwrap) args.push_back("--shrinkwrap=false");
    args.push_back(spec);
    return args;
}

Result<PackageInfo> NpmRegistry::parse_view_output(const std::string& name,
                                                   const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return FastInstallError{FastInstallError::Registry,
            "unexpected `npm view` output for '" + name + "'"};
    }

    if (doc.contains("error")) {
        std::string summary = "unknown registry error";
        const auto& e = doc["error"];
        if (e.is_object() && e.contains("summary") && e["summary"].is_string()) {
            summary = e["summary"].get<std::string>();
        }
        return FastInstallError{FastInstallError::Registry,
            "registry lookup for '" + name + "' failed: " + summary};
    }

    PackageInfo info;
    auto v = doc.find("version");
    if (v == doc.end() || !v->is_string()) {
        return FastInstallError{FastInstallError::Registry,
            "registry returned no latest version for '" + name + "'"};
    }
    info.version = v->get<std::string>();

    auto vs = doc.find("versions");
    if (vs != doc.end() && vs->is_array()) {
        for (const auto& item : *vs) {
            if (item.is_string()) info.versions.push_back(item.get<std::string>());
        }
    } else if (vs != doc.end() && vs->is_string()) {
        info.versions.push_back(vs->get<std::string>());
    } else {
        info.versions.push_back(info.version);
    }

    return Result<PackageInfo>::ok(std::move(info));
}

Result<PackageInfo> NpmRegistry::view(const std::string& name) {
    auto run = run_command(view_args(name), "", options_.timeout_seconds);
    if (run.is_err()) {
        auto err = std::move(run).error();
        if (err.code != FastInstallError::Timeout) err.code = FastInstallError::Registry;
        return err.wrap("npm view " + name);
    }

    const auto& out = run.value();
    if (out.exit_code != 0) {
        // npm --json reports failures as a JSON document on stdout
        if (!out.stdout_str.empty()) {
            auto parsed = parse_view_output(name, out.stdout_str);
            if (parsed.is_err()) return parsed;
        }
        std::string detail = last_line(out.stderr_str);
        return FastInstallError{FastInstallError::Registry,
            "npm view " + name + " exited with code " + std::to_string(out.exit_code) +
            (detail.empty() ? "" : ": " + detail)};
    }

    return parse_view_output(name, out.stdout_str);
}

Status NpmRegistry::install(const std::string& target_dir, const std::string& spec) {
    log::write(options_.logger, log::Debug, "npm install %s into %s",
               spec.c_str(), target_dir.c_str());

    auto run = run_command(install_args(target_dir, spec), target_dir,
                           options_.timeout_seconds);
    if (run.is_err()) {
        auto err = std::move(run).error();
        if (err.code != FastInstallError::Timeout) err.code = FastInstallError::Fetch;
        return err.wrap("npm install " + spec);
    }

    const auto& out = run.value();
    if (out.exit_code != 0) {
        std::string detail = last_line(out.stderr_str);
        return FastInstallError{FastInstallError::Fetch,
            "npm install " + spec + " exited with code " + std::to_string(out.exit_code) +
            (detail.empty() ? "" : ": " + detail),
            "re-run with --verbose, or run the npm command by hand to see its output"};
    }
    return ok_status();
}

} // namespace fastinstall
