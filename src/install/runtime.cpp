#include <fastinstall/runtime.hpp>
#include <fastinstall/log.hpp>
#include <fastinstall/process.hpp>

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace fastinstall {

static const char* kNodeProbe =
    "[process.version, process.arch, process.versions.modules || ''].join(' ')";

int legacy_abi_for(const std::string& node_version) {
    // v0.8 -> 1, v0.10 -> 11, v0.11.0-7 -> 12, anything newer -> 13
    int major = -1, minor = -1, patch = -1;
    if (std::sscanf(node_version.c_str(), "v%d.%d.%d", &major, &minor, &patch) != 3) {
        return 1;
    }
    if (major == 0 && minor == 8) return 1;
    if (major == 0 && minor == 10) return 11;
    if (major == 0 && minor == 11 && patch < 8) return 12;
    return 13;
}

Result<HostRuntime> parse_node_report(const std::string& output) {
    std::istringstream in(output);
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) fields.push_back(field);

    if (fields.size() < 2 || fields.size() > 3) {
        return FastInstallError{FastInstallError::Runtime,
            "unexpected node runtime report: '" + output + "'"};
    }

    HostRuntime rt;
    rt.node_version = fields[0];
    rt.arch = fields[1];

    if (fields.size() == 3) {
        char* end = nullptr;
        long abi = std::strtol(fields[2].c_str(), &end, 10);
        if (end == fields[2].c_str() || *end != '\0' || abi <= 0) {
            return FastInstallError{FastInstallError::Runtime,
                "invalid module ABI version '" + fields[2] + "'"};
        }
        rt.abi = static_cast<int>(abi);
    } else {
        rt.abi = legacy_abi_for(rt.node_version);
    }

    return Result<HostRuntime>::ok(std::move(rt));
}

static Result<HostRuntime> probe_node(const RuntimeOptions& options) {
    auto run = run_command({options.node, "-p", kNodeProbe}, "", options.timeout_seconds);
    if (run.is_err()) {
        auto err = std::move(run).error();
        err.code = FastInstallError::Runtime;
        return err.wrap("cannot run " + options.node);
    }
    if (run.value().exit_code != 0) {
        return FastInstallError{FastInstallError::Runtime,
            options.node + " exited with code " + std::to_string(run.value().exit_code),
            "is node installed and on PATH?"};
    }
    return parse_node_report(run.value().stdout_str);
}

Result<HostRuntime> detect_runtime(const RuntimeOptions& options) {
    HostRuntime rt;

    auto probed = probe_node(options);
    if (probed.is_ok()) {
        rt = std::move(probed).value();
    } else if (options.arch && options.abi) {
        // Both cache-key facts are pinned, so the run can proceed without node
        log::warn("%s", probed.error().message.c_str());
        rt.node_version = "unknown";
    } else {
        return std::move(probed).error();
    }

    if (options.arch) rt.arch = *options.arch;
    if (options.abi) rt.abi = *options.abi;

    auto npm = run_command({options.npm, "--version"}, "", options.timeout_seconds);
    if (npm.is_ok() && npm.value().exit_code == 0) {
        rt.npm_version = last_line(npm.value().stdout_str);
    } else {
        rt.npm_version = "unknown";
    }

    return Result<HostRuntime>::ok(std::move(rt));
}

} // namespace fastinstall
