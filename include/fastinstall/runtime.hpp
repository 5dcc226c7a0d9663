#pragma once

#include <fastinstall/result.hpp>
#include <optional>
#include <string>

namespace fastinstall {

// Facts about the host JavaScript runtime, read once per install run
struct HostRuntime {
    std::string node_version;  // "v12.22.1"
    std::string arch;          // "x64"
    int abi = 0;               // process.versions.modules
    std::string npm_version;
};

struct RuntimeOptions {
    std::string node = "node";
    std::string npm = "npm";
    std::optional<std::string> arch;  // overrides the detected value
    std::optional<int> abi;
    int timeout_seconds = 30;
};

// Parse "<version> <arch> [<modules>]" as printed by the node probe.
// Runtimes too old to report a module ABI get it derived from the version.
Result<HostRuntime> parse_node_report(const std::string& output);

// Module ABI for runtimes predating process.versions.modules
int legacy_abi_for(const std::string& node_version);

// Probe `node` and `npm`, then apply overrides. Fails with Runtime.
Result<HostRuntime> detect_runtime(const RuntimeOptions& options = {});

} // namespace fastinstall
