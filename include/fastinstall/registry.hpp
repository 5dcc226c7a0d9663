#pragma once

#include <fastinstall/log.hpp>
#include <fastinstall/result.hpp>
#include <string>
#include <vector>

namespace fastinstall {

// Registry metadata for one package
struct PackageInfo {
    std::string version;                // dist-tag "latest"
    std::vector<std::string> versions;  // all published versions, registry order
};

// Package Resolver/Installer collaborator. Implementations must be safe to
// call from several worker threads at once.
class PackageRegistry {
public:
    virtual ~PackageRegistry() = default;

    // Fails with Registry (or Timeout)
    virtual Result<PackageInfo> view(const std::string& name) = 0;

    // Install spec ("name@1.2.3" or a git URL) so that the package tree ends
    // up under target_dir/node_modules. Fails with Fetch (or Timeout).
    virtual Status install(const std::string& target_dir, const std::string& spec) = 0;
};

struct NpmOptions {
    std::string npm = "npm";
    bool production = false;
    bool allow_shrinkwrap = false;
    int timeout_seconds = 600;  // per npm invocation; <= 0 disables
    log::Sink logger;           // empty = silent; called from worker threads
};

// PackageRegistry backed by the npm command-line client
class NpmRegistry : public PackageRegistry {
public:
    explicit NpmRegistry(NpmOptions options = {});

    // npm view <name> version versions --json
    Result<PackageInfo> view(const std::string& name) override;

    // npm install --prefix <target_dir> ... <spec>
    Status install(const std::string& target_dir, const std::string& spec) override;

    std::vector<std::string> view_args(const std::string& name) const;
    std::vector<std::string> install_args(const std::string& target_dir,
                                          const std::string& spec) const;

    // "versions" is a string rather than an array for single-release packages
    static Result<PackageInfo> parse_view_output(const std::string& name,
                                                 const std::string& json);

    const NpmOptions& options() const { return options_; }

private:
    NpmOptions options_;
};

} // namespace fastinstall
