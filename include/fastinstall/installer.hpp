#pragma once

#include <fastinstall/cache.hpp>
#include <fastinstall/classify.hpp>
#include <fastinstall/log.hpp>
#include <fastinstall/manifest.hpp>
#include <fastinstall/registry.hpp>
#include <fastinstall/result.hpp>
#include <fastinstall/runtime.hpp>

#include <map>
#include <string>
#include <vector>

namespace fastinstall {

struct InstallOptions {
    std::string dir;          // project directory; empty = current directory
    std::string cache_dir;    // empty = CacheStore::default_root(); "~" expanded
    int max_tasks = 5;        // concurrent dependencies; 1 = sequential
    bool production = false;  // only "dependencies" from package.json
    log::Sink logger;         // empty = silent; called from worker threads
};

struct InstalledModule {
    std::string version;      // resolved version used for the cache key
    std::string path;         // <project>/node_modules/<name>
    bool from_cache = false;  // true when no fetch was needed
};

struct InstallResult {
    std::string runtime_version;
    std::string arch;
    int abi = 0;
    std::map<std::string, InstalledModule> modules;
};

// Per-dependency progress. Failed is reachable from every state.
enum class InstallState {
    Pending,
    Classified,
    FastCacheHit,  // exact or git spec already cached, no registry call
    Resolving,
    Resolved,
    CacheHit,
    Fetching,
    Fetched,
    Committed,
    Merged,
    Failed,
};

const char* install_state_name(InstallState state);

struct ResolvedDependency {
    Dependency dependency;
    SpecKind kind = SpecKind::SemverRange;
    std::string version;    // concrete, or the raw spec when nothing matched
    bool degraded = false;  // range matched no published version
};

// Absolute form of a project directory ("" = current directory, "~" expanded).
// Fails with InvalidDirectory when it is not an existing directory.
Result<std::string> resolve_project_dir(const std::string& dir);

// Cache-aware install orchestrator.
//
// Each dependency is classified, resolved to a concrete version, looked up
// in the cache by (name, version, arch, abi), fetched through the registry
// on a miss, committed to the cache, and finally merged from the cache into
// <project>/node_modules. Dependencies run on a pool of max_tasks workers.
//
// The run succeeds only if every dependency is merged. The first failure is
// returned; dependencies already in flight are allowed to finish (no
// cancellation) and nothing already merged is rolled back. No new dependency
// is started after a failure. No partial result is returned.
class Installer {
public:
    Installer(PackageRegistry& registry, HostRuntime runtime);

    // Validate options.dir, load its package.json and install what it declares.
    // Fails with InvalidDirectory or ManifestMissing before any work starts.
    Result<InstallResult> install(const InstallOptions& options);

    // Install an explicit dependency list into <project_dir>/node_modules
    Result<InstallResult> install_dependencies(const std::vector<Dependency>& deps,
                                               const std::string& project_dir,
                                               const InstallOptions& options);

    // Resolution step: registry lookup for ranges, passthrough otherwise
    Result<ResolvedDependency> resolve(const Dependency& dep,
                                       const Classification& classification,
                                       const log::Sink& logger);

    CacheKey key_for(const std::string& name, const std::string& version) const;

    const HostRuntime& runtime() const { return runtime_; }

private:
    struct RunContext {
        const CacheStore& cache;
        std::string modules_dir;
        const log::Sink& logger;
    };

    Result<InstalledModule> install_one(const Dependency& dep, const RunContext& ctx);

    Result<InstalledModule> merge_from_cache(const Dependency& dep,
                                             const std::string& version,
                                             const CacheKey& key,
                                             bool from_cache,
                                             const RunContext& ctx);

    PackageRegistry& registry_;
    HostRuntime runtime_;
};

} // namespace fastinstall
