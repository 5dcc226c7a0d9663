#include <fastinstall/installer.hpp>
#include <fastinstall/config.hpp>
#include <fastinstall/scratch.hpp>
#include <fastinstall/version.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace fastinstall {

const char* install_state_name(InstallState state) {
    switch (state) {
        case InstallState::Pending:      return "Pending";
        case InstallState::Classified:   return "Classified";
        case InstallState::FastCacheHit: return "FastCacheHit";
        case InstallState::Resolving:    return "Resolving";
        case InstallState::Resolved:     return "Resolved";
        case InstallState::CacheHit:     return "CacheHit";
        case InstallState::Fetching:     return "Fetching";
        case InstallState::Fetched:      return "Fetched";
        case InstallState::Committed:    return "Committed";
        case InstallState::Merged:       return "Merged";
        case InstallState::Failed:       return "Failed";
    }
    return "Unknown";
}

namespace {

// Walks one dependency through the state machine, logging each transition
class StateTrail {
public:
    StateTrail(const std::string& name, const log::Sink& logger)
        : name_(name), logger_(logger) {}

    void advance(InstallState next) {
        log::write(logger_, log::Debug, "%s: %s -> %s", name_.c_str(),
                   install_state_name(state_), install_state_name(next));
        state_ = next;
    }

    FastInstallError fail(FastInstallError err) {
        advance(InstallState::Failed);
        err.wrap(name_);
        log::write(logger_, log::Error, "%s", err.message.c_str());
        return err;
    }

private:
    const std::string& name_;
    const log::Sink& logger_;
    InstallState state_ = InstallState::Pending;
};

} // namespace

Installer::Installer(PackageRegistry& registry, HostRuntime runtime)
    : registry_(registry), runtime_(std::move(runtime)) {}

CacheKey Installer::key_for(const std::string& name, const std::string& version) const {
    return CacheKey{name, version, runtime_.arch, runtime_.abi};
}

Result<std::string> resolve_project_dir(const std::string& dir) {
    std::error_code ec;
    fs::path path = dir.empty() ? fs::current_path(ec) : fs::path(expand_home(dir));
    if (!ec) path = fs::absolute(path, ec);
    if (ec || !fs::is_directory(path, ec)) {
        return FastInstallError{FastInstallError::InvalidDirectory,
            "Invalid directory: " + (path.empty() ? dir : path.string())};
    }
    return Result<std::string>::ok(path.string());
}

// ---------------------------------------------------------------------------
// install()
// ---------------------------------------------------------------------------

Result<InstallResult> Installer::install(const InstallOptions& options) {
    auto resolved_dir = resolve_project_dir(options.dir);
    if (resolved_dir.is_err()) return std::move(resolved_dir).error();
    fs::path dir = resolved_dir.value();

    const auto& sink = options.logger;
    log::write(sink, log::Info, "Node.js version: %s", runtime_.node_version.c_str());
    log::write(sink, log::Info, "Architecture:    %s", runtime_.arch.c_str());
    log::write(sink, log::Info, "Module version:  %d", runtime_.abi);
    log::write(sink, log::Info, "npm version:     %s", runtime_.npm_version.c_str());

    std::string manifest_path = (dir / "package.json").string();
    auto manifest = PackageManifest::load(manifest_path);
    if (manifest.is_err()) return std::move(manifest).error();
    log::write(sink, log::Info, "Loading package.json: %s", manifest_path.c_str());

    return install_dependencies(manifest.value().collect(options.production),
                                dir.string(), options);
}

// ---------------------------------------------------------------------------
// install_dependencies(): bounded worker pool
// ---------------------------------------------------------------------------

Result<InstallResult> Installer::install_dependencies(const std::vector<Dependency>& deps,
                                                      const std::string& project_dir,
                                                      const InstallOptions& options) {
    InstallResult result;
    result.runtime_version = runtime_.node_version;
    result.arch = runtime_.arch;
    result.abi = runtime_.abi;

    if (deps.empty()) return Result<InstallResult>::ok(std::move(result));

    const auto& sink = options.logger;
    log::write(sink, log::Info, "Found %zu %s", deps.size(),
               deps.size() == 1 ? "dependency" : "dependencies");

    CacheStore cache(options.cache_dir.empty() ? CacheStore::default_root()
                                               : expand_home(options.cache_dir),
                     sink);
    FASTINSTALL_TRY(cache.init());

    std::string modules_dir = (fs::path(project_dir) / "node_modules").string();
    std::error_code ec;
    fs::create_directories(modules_dir, ec);
    if (ec && !fs::is_directory(modules_dir)) {
        return FastInstallError{FastInstallError::Copy,
            "cannot create " + modules_dir + ": " + ec.message()};
    }

    RunContext ctx{cache, modules_dir, sink};

    // One slot per dependency; each worker writes only the slots it claimed
    std::vector<std::optional<InstalledModule>> slots(deps.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::optional<FastInstallError> first_error;

    auto record_failure = [&](FastInstallError err) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!failed.exchange(true)) first_error = std::move(err);
    };

    auto worker = [&]() {
        while (!failed) {
            size_t i = next.fetch_add(1);
            if (i >= deps.size()) return;
            try {
                auto r = install_one(deps[i], ctx);
                if (r.is_ok()) {
                    slots[i] = std::move(r).value();
                } else {
                    record_failure(std::move(r).error());
                }
            } catch (const std::exception& e) {
                record_failure(FastInstallError{FastInstallError::IO,
                    deps[i].name + ": " + e.what()});
            }
        }
    };

    size_t pool = std::min(static_cast<size_t>(std::max(options.max_tasks, 1)),
                           deps.size());
    if (pool == 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(pool);
        for (size_t i = 0; i < pool; ++i) {
            try {
                workers.emplace_back(worker);
            } catch (const std::system_error& e) {
                record_failure(FastInstallError{FastInstallError::Runtime,
                    std::string("cannot start worker thread: ") + e.what()});
                break;
            }
        }
        for (auto& t : workers) t.join();
    }

    if (first_error) return std::move(*first_error);

    for (size_t i = 0; i < deps.size(); ++i) {
        result.modules[deps[i].name] = std::move(*slots[i]);
    }
    log::write(sink, log::Info, "Installed %zu %s", result.modules.size(),
               result.modules.size() == 1 ? "module" : "modules");
    return Result<InstallResult>::ok(std::move(result));
}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<ResolvedDependency> Installer::resolve(const Dependency& dep,
                                              const Classification& classification,
                                              const log::Sink& logger) {
    ResolvedDependency rd;
    rd.dependency = dep;
    rd.kind = classification.kind;

    if (classification.kind != SpecKind::SemverRange) {
        rd.version = classification.version;
        return Result<ResolvedDependency>::ok(std::move(rd));
    }

    auto info = registry_.view(dep.name);
    if (info.is_err()) return std::move(info).error();
    const std::string& latest = info.value().version;

    if (dep.raw_spec == "*" || dep.raw_spec == "latest") {
        rd.version = latest;
        return Result<ResolvedDependency>::ok(std::move(rd));
    }

    // Highest match that is not newer than what the registry tags as latest
    auto best = max_satisfying(info.value().versions, dep.raw_spec + " <=" + latest);
    if (best) {
        rd.version = *best;
    } else {
        log::write(logger, log::Warn,
                   "%s: no published version satisfies '%s', using it verbatim",
                   dep.name.c_str(), dep.raw_spec.c_str());
        rd.version = dep.raw_spec;
        rd.degraded = true;
    }
    return Result<ResolvedDependency>::ok(std::move(rd));
}

// ---------------------------------------------------------------------------
// install_one(): per-dependency state machine
// ---------------------------------------------------------------------------

Result<InstalledModule> Installer::merge_from_cache(const Dependency& dep,
                                                    const std::string& version,
                                                    const CacheKey& key,
                                                    bool from_cache,
                                                    const RunContext& ctx) {
    FASTINSTALL_TRY(ctx.cache.read_into(key, ctx.modules_dir));

    InstalledModule mod;
    mod.version = version;
    mod.path = (fs::path(ctx.modules_dir) / dep.name).string();
    mod.from_cache = from_cache;
    return Result<InstalledModule>::ok(std::move(mod));
}

Result<InstalledModule> Installer::install_one(const Dependency& dep,
                                               const RunContext& ctx) {
    StateTrail trail(dep.name, ctx.logger);
    const auto& sink = ctx.logger;

    auto cls = classify(dep.raw_spec);
    if (cls.is_err()) return trail.fail(std::move(cls).error());
    trail.advance(InstallState::Classified);

    // Fast path: a concrete version may already be cached, skip the registry
    if (cls.value().kind != SpecKind::SemverRange) {
        CacheKey key = key_for(dep.name, cls.value().version);
        if (ctx.cache.exists(key)) {
            trail.advance(InstallState::FastCacheHit);
            log::write(sink, log::Info, "Installing %s@%s from cache: %s",
                       dep.name.c_str(), key.version.c_str(),
                       ctx.cache.entry_path(key).c_str());
            auto mod = merge_from_cache(dep, key.version, key, true, ctx);
            if (mod.is_err()) return trail.fail(std::move(mod).error());
            trail.advance(InstallState::Merged);
            return mod;
        }
    }

    trail.advance(InstallState::Resolving);
    auto resolved = resolve(dep, cls.value(), sink);
    if (resolved.is_err()) return trail.fail(std::move(resolved).error());
    trail.advance(InstallState::Resolved);

    const std::string& version = resolved.value().version;
    CacheKey key = key_for(dep.name, version);
    std::string entry = ctx.cache.entry_path(key);

    if (ctx.cache.exists(key)) {
        trail.advance(InstallState::CacheHit);
        log::write(sink, log::Info, "Installing %s@%s from cache: %s",
                   dep.name.c_str(), version.c_str(), entry.c_str());
        auto mod = merge_from_cache(dep, version, key, true, ctx);
        if (mod.is_err()) return trail.fail(std::move(mod).error());
        trail.advance(InstallState::Merged);
        return mod;
    }

    trail.advance(InstallState::Fetching);
    log::write(sink, log::Info, "Fetching %s@%s", dep.name.c_str(), version.c_str());

    auto scratch = ScratchDir::create("fastinstall-", sink);
    if (scratch.is_err()) return trail.fail(std::move(scratch).error());

    std::string spec = resolved.value().kind == SpecKind::GitRef
        ? dep.raw_spec
        : dep.name + "@" + version;

    auto fetched = registry_.install(scratch.value().path(), spec);
    if (fetched.is_err()) return trail.fail(std::move(fetched).error());

    std::string staged = (fs::path(scratch.value().path()) / "node_modules").string();
    if (!fs::is_directory(staged)) {
        return trail.fail(FastInstallError{FastInstallError::Fetch,
            "install of " + spec + " produced no node_modules directory"});
    }
    // npm 7+ writes its hidden lockfile even with --no-package-lock. It
    // describes only this one package and must not reach the project.
    std::string hidden_lock = (fs::path(staged) / ".package-lock.json").string();
    std::error_code ec;
    fs::remove(hidden_lock, ec);
    if (ec) {
        return trail.fail(FastInstallError{FastInstallError::Fetch,
            "cannot remove " + hidden_lock + ": " + ec.message()});
    }
    trail.advance(InstallState::Fetched);

    log::write(sink, log::Info, "Caching %s@%s %s",
               dep.name.c_str(), version.c_str(), entry.c_str());
    auto committed = ctx.cache.commit(staged, key);
    scratch.value().remove();
    if (committed.is_err()) return trail.fail(std::move(committed).error());
    trail.advance(InstallState::Committed);

    log::write(sink, log::Info, "Installing %s@%s", dep.name.c_str(), version.c_str());
    auto mod = merge_from_cache(dep, version, key, false, ctx);
    if (mod.is_err()) return trail.fail(std::move(mod).error());
    trail.advance(InstallState::Merged);
    return mod;
}

} // namespace fastinstall
