#include <catch2/catch.hpp>
#include <fastinstall/installer.hpp>
#include "temp_dir.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace fastinstall;

// In-process PackageRegistry: serves canned metadata and "installs" by
// writing node_modules/<name>/package.json plus a .bin entry.
class FakeRegistry : public PackageRegistry {
public:
    std::map<std::string, PackageInfo> packages;
    std::map<std::string, std::string> git_names;  // git url -> package name
    std::set<std::string> failing;                 // install() fails for these
    std::set<std::string> empty_installs;          // install() writes nothing
    int install_delay_ms = 0;
    int fail_delay_ms = 0;
    bool write_hidden_lockfile = false;  // as npm 7+ does

    Result<PackageInfo> view(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mu_);
        ++view_calls_;
        auto it = packages.find(name);
        if (it == packages.end()) {
            return FastInstallError{FastInstallError::Registry,
                "registry lookup for '" + name + "' failed: Not Found"};
        }
        return Result<PackageInfo>::ok(it->second);
    }

    Status install(const std::string& target_dir, const std::string& spec) override {
        std::string name;
        std::string version;
        auto git = git_names.find(spec);
        if (git != git_names.end()) {
            name = git->second;
            version = spec.substr(spec.find('#') + 1);
        } else {
            size_t at = spec.rfind('@');
            name = spec.substr(0, at);
            version = spec.substr(at + 1);
        }

        {
            std::lock_guard<std::mutex> lock(mu_);
            ++install_calls_;
            installed_specs_.push_back(spec);
            ++active_;
            max_active_ = std::max(max_active_, active_);
        }

        bool fail = failing.count(name) > 0;
        int delay = fail ? fail_delay_ms : install_delay_ms;
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));

        {
            std::lock_guard<std::mutex> lock(mu_);
            --active_;
        }

        if (fail) {
            return FastInstallError{FastInstallError::Fetch,
                "npm install " + spec + " exited with code 1"};
        }
        if (empty_installs.count(name)) return ok_status();

        fs::path nm = fs::path(target_dir) / "node_modules";
        fs::create_directories(nm / name);
        std::ofstream(nm / name / "package.json")
            << "{\"name\":\"" << name << "\",\"version\":\"" << version << "\"}";
        fs::create_directories(nm / ".bin");
        std::ofstream(nm / ".bin" / name) << "#!/bin/sh\n";
        if (write_hidden_lockfile) {
            std::ofstream(nm / ".package-lock.json")
                << "{\"name\":\"scratch\",\"packages\":{\"node_modules/" << name << "\":{}}}";
        }
        return ok_status();
    }

    int view_calls() { std::lock_guard<std::mutex> l(mu_); return view_calls_; }
    int install_calls() { std::lock_guard<std::mutex> l(mu_); return install_calls_; }
    int max_active() { std::lock_guard<std::mutex> l(mu_); return max_active_; }
    std::vector<std::string> installed_specs() {
        std::lock_guard<std::mutex> l(mu_);
        return installed_specs_;
    }

private:
    std::mutex mu_;
    int view_calls_ = 0;
    int install_calls_ = 0;
    int active_ = 0;
    int max_active_ = 0;
    std::vector<std::string> installed_specs_;
};

static HostRuntime test_runtime() {
    HostRuntime rt;
    rt.node_version = "v12.22.1";
    rt.arch = "x64";
    rt.abi = 72;
    rt.npm_version = "6.14.12";
    return rt;
}

static std::vector<Dependency> deps_of(
        std::initializer_list<std::pair<const char*, const char*>> list) {
    std::vector<Dependency> out;
    for (const auto& p : list) out.push_back(Dependency{p.first, p.second});
    return out;
}

struct CapturedLog {
    std::mutex mu;
    std::vector<std::pair<log::Level, std::string>> lines;

    log::Sink sink() {
        return [this](log::Level lvl, const std::string& msg) {
            std::lock_guard<std::mutex> lock(mu);
            lines.emplace_back(lvl, msg);
        };
    }

    bool contains(log::Level lvl, const std::string& needle) {
        std::lock_guard<std::mutex> lock(mu);
        for (const auto& l : lines) {
            if (l.first == lvl && l.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

// Cache + project directories for one scenario
struct Workspace {
    TempDir cache{"inst_cache"};
    TempDir project{"inst_project"};

    InstallOptions options(int max_tasks = 5) const {
        InstallOptions o;
        o.dir = project.str();
        o.cache_dir = cache.str();
        o.max_tasks = max_tasks;
        return o;
    }
};

static void add_lodash(FakeRegistry& reg) {
    reg.packages["lodash"] = PackageInfo{"4.17.21",
        {"2.4.2", "3.0.0", "3.9.3", "3.10.0", "3.10.1", "4.0.0", "4.17.21"}};
}

// ===== Range resolution =====

TEST_CASE("cold cache fetches the highest matching version", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    add_lodash(reg);
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(deps_of({{"lodash", "^3.0.0"}}),
                                            ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(reg.view_calls() == 1);
    REQUIRE(reg.install_calls() == 1);
    REQUIRE(reg.installed_specs()[0] == "lodash@3.10.1");

    const auto& mod = r.value().modules.at("lodash");
    REQUIRE(mod.version == "3.10.1");
    REQUIRE_FALSE(mod.from_cache);
    REQUIRE(mod.path == (ws.project.path / "node_modules" / "lodash").string());
    REQUIRE(fs::exists(ws.project.path / "node_modules" / "lodash" / "package.json"));
    REQUIRE(fs::is_directory(ws.cache.path / "lodash" / "3.10.1" / "x64" / "72" / "lodash"));

    REQUIRE(r.value().runtime_version == "v12.22.1");
    REQUIRE(r.value().arch == "x64");
    REQUIRE(r.value().abi == 72);
}

TEST_CASE("warm cache skips the install", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    add_lodash(reg);
    Installer installer(reg, test_runtime());
    auto deps = deps_of({{"lodash", "^3.0.0"}});

    REQUIRE(installer.install_dependencies(deps, ws.project.str(), ws.options()).is_ok());

    TempDir second("inst_project2");
    auto r = installer.install_dependencies(deps, second.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(reg.view_calls() == 2);
    REQUIRE(reg.install_calls() == 1);
    REQUIRE(r.value().modules.at("lodash").from_cache);
    REQUIRE(fs::exists(second.path / "node_modules" / "lodash" / "package.json"));
}

TEST_CASE("star and latest resolve to the latest tag", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.packages["foo"] = PackageInfo{"2.0.0", {"1.0.0", "2.0.0", "3.0.0-beta.1"}};
    reg.packages["bar"] = PackageInfo{"1.5.0", {"1.0.0", "1.5.0", "1.6.0"}};
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(deps_of({{"foo", "*"}, {"bar", "latest"}}),
                                            ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.at("foo").version == "2.0.0");
    REQUIRE(r.value().modules.at("bar").version == "1.5.0");
}

TEST_CASE("range results are capped at the latest tag", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.packages["pkg"] = PackageInfo{"1.2.0", {"1.0.0", "1.2.0", "1.3.0"}};
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(deps_of({{"pkg", "^1.0.0"}}),
                                            ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.at("pkg").version == "1.2.0");
}

TEST_CASE("unmatched range degrades to the raw spec", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.packages["old"] = PackageInfo{"2.0.0", {"1.0.0", "2.0.0"}};
    Installer installer(reg, test_runtime());
    CapturedLog captured;
    auto opts = ws.options();
    opts.logger = captured.sink();

    auto r = installer.install_dependencies(deps_of({{"old", "^9.0.0"}}),
                                            ws.project.str(), opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.at("old").version == "^9.0.0");
    REQUIRE(reg.installed_specs()[0] == "old@^9.0.0");
    REQUIRE(captured.contains(log::Warn, "old"));
}

TEST_CASE("resolve passes exact and git versions through", "[installer]") {
    FakeRegistry reg;
    Installer installer(reg, test_runtime());

    Dependency exact{"pinned", "1.2.3"};
    auto c = classify(exact.raw_spec);
    REQUIRE(c.is_ok());
    auto r = installer.resolve(exact, c.value(), log::Sink{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version == "1.2.3");
    REQUIRE(r.value().kind == SpecKind::ExactVersion);
    REQUIRE_FALSE(r.value().degraded);
    REQUIRE(reg.view_calls() == 0);
}

TEST_CASE("registry lookup failure fails the run", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(deps_of({{"ghost", "^1.0.0"}}),
                                            ws.project.str(), ws.options());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FastInstallError::Registry);
    REQUIRE(r.error().message.rfind("ghost: ", 0) == 0);
}

// ===== Exact and git specs =====

TEST_CASE("exact versions install without a registry lookup", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(deps_of({{"pinned", "1.2.3"}}),
                                            ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(reg.view_calls() == 0);
    REQUIRE(reg.install_calls() == 1);
    REQUIRE(reg.installed_specs()[0] == "pinned@1.2.3");
}

TEST_CASE("warm exact run makes no registry calls and yields the same tree", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    Installer installer(reg, test_runtime());
    auto deps = deps_of({{"a", "1.0.0"}, {"b", "2.0.0"}});

    REQUIRE(installer.install_dependencies(deps, ws.project.str(), ws.options()).is_ok());
    int views = reg.view_calls();
    int installs = reg.install_calls();
    std::string a_before = ws.project.read_file("node_modules/a/package.json");

    auto r = installer.install_dependencies(deps, ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(reg.view_calls() == views);
    REQUIRE(reg.install_calls() == installs);
    REQUIRE(r.value().modules.at("a").from_cache);
    REQUIRE(r.value().modules.at("b").from_cache);
    REQUIRE(ws.project.read_file("node_modules/a/package.json") == a_before);
    REQUIRE(fs::exists(ws.project.path / "node_modules" / ".bin" / "a"));
    REQUIRE(fs::exists(ws.project.path / "node_modules" / ".bin" / "b"));
}

TEST_CASE("git spec installs by url and caches under the fragment", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    const std::string url = "git+ssh://git@example.com/ORG/thing.git#1.4.0";
    reg.git_names[url] = "thing";
    Installer installer(reg, test_runtime());
    auto deps = deps_of({{"thing", url.c_str()}});

    auto r = installer.install_dependencies(deps, ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(reg.installed_specs()[0] == url);
    REQUIRE(r.value().modules.at("thing").version == "1.4.0");
    REQUIRE(fs::is_directory(ws.cache.path / "thing" / "1.4.0" / "x64" / "72"));

    auto again = installer.install_dependencies(deps, ws.project.str(), ws.options());
    REQUIRE(again.is_ok());
    REQUIRE(reg.install_calls() == 1);
    REQUIRE(reg.view_calls() == 0);
}

TEST_CASE("git spec without a version fragment fails", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(
        deps_of({{"thing", "git+ssh://git@example.com/ORG/thing.git"}}),
        ws.project.str(), ws.options());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FastInstallError::MalformedGitSpec);
    REQUIRE(r.error().message.find("thing") != std::string::npos);
    REQUIRE(reg.install_calls() == 0);
}

TEST_CASE("cache entries are isolated per runtime", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    auto deps = deps_of({{"native", "1.0.0"}});

    Installer x64(reg, test_runtime());
    REQUIRE(x64.install_dependencies(deps, ws.project.str(), ws.options()).is_ok());

    HostRuntime other = test_runtime();
    other.abi = 83;
    Installer newer(reg, other);
    auto r = newer.install_dependencies(deps, ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(reg.install_calls() == 2);
    REQUIRE_FALSE(r.value().modules.at("native").from_cache);
    REQUIRE(newer.key_for("native", "1.0.0").abi == 83);
}

// ===== Failure handling =====

TEST_CASE("fetch failure fails the run but in-flight siblings finish", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.failing.insert("broken");
    reg.install_delay_ms = 100;
    reg.fail_delay_ms = 20;
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(
        deps_of({{"ok1", "1.0.0"}, {"broken", "1.0.0"}, {"ok2", "1.0.0"}}),
        ws.project.str(), ws.options(3));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FastInstallError::Fetch);
    REQUIRE(r.error().message.rfind("broken: ", 0) == 0);

    REQUIRE(fs::exists(ws.project.path / "node_modules" / "ok1" / "package.json"));
    REQUIRE(fs::exists(ws.project.path / "node_modules" / "ok2" / "package.json"));
    REQUIRE_FALSE(fs::exists(ws.project.path / "node_modules" / "broken"));
    REQUIRE_FALSE(fs::exists(ws.cache.path / "broken"));
}

TEST_CASE("no new dependency starts after a failure", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.failing.insert("first");
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(
        deps_of({{"first", "1.0.0"}, {"second", "1.0.0"}, {"third", "1.0.0"}}),
        ws.project.str(), ws.options(1));
    REQUIRE(r.is_err());
    REQUIRE(reg.install_calls() == 1);
}

TEST_CASE("install that yields no node_modules is a fetch error", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.empty_installs.insert("hollow");
    Installer installer(reg, test_runtime());
    CapturedLog captured;
    auto opts = ws.options();
    opts.logger = captured.sink();

    auto r = installer.install_dependencies(deps_of({{"hollow", "1.0.0"}}),
                                            ws.project.str(), opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FastInstallError::Fetch);
    REQUIRE_FALSE(fs::exists(ws.cache.path / "hollow"));
    REQUIRE(captured.contains(log::Error, "hollow"));
}

// ===== Concurrency =====

TEST_CASE("npm's hidden lockfile stays out of the cache and the project", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.write_hidden_lockfile = true;
    reg.packages["left-pad"] = PackageInfo{"1.3.0", {"1.3.0"}};
    add_lodash(reg);
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(
        deps_of({{"lodash", "^3.0.0"}, {"left-pad", "1.3.0"}}),
        ws.project.str(), ws.options());
    REQUIRE(r.is_ok());

    fs::path lodash_entry = ws.cache.path / "lodash" / "3.10.1" / "x64" / "72";
    fs::path pad_entry = ws.cache.path / "left-pad" / "1.3.0" / "x64" / "72";
    REQUIRE(fs::is_directory(lodash_entry / "lodash"));
    REQUIRE(fs::is_directory(pad_entry / "left-pad"));
    REQUIRE_FALSE(fs::exists(lodash_entry / ".package-lock.json"));
    REQUIRE_FALSE(fs::exists(pad_entry / ".package-lock.json"));

    fs::path nm = ws.project.path / "node_modules";
    REQUIRE(fs::exists(nm / "lodash" / "package.json"));
    REQUIRE(fs::exists(nm / "left-pad" / "package.json"));
    REQUIRE_FALSE(fs::exists(nm / ".package-lock.json"));
}

TEST_CASE("concurrency never exceeds max_tasks", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.install_delay_ms = 30;
    Installer installer(reg, test_runtime());

    std::vector<Dependency> deps;
    for (int i = 0; i < 10; ++i) {
        deps.push_back(Dependency{"pkg" + std::to_string(i), "1.0.0"});
    }

    auto r = installer.install_dependencies(deps, ws.project.str(), ws.options(3));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.size() == 10);
    REQUIRE(reg.max_active() <= 3);
    REQUIRE(reg.max_active() >= 2);
    for (int i = 0; i < 10; ++i) {
        std::string name = "pkg" + std::to_string(i);
        REQUIRE(fs::exists(ws.project.path / "node_modules" / name / "package.json"));
        REQUIRE(fs::exists(ws.project.path / "node_modules" / ".bin" / name));
    }
}

TEST_CASE("max_tasks of one runs sequentially", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    reg.install_delay_ms = 5;
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies(
        deps_of({{"a", "1.0.0"}, {"b", "1.0.0"}, {"c", "1.0.0"}}),
        ws.project.str(), ws.options(1));
    REQUIRE(r.is_ok());
    REQUIRE(reg.max_active() == 1);
    REQUIRE(reg.installed_specs() == std::vector<std::string>{"a@1.0.0", "b@1.0.0", "c@1.0.0"});
}

TEST_CASE("empty dependency list is a successful no-op", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    Installer installer(reg, test_runtime());

    auto r = installer.install_dependencies({}, ws.project.str(), ws.options());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.empty());
    REQUIRE(reg.view_calls() == 0);
}

// ===== install() =====

TEST_CASE("install reads package.json from the project", "[installer]") {
    Workspace ws;
    ws.project.write_file("package.json", R"({
  "name": "app",
  "dependencies": {"lodash": "^3.0.0"},
  "devDependencies": {"mocha": "2.0.0"}
})");
    FakeRegistry reg;
    add_lodash(reg);
    Installer installer(reg, test_runtime());
    CapturedLog captured;
    auto opts = ws.options();
    opts.logger = captured.sink();

    auto r = installer.install(opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.size() == 2);
    REQUIRE(r.value().modules.count("mocha") == 1);
    REQUIRE(captured.contains(log::Info, "Module version:  72"));
    REQUIRE(captured.contains(log::Info, "Found 2 dependencies"));
}

TEST_CASE("production install skips dev dependencies", "[installer]") {
    Workspace ws;
    ws.project.write_file("package.json", R"({
  "dependencies": {"lodash": "3.10.1"},
  "devDependencies": {"mocha": "2.0.0"}
})");
    FakeRegistry reg;
    Installer installer(reg, test_runtime());
    auto opts = ws.options();
    opts.production = true;

    auto r = installer.install(opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().modules.size() == 1);
    REQUIRE_FALSE(fs::exists(ws.project.path / "node_modules" / "mocha"));
}

TEST_CASE("resolve_project_dir accepts an existing directory", "[installer]") {
    Workspace ws;
    auto r = resolve_project_dir(ws.project.str());
    REQUIRE(r.is_ok());
    REQUIRE(fs::path(r.value()).is_absolute());
    REQUIRE(fs::equivalent(r.value(), ws.project.path));

    auto cwd = resolve_project_dir("");
    REQUIRE(cwd.is_ok());
    REQUIRE(fs::equivalent(cwd.value(), fs::current_path()));
}

TEST_CASE("resolve_project_dir rejects missing paths and files", "[installer]") {
    Workspace ws;
    ws.project.write_file("file.txt", "x");

    auto missing = resolve_project_dir((ws.project.path / "nope").string());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == FastInstallError::InvalidDirectory);
    REQUIRE(missing.error().message ==
            "Invalid directory: " + (ws.project.path / "nope").string());

    auto file = resolve_project_dir((ws.project.path / "file.txt").string());
    REQUIRE(file.is_err());
    REQUIRE(file.error().code == FastInstallError::InvalidDirectory);
}

TEST_CASE("install rejects a missing directory", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    Installer installer(reg, test_runtime());
    auto opts = ws.options();
    opts.dir = (ws.project.path / "nope").string();

    auto r = installer.install(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FastInstallError::InvalidDirectory);
    REQUIRE(r.error().message.find("Invalid directory") == 0);
}

TEST_CASE("install rejects a file as directory", "[installer]") {
    Workspace ws;
    ws.project.write_file("file.txt", "x");
    FakeRegistry reg;
    Installer installer(reg, test_runtime());
    auto opts = ws.options();
    opts.dir = (ws.project.path / "file.txt").string();

    auto r = installer.install(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FastInstallError::InvalidDirectory);
}

TEST_CASE("install without package.json fails before any work", "[installer]") {
    Workspace ws;
    FakeRegistry reg;
    Installer installer(reg, test_runtime());

    auto r = installer.install(ws.options());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FastInstallError::ManifestMissing);
    REQUIRE(reg.view_calls() == 0);
    REQUIRE_FALSE(fs::exists(ws.project.path / "node_modules"));
}

TEST_CASE("install_state_name", "[installer]") {
    REQUIRE(std::string(install_state_name(InstallState::FastCacheHit)) == "FastCacheHit");
    REQUIRE(std::string(install_state_name(InstallState::Committed)) == "Committed");
    REQUIRE(std::string(install_state_name(InstallState::Failed)) == "Failed");
}
