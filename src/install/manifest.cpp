#include <fastinstall/manifest.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fastinstall {

using ordered_json = nlohmann::ordered_json;

const char* dependency_group_key(DependencyGroup group) {
    switch (group) {
        case DependencyGroup::Production: return "dependencies";
        case DependencyGroup::Optional:   return "optionalDependencies";
        case DependencyGroup::Dev:        return "devDependencies";
    }
    return "dependencies";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<std::vector<Dependency>> parse_section(const ordered_json& doc,
                                                     DependencyGroup group) {
    std::vector<Dependency> deps;
    const char* key = dependency_group_key(group);

    auto it = doc.find(key);
    // Missing or non-object sections are treated as empty
    if (it == doc.end() || !it->is_object()) {
        return Result<std::vector<Dependency>>::ok(std::move(deps));
    }

    for (const auto& item : it->items()) {
        if (!item.value().is_string()) {
            return FastInstallError{FastInstallError::Manifest,
                std::string(key) + "." + item.key() + " must be a version string"};
        }
        deps.push_back(Dependency{item.key(), item.value().get<std::string>(), group});
    }
    return Result<std::vector<Dependency>>::ok(std::move(deps));
}

// ---------------------------------------------------------------------------
// PackageManifest
// ---------------------------------------------------------------------------

Result<PackageManifest> PackageManifest::parse(const std::string& json_text) {
    ordered_json doc;
    try {
        doc = ordered_json::parse(json_text);
    } catch (const ordered_json::parse_error& e) {
        return FastInstallError{FastInstallError::Parse,
            std::string("package.json parse error: ") + e.what()};
    }

    if (!doc.is_object()) {
        return FastInstallError{FastInstallError::Manifest,
            "package.json must contain a JSON object"};
    }

    PackageManifest m;
    if (auto n = doc.find("name"); n != doc.end() && n->is_string()) {
        m.name = n->get<std::string>();
    }
    if (auto v = doc.find("version"); v != doc.end() && v->is_string()) {
        m.version = v->get<std::string>();
    }

    auto prod = parse_section(doc, DependencyGroup::Production);
    if (prod.is_err()) return std::move(prod).error();
    m.dependencies = std::move(prod).value();

    auto opt = parse_section(doc, DependencyGroup::Optional);
    if (opt.is_err()) return std::move(opt).error();
    m.optional_dependencies = std::move(opt).value();

    auto dev = parse_section(doc, DependencyGroup::Dev);
    if (dev.is_err()) return std::move(dev).error();
    m.dev_dependencies = std::move(dev).value();

    return Result<PackageManifest>::ok(std::move(m));
}

Result<PackageManifest> PackageManifest::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return FastInstallError{FastInstallError::ManifestMissing,
            "no package.json found: " + path};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return FastInstallError{FastInstallError::IO,
            "cannot open manifest: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto m = parse(ss.str());
    if (m.is_err()) return std::move(m).error().wrap(path);
    return m;
}

std::vector<Dependency> PackageManifest::collect(bool production_only) const {
    std::vector<Dependency> out;
    std::unordered_set<std::string> seen;

    auto add = [&](const std::vector<Dependency>& section) {
        for (const auto& dep : section) {
            if (seen.insert(dep.name).second) out.push_back(dep);
        }
    };

    add(dependencies);
    if (!production_only) {
        add(optional_dependencies);
        add(dev_dependencies);
    }
    return out;
}

} // namespace fastinstall
