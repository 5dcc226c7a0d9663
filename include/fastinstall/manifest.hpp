#pragma once

#include <fastinstall/result.hpp>
#include <string>
#include <vector>

namespace fastinstall {

// Which package.json section declared a dependency
enum class DependencyGroup {
    Production,  // "dependencies"
    Optional,    // "optionalDependencies"
    Dev,         // "devDependencies"
};

const char* dependency_group_key(DependencyGroup group);

struct Dependency {
    std::string name;
    std::string raw_spec;  // as written: "^3.0.0", "git+ssh://...#1.2.3"
    DependencyGroup group = DependencyGroup::Production;
};

// The parts of package.json an install run reads
struct PackageManifest {
    std::string name;
    std::string version;
    std::vector<Dependency> dependencies;
    std::vector<Dependency> optional_dependencies;
    std::vector<Dependency> dev_dependencies;

    // Declaration order is preserved within each section
    static Result<PackageManifest> parse(const std::string& json_text);

    // Fails with ManifestMissing when the file does not exist
    static Result<PackageManifest> load(const std::string& path);

    // Dependencies to install: production only, or all three sections.
    // A name declared in more than one section is kept once, earliest
    // section first (dependencies, optional, dev).
    std::vector<Dependency> collect(bool production_only) const;
};

} // namespace fastinstall
