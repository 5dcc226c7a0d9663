#pragma once

#include <fastinstall/result.hpp>
#include <string>

namespace fastinstall {

// How a raw dependency specifier must be resolved
enum class SpecKind {
    ExactVersion,  // "1.2.3": usable as a cache key as-is
    SemverRange,   // "^1.2.0", "*", "latest": needs a registry lookup
    GitRef,        // "git+ssh://host/repo.git#1.2.3": version from the fragment
};

const char* spec_kind_name(SpecKind kind);

struct Classification {
    SpecKind kind = SpecKind::SemverRange;
    std::string version;  // concrete version; empty for SemverRange
};

bool is_git_spec(const std::string& raw_spec);

// Pure. Fails with MalformedGitSpec for a git spec lacking "#<version>".
Result<Classification> classify(const std::string& raw_spec);

} // namespace fastinstall
