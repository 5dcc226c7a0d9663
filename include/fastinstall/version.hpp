#pragma once

#include <fastinstall/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fastinstall {

// SemVer 2.0 version: major.minor.patch[-prerelease][+build]
struct Version {
    int64_t major = 0;
    int64_t minor = 0;
    int64_t patch = 0;
    std::vector<std::string> prerelease;  // dot-separated identifiers
    std::string build;                    // ignored for precedence

    // Strict parse; a single leading 'v' and surrounding whitespace are allowed
    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    // <0, 0, >0 like strcmp; build metadata is not compared
    int compare(const Version& o) const;

    bool operator==(const Version& o) const { return compare(o) == 0; }
    bool operator!=(const Version& o) const { return compare(o) != 0; }
    bool operator<(const Version& o) const { return compare(o) < 0; }
    bool operator<=(const Version& o) const { return compare(o) <= 0; }
    bool operator>(const Version& o) const { return compare(o) > 0; }
    bool operator>=(const Version& o) const { return compare(o) >= 0; }
};

// Partial version inside a range: "1", "1.2", "1.x", "*"
struct PartialVersion {
    int64_t major = -1;  // -1 means wildcard or unset
    int64_t minor = -1;
    int64_t patch = -1;
    std::vector<std::string> prerelease;

    static Result<PartialVersion> parse(const std::string& s);
    bool is_any() const { return major < 0; }
    bool is_full() const { return major >= 0 && minor >= 0 && patch >= 0; }
};

enum class CompareOp {
    Equal,       // =1.2.3 or bare 1.2.3
    Less,        // <1.2.3
    LessEq,      // <=1.2.3
    Greater,     // >1.2.3
    GreaterEq,   // >=1.2.3
};

// Primitive comparator; tilde, caret, x-ranges and hyphens desugar into these
struct Comparator {
    CompareOp op = CompareOp::GreaterEq;
    Version version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// npm range: comparator sets joined by "||", comparators in a set ANDed.
// An empty set matches any release version.
struct VersionRange {
    std::vector<std::vector<Comparator>> sets;

    static Result<VersionRange> parse(const std::string& s);
    bool satisfies(const Version& v) const;
    std::string to_string() const;
};

// True when s is a single concrete version (semver.valid)
bool is_exact_version(const std::string& s);

// Highest candidate satisfying range, returned as spelled in candidates.
// Unparseable candidates are skipped; an invalid range matches nothing.
std::optional<std::string> max_satisfying(const std::vector<std::string>& candidates,
                                          const std::string& range);

} // namespace fastinstall
