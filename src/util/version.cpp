#include <fastinstall/version.hpp>
#include <algorithm>
#include <cctype>

namespace fastinstall {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static const int64_t kMaxSafeInteger = 9007199254740991LL;

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

static std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::string cur;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) tokens.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(std::move(cur));
    return tokens;
}

static bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

static bool is_wildcard(const std::string& s) {
    return s == "x" || s == "X" || s == "*";
}

// Numeric component: no leading zeros, at most 2^53-1
static bool parse_number(const std::string& s, int64_t& out) {
    if (!is_digits(s)) return false;
    if (s.size() > 1 && s[0] == '0') return false;
    int64_t v = 0;
    for (char c : s) {
        v = v * 10 + (c - '0');
        if (v > kMaxSafeInteger) return false;
    }
    out = v;
    return true;
}

static bool valid_identifier(const std::string& id, bool numeric_strict) {
    if (id.empty()) return false;
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    if (numeric_strict && is_digits(id) && id.size() > 1 && id[0] == '0') return false;
    return true;
}

static int compare_identifiers(const std::string& a, const std::string& b) {
    bool an = is_digits(a);
    bool bn = is_digits(b);
    if (an && bn) {
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    // Numeric identifiers sort before alphanumeric ones
    if (an) return -1;
    if (bn) return 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

static FastInstallError version_error(const std::string& s, const std::string& what) {
    return FastInstallError{FastInstallError::Parse,
        what + " in version '" + s + "'",
        "expected format: major.minor.patch[-prerelease][+build]"};
}

// Split "core[-pre][+build]" into its three parts
static void split_version_parts(const std::string& s, std::string& core,
                                std::string& pre, std::string& build,
                                bool& has_pre, bool& has_build) {
    core = s;
    has_pre = false;
    has_build = false;
    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        build = core.substr(plus + 1);
        core = core.substr(0, plus);
        has_build = true;
    }
    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        pre = core.substr(dash + 1);
        core = core.substr(0, dash);
        has_pre = true;
    }
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) {
        return FastInstallError{FastInstallError::Parse, "empty version string"};
    }
    if (t[0] == 'v') t.erase(0, 1);

    std::string core, pre, build;
    bool has_pre = false, has_build = false;
    split_version_parts(t, core, pre, build, has_pre, has_build);

    auto nums = split(core, '.');
    if (nums.size() != 3) {
        return version_error(s, "expected three numeric components");
    }

    Version v;
    if (!parse_number(nums[0], v.major)) return version_error(s, "invalid major");
    if (!parse_number(nums[1], v.minor)) return version_error(s, "invalid minor");
    if (!parse_number(nums[2], v.patch)) return version_error(s, "invalid patch");

    if (has_pre) {
        for (auto& id : split(pre, '.')) {
            if (!valid_identifier(id, true)) {
                return version_error(s, "invalid prerelease identifier '" + id + "'");
            }
            v.prerelease.push_back(std::move(id));
        }
    }
    if (has_build) {
        for (const auto& id : split(build, '.')) {
            if (!valid_identifier(id, false)) {
                return version_error(s, "invalid build identifier '" + id + "'");
            }
        }
        v.build = build;
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    for (size_t i = 0; i < prerelease.size(); ++i) {
        s += (i == 0 ? "-" : ".");
        s += prerelease[i];
    }
    return s;
}

int Version::compare(const Version& o) const {
    if (major != o.major) return major < o.major ? -1 : 1;
    if (minor != o.minor) return minor < o.minor ? -1 : 1;
    if (patch != o.patch) return patch < o.patch ? -1 : 1;

    // A prerelease sorts before the release it precedes
    if (prerelease.empty() && o.prerelease.empty()) return 0;
    if (prerelease.empty()) return 1;
    if (o.prerelease.empty()) return -1;

    size_t n = std::min(prerelease.size(), o.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compare_identifiers(prerelease[i], o.prerelease[i]);
        if (c != 0) return c;
    }
    if (prerelease.size() == o.prerelease.size()) return 0;
    return prerelease.size() < o.prerelease.size() ? -1 : 1;
}

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    std::string t = trim(s);
    if (!t.empty() && t[0] == '=') t = trim(t.substr(1));
    if (!t.empty() && t[0] == 'v') t.erase(0, 1);

    PartialVersion pv;
    if (t.empty()) return Result<PartialVersion>::ok(pv);

    std::string core, pre, build;
    bool has_pre = false, has_build = false;
    split_version_parts(t, core, pre, build, has_pre, has_build);

    auto parts = split(core, '.');
    if (parts.size() > 3) {
        return FastInstallError{FastInstallError::Parse,
            "too many components in '" + s + "'"};
    }

    int64_t* slots[3] = {&pv.major, &pv.minor, &pv.patch};
    bool wildcard = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard(parts[i])) {
            wildcard = true;
            continue;
        }
        int64_t n = 0;
        if (!parse_number(parts[i], n)) {
            return FastInstallError{FastInstallError::Parse,
                "invalid version component '" + parts[i] + "' in '" + s + "'"};
        }
        // Anything after a wildcard stays a wildcard: 1.x.3 == 1.x
        if (!wildcard) *slots[i] = n;
    }

    if (has_pre && pv.is_full()) {
        for (auto& id : split(pre, '.')) {
            if (!valid_identifier(id, true)) {
                return FastInstallError{FastInstallError::Parse,
                    "invalid prerelease identifier '" + id + "' in '" + s + "'"};
            }
            pv.prerelease.push_back(std::move(id));
        }
    }

    return Result<PartialVersion>::ok(std::move(pv));
}

// ---------------------------------------------------------------------------
// Comparator
// ---------------------------------------------------------------------------

bool Comparator::matches(const Version& v) const {
    int c = v.compare(version);
    switch (op) {
    case CompareOp::Equal:     return c == 0;
    case CompareOp::Less:      return c < 0;
    case CompareOp::LessEq:    return c <= 0;
    case CompareOp::Greater:   return c > 0;
    case CompareOp::GreaterEq: return c >= 0;
    }
    return false;
}

std::string Comparator::to_string() const {
    std::string prefix;
    switch (op) {
    case CompareOp::Equal:     prefix = "="; break;
    case CompareOp::Less:      prefix = "<"; break;
    case CompareOp::LessEq:    prefix = "<="; break;
    case CompareOp::Greater:   prefix = ">"; break;
    case CompareOp::GreaterEq: prefix = ">="; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// Range desugaring
// ---------------------------------------------------------------------------

using ComparatorSet = std::vector<Comparator>;

static Version make_version(int64_t major, int64_t minor, int64_t patch,
                            std::vector<std::string> pre = {}) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    v.prerelease = std::move(pre);
    return v;
}

static Comparator at_least(int64_t major, int64_t minor, int64_t patch,
                           std::vector<std::string> pre = {}) {
    return Comparator{CompareOp::GreaterEq, make_version(major, minor, patch, std::move(pre))};
}

// "<X.Y.Z-0": excludes X.Y.Z and its prereleases
static Comparator below(int64_t major, int64_t minor, int64_t patch) {
    return Comparator{CompareOp::Less, make_version(major, minor, patch, {"0"})};
}

static Comparator nothing() {
    return below(0, 0, 0);
}

static ComparatorSet desugar_tilde(const PartialVersion& p) {
    if (p.is_any()) return {};
    if (p.minor < 0) return {at_least(p.major, 0, 0), below(p.major + 1, 0, 0)};
    if (p.patch < 0) return {at_least(p.major, p.minor, 0), below(p.major, p.minor + 1, 0)};
    return {at_least(p.major, p.minor, p.patch, p.prerelease),
            below(p.major, p.minor + 1, 0)};
}

static ComparatorSet desugar_caret(const PartialVersion& p) {
    if (p.is_any()) return {};
    if (p.minor < 0) return {at_least(p.major, 0, 0), below(p.major + 1, 0, 0)};
    if (p.patch < 0) {
        if (p.major == 0) return {at_least(0, p.minor, 0), below(0, p.minor + 1, 0)};
        return {at_least(p.major, p.minor, 0), below(p.major + 1, 0, 0)};
    }

    Comparator lower = at_least(p.major, p.minor, p.patch, p.prerelease);
    if (p.major == 0) {
        if (p.minor == 0) return {lower, below(0, 0, p.patch + 1)};
        return {lower, below(0, p.minor + 1, 0)};
    }
    return {lower, below(p.major + 1, 0, 0)};
}

static ComparatorSet desugar_primitive(std::string op, const PartialVersion& p) {
    if (p.is_any()) {
        if (op == "<" || op == ">") return {nothing()};
        return {};
    }

    if (p.is_full()) {
        Version v = make_version(p.major, p.minor, p.patch, p.prerelease);
        if (op == "<")  return {Comparator{CompareOp::Less, v}};
        if (op == "<=") return {Comparator{CompareOp::LessEq, v}};
        if (op == ">")  return {Comparator{CompareOp::Greater, v}};
        if (op == ">=") return {Comparator{CompareOp::GreaterEq, v}};
        return {Comparator{CompareOp::Equal, v}};
    }

    int64_t major = p.major;
    int64_t minor = p.minor;
    bool minor_x = minor < 0;

    if (op.empty() || op == "=") {
        if (minor_x) return {at_least(major, 0, 0), below(major + 1, 0, 0)};
        return {at_least(major, minor, 0), below(major, minor + 1, 0)};
    }

    if (minor_x) minor = 0;
    if (op == ">") {
        op = ">=";
        if (minor_x) {
            major += 1;
            minor = 0;
        } else {
            minor += 1;
        }
    } else if (op == "<=") {
        op = "<";
        if (minor_x) {
            major += 1;
        } else {
            minor += 1;
        }
    }

    if (op == "<") return {below(major, minor, 0)};
    return {at_least(major, minor, 0)};
}

static ComparatorSet desugar_hyphen(const PartialVersion& from, const PartialVersion& to) {
    ComparatorSet out;
    if (!from.is_any()) {
        if (from.minor < 0) {
            out.push_back(at_least(from.major, 0, 0));
        } else if (from.patch < 0) {
            out.push_back(at_least(from.major, from.minor, 0));
        } else {
            out.push_back(at_least(from.major, from.minor, from.patch, from.prerelease));
        }
    }
    if (!to.is_any()) {
        if (to.minor < 0) {
            out.push_back(below(to.major + 1, 0, 0));
        } else if (to.patch < 0) {
            out.push_back(below(to.major, to.minor + 1, 0));
        } else {
            out.push_back(Comparator{CompareOp::LessEq,
                make_version(to.major, to.minor, to.patch, to.prerelease)});
        }
    }
    return out;
}

static Result<ComparatorSet> parse_comparator_token(const std::string& token) {
    std::string op;
    size_t pos = 0;
    if (token.compare(0, 2, "~>") == 0) {
        op = "~";
        pos = 2;
    } else if (token.compare(0, 2, ">=") == 0 || token.compare(0, 2, "<=") == 0) {
        op = token.substr(0, 2);
        pos = 2;
    } else if (!token.empty() && std::string("~^<>=").find(token[0]) != std::string::npos) {
        op = token.substr(0, 1);
        pos = 1;
    }

    std::string rest = trim(token.substr(pos));
    if (rest.empty() && !op.empty()) {
        return FastInstallError{FastInstallError::Parse,
            "missing version after '" + op + "' in range"};
    }

    auto pv = PartialVersion::parse(rest);
    if (pv.is_err()) return std::move(pv).error();

    if (op == "~") return Result<ComparatorSet>::ok(desugar_tilde(pv.value()));
    if (op == "^") return Result<ComparatorSet>::ok(desugar_caret(pv.value()));
    return Result<ComparatorSet>::ok(desugar_primitive(op, pv.value()));
}

static Result<ComparatorSet> parse_set(const std::string& raw) {
    auto tokens = split_whitespace(raw);
    ComparatorSet out;

    // Hyphen range: "1.2.3 - 2.3.4"
    if (tokens.size() == 3 && tokens[1] == "-") {
        auto from = PartialVersion::parse(tokens[0]);
        if (from.is_err()) return std::move(from).error();
        auto to = PartialVersion::parse(tokens[2]);
        if (to.is_err()) return std::move(to).error();
        return Result<ComparatorSet>::ok(desugar_hyphen(from.value(), to.value()));
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string tok = tokens[i];
        // Glue a detached operator to its version: ">= 1.2.3"
        bool lone_op = tok.find_first_not_of("<>=~^") == std::string::npos;
        if (lone_op && i + 1 < tokens.size()) {
            tok += tokens[++i];
        }
        auto parsed = parse_comparator_token(tok);
        if (parsed.is_err()) return std::move(parsed).error();
        for (auto& c : parsed.value()) out.push_back(std::move(c));
    }

    return Result<ComparatorSet>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// VersionRange
// ---------------------------------------------------------------------------

Result<VersionRange> VersionRange::parse(const std::string& s) {
    VersionRange range;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find("||", start);
        std::string part = s.substr(start, pos == std::string::npos ? std::string::npos
                                                                    : pos - start);
        auto set = parse_set(part);
        if (set.is_err()) {
            auto err = std::move(set).error();
            err.message = "invalid range '" + s + "': " + err.message;
            return err;
        }
        range.sets.push_back(std::move(set).value());
        if (pos == std::string::npos) break;
        start = pos + 2;
    }
    return Result<VersionRange>::ok(std::move(range));
}

static bool set_satisfies(const ComparatorSet& set, const Version& v) {
    for (const auto& c : set) {
        if (!c.matches(v)) return false;
    }
    if (v.prerelease.empty()) return true;

    // A prerelease only matches when the set opts into that exact tuple
    for (const auto& c : set) {
        if (c.version.prerelease.empty()) continue;
        if (c.version.major == v.major && c.version.minor == v.minor &&
            c.version.patch == v.patch) {
            return true;
        }
    }
    return false;
}

bool VersionRange::satisfies(const Version& v) const {
    return std::any_of(sets.begin(), sets.end(),
        [&](const ComparatorSet& set) { return set_satisfies(set, v); });
}

std::string VersionRange::to_string() const {
    std::string s;
    for (size_t i = 0; i < sets.size(); ++i) {
        if (i > 0) s += " || ";
        if (sets[i].empty()) {
            s += "*";
            continue;
        }
        for (size_t j = 0; j < sets[i].size(); ++j) {
            if (j > 0) s += " ";
            s += sets[i][j].to_string();
        }
    }
    return s;
}

// ---------------------------------------------------------------------------
// Matcher entry points
// ---------------------------------------------------------------------------

bool is_exact_version(const std::string& s) {
    return Version::parse(s).is_ok();
}

std::optional<std::string> max_satisfying(const std::vector<std::string>& candidates,
                                          const std::string& range) {
    auto parsed = VersionRange::parse(range);
    if (parsed.is_err()) return std::nullopt;

    std::optional<Version> best;
    std::optional<std::string> best_str;
    for (const auto& candidate : candidates) {
        auto v = Version::parse(candidate);
        if (v.is_err()) continue;
        if (!parsed.value().satisfies(v.value())) continue;
        if (!best || v.value() > *best) {
            best = v.value();
            best_str = candidate;
        }
    }
    return best_str;
}

} // namespace fastinstall
