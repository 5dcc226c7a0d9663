#include <fastinstall/classify.hpp>
#include <fastinstall/version.hpp>

namespace fastinstall {

const char* spec_kind_name(SpecKind kind) {
    switch (kind) {
        case SpecKind::ExactVersion: return "exact";
        case SpecKind::SemverRange:  return "range";
        case SpecKind::GitRef:       return "git";
    }
    return "unknown";
}

bool is_git_spec(const std::string& raw_spec) {
    return raw_spec.compare(0, 4, "git+") == 0 ||
           raw_spec.compare(0, 6, "git://") == 0;
}

Result<Classification> classify(const std::string& raw_spec) {
    Classification c;

    if (is_git_spec(raw_spec)) {
        size_t hash = raw_spec.find('#');
        if (hash == std::string::npos || hash + 1 == raw_spec.size()) {
            return FastInstallError{FastInstallError::MalformedGitSpec,
                "git dependency '" + raw_spec + "' has no #<version> fragment",
                "git requirements must include a #1.2.3 style version, e.g. "
                "'git+ssh://git@example.com/ORG/THING.git#1.2.3'"};
        }
        c.kind = SpecKind::GitRef;
        c.version = raw_spec.substr(hash + 1);
        return Result<Classification>::ok(std::move(c));
    }

    if (is_exact_version(raw_spec)) {
        c.kind = SpecKind::ExactVersion;
        c.version = raw_spec;
        return Result<Classification>::ok(std::move(c));
    }

    c.kind = SpecKind::SemverRange;
    return Result<Classification>::ok(std::move(c));
}

} // namespace fastinstall
