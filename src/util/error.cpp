#include <fastinstall/error.hpp>

namespace fastinstall {

const char* FastInstallError::code_name(Code c) {
    switch (c) {
        case IO:               return "IO";
        case Parse:            return "Parse";
        case Config:           return "Config";
        case InvalidArg:       return "InvalidArg";
        case InvalidDirectory: return "InvalidDirectory";
        case ManifestMissing:  return "ManifestMissing";
        case Manifest:         return "Manifest";
        case MalformedGitSpec: return "MalformedGitSpec";
        case Registry:         return "Registry";
        case Fetch:            return "Fetch";
        case CacheWrite:       return "CacheWrite";
        case Copy:             return "Copy";
        case Timeout:          return "Timeout";
        case Runtime:          return "Runtime";
    }
    return "Unknown";
}

FastInstallError& FastInstallError::wrap(const std::string& context) {
    message = context + ": " + message;
    return *this;
}

std::string FastInstallError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace fastinstall
