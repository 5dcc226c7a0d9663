#pragma once

#include <string>

namespace fastinstall {

struct FastInstallError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        InvalidDirectory,
        ManifestMissing,
        Manifest,
        MalformedGitSpec,
        Registry,
        Fetch,
        CacheWrite,
        Copy,
        Timeout,
        Runtime
    };

    Code code = IO;
    std::string message;
    std::string hint;

    FastInstallError() = default;
    FastInstallError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FastInstallError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Prefix the message with context, e.g. the dependency being installed
    FastInstallError& wrap(const std::string& context);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace fastinstall
