#pragma once

#include <fastinstall/log.hpp>
#include <fastinstall/result.hpp>
#include <string>

namespace fastinstall {

// Create <parent>/<prefix>XXXXXX with a unique suffix (mkdtemp)
Result<std::string> make_unique_dir(const std::string& parent,
                                    const std::string& prefix);

// Exclusively owned staging directory for one fetch.
// Removed (best effort) when the owner goes out of scope.
class ScratchDir {
public:
    // Under the system temp directory. A failed removal is reported to logger.
    static Result<ScratchDir> create(const std::string& prefix = "fastinstall-",
                                     log::Sink logger = {});

    ~ScratchDir();
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return path_; }

    // Remove now instead of at scope exit
    void remove();

private:
    ScratchDir(std::string path, log::Sink logger)
        : path_(std::move(path)), logger_(std::move(logger)) {}

    std::string path_;
    log::Sink logger_;
};

} // namespace fastinstall
