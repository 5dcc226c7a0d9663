#include <fastinstall/scratch.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace fastinstall {

Result<std::string> make_unique_dir(const std::string& parent,
                                    const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return FastInstallError{FastInstallError::IO,
            "cannot create directory '" + parent + "': " + ec.message()};
    }

    std::string tmpl = (fs::path(parent) / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        return FastInstallError{FastInstallError::IO,
            "mkdtemp failed in '" + parent + "': " + std::strerror(errno)};
    }
    return Result<std::string>::ok(std::string(buf.data()));
}

Result<ScratchDir> ScratchDir::create(const std::string& prefix, log::Sink logger) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = "/tmp";

    auto dir = make_unique_dir(base.string(), prefix);
    if (dir.is_err()) return std::move(dir).error();

    log::write(logger, log::Trace, "scratch dir created: %s", dir.value().c_str());
    return Result<ScratchDir>::ok(ScratchDir(std::move(dir).value(), std::move(logger)));
}

ScratchDir::~ScratchDir() {
    remove();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::move(other.path_)), logger_(std::move(other.logger_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        logger_ = std::move(other.logger_);
        other.path_.clear();
    }
    return *this;
}

void ScratchDir::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log::write(logger_, log::Warn, "failed to remove scratch dir %s: %s",
                   path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

} // namespace fastinstall
