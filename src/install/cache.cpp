#include <fastinstall/cache.hpp>
#include <fastinstall/merge.hpp>
#include <fastinstall/scratch.hpp>

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace fastinstall {

// ---------------------------------------------------------------------------
// CacheKey
// ---------------------------------------------------------------------------

std::string CacheKey::escape_segment(const std::string& s) {
    static const char hex[] = "0123456789ABCDEF";
    bool only_dots = s.find_first_not_of('.') == std::string::npos;

    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') ||
                    c == '-' || c == '_' || c == '+' || c == '@' ||
                    (c == '.' && !only_dots);
        if (safe) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string CacheKey::relative_path() const {
    return escape_segment(name) + "/" + escape_segment(version) + "/" +
           escape_segment(arch) + "/" + std::to_string(abi);
}

// ---------------------------------------------------------------------------
// CacheStore
// ---------------------------------------------------------------------------

CacheStore::CacheStore(std::string root, log::Sink logger)
    : root_(std::move(root)), logger_(std::move(logger)) {}

std::string CacheStore::default_root() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.fastinstall/cache";
}

Status CacheStore::init() const {
    std::error_code ec;
    if (fs::is_directory(root_, ec)) return ok_status();

    log::write(logger_, log::Debug, "initializing cache dir: %s", root_.c_str());
    fs::create_directories(root_, ec);
    if (ec && !fs::is_directory(root_)) {
        return FastInstallError{FastInstallError::CacheWrite,
            "cannot create cache dir '" + root_ + "': " + ec.message()};
    }
    return ok_status();
}

std::string CacheStore::entry_path(const CacheKey& key) const {
    return (fs::path(root_) / key.relative_path()).string();
}

bool CacheStore::exists(const CacheKey& key) const {
    std::error_code ec;
    return fs::exists(entry_path(key), ec);
}

Status CacheStore::commit(const std::string& staged_dir, const CacheKey& key) const {
    std::string dest = entry_path(key);
    std::error_code ec;

    if (fs::exists(dest, ec)) {
        log::write(logger_, log::Debug, "cache entry already present: %s", dest.c_str());
        return ok_status();
    }

    fs::create_directories(fs::path(dest).parent_path(), ec);
    if (ec && !fs::is_directory(fs::path(dest).parent_path())) {
        return FastInstallError{FastInstallError::CacheWrite,
            "cannot create cache dir for " + key.name + "@" + key.version +
            ": " + ec.message()};
    }

    fs::rename(staged_dir, dest, ec);
    if (!ec) return ok_status();

    // Lost a race against an identical commit of the same key
    if (fs::exists(dest)) {
        log::write(logger_, log::Debug, "cache entry appeared during commit: %s",
                   dest.c_str());
        return ok_status();
    }

    if (ec == std::errc::cross_device_link) {
        return commit_by_copy(staged_dir, dest, key);
    }

    return FastInstallError{FastInstallError::CacheWrite,
        "cannot move " + staged_dir + " to " + dest + ": " + ec.message()};
}

// Scratch space lives on another filesystem: copy into a staging dir next to
// the cache, then rename, so the key path never holds a partial tree.
Status CacheStore::commit_by_copy(const std::string& staged_dir,
                                  const std::string& dest,
                                  const CacheKey& key) const {
    auto staging = make_unique_dir((fs::path(root_) / ".staging").string(),
                                   CacheKey::escape_segment(key.name) + "-");
    if (staging.is_err()) {
        auto err = std::move(staging).error();
        err.code = FastInstallError::CacheWrite;
        return err;
    }
    const std::string& tmp = staging.value();

    std::error_code ec;
    fs::copy(staged_dir, tmp,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (!ec) fs::rename(tmp, dest, ec);

    if (ec) {
        std::error_code ignored;
        fs::remove_all(tmp, ignored);
        if (fs::exists(dest)) return ok_status();
        return FastInstallError{FastInstallError::CacheWrite,
            "cannot copy " + staged_dir + " to " + dest + ": " + ec.message()};
    }

    fs::remove_all(staged_dir, ec);
    return ok_status();
}

Status CacheStore::read_into(const CacheKey& key, const std::string& dest_root) const {
    return merge_tree(entry_path(key), dest_root);
}

} // namespace fastinstall
