#include <fastinstall/merge.hpp>

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace fastinstall {

static FastInstallError copy_error(const std::string& what, const fs::path& p,
                                   const std::error_code& ec) {
    return FastInstallError{FastInstallError::Copy,
        what + " '" + p.string() + "': " + ec.message()};
}

// create_directories, tolerating a concurrent creator
static Status ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::is_directory(dir)) {
        return copy_error("cannot create directory", dir, ec);
    }
    if (!fs::is_directory(dir)) {
        return FastInstallError{FastInstallError::Copy,
            "destination exists and is not a directory: " + dir.string()};
    }
    return ok_status();
}

static Status copy_symlink_entry(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::path link = fs::read_symlink(src, ec);
    if (ec) return copy_error("cannot read symlink", src, ec);

    if (fs::is_symlink(fs::symlink_status(dst, ec))) {
        if (fs::read_symlink(dst, ec) == link) return ok_status();
    }
    fs::remove(dst, ec);
    fs::create_symlink(link, dst, ec);
    // Another merger recreated it first; identical keys mean identical links
    if (ec && !fs::is_symlink(fs::symlink_status(dst))) {
        return copy_error("cannot create symlink", dst, ec);
    }
    return ok_status();
}

static Status copy_entry(const fs::path& src, const fs::path& dst,
                         const fs::file_status& st);

static Status copy_into(const fs::path& src_dir, const fs::path& dst_dir) {
    std::error_code ec;
    fs::directory_iterator it(src_dir, ec);
    if (ec) return copy_error("cannot read directory", src_dir, ec);

    for (const auto& entry : it) {
        fs::file_status st = entry.symlink_status(ec);
        if (ec) return copy_error("cannot stat", entry.path(), ec);
        FASTINSTALL_TRY(copy_entry(entry.path(), dst_dir / entry.path().filename(), st));
    }
    return ok_status();
}

static Status copy_entry(const fs::path& src, const fs::path& dst,
                         const fs::file_status& st) {
    std::error_code ec;
    if (fs::is_symlink(st)) {
        return copy_symlink_entry(src, dst);
    }
    if (fs::is_directory(st)) {
        FASTINSTALL_TRY(ensure_dir(dst));
        return copy_into(src, dst);
    }
    if (fs::is_regular_file(st)) {
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) return copy_error("cannot copy file", src, ec);
    }
    // sockets, fifos and devices are not package content
    return ok_status();
}

Status merge_tree(const std::string& source, const std::string& dest_root) {
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return FastInstallError{FastInstallError::Copy,
            "merge source is not a directory: " + source};
    }
    FASTINSTALL_TRY(ensure_dir(dest_root));

    // Snapshot the top-level entries, then handle each one separately
    std::vector<fs::directory_entry> top;
    fs::directory_iterator it(source, ec);
    if (ec) return copy_error("cannot read directory", source, ec);
    for (const auto& entry : it) top.push_back(entry);

    for (const auto& entry : top) {
        fs::file_status st = entry.symlink_status(ec);
        if (ec) return copy_error("cannot stat", entry.path(), ec);
        FASTINSTALL_TRY(copy_entry(entry.path(),
                                   fs::path(dest_root) / entry.path().filename(), st));
    }
    return ok_status();
}

} // namespace fastinstall
