#pragma once

#include <fastinstall/log.hpp>
#include <fastinstall/result.hpp>
#include <string>

namespace fastinstall {

// Identity of one cache entry. Same key implies interchangeable content;
// entries are never re-validated.
struct CacheKey {
    std::string name;
    std::string version;
    std::string arch;
    int abi = 0;

    // name/version/arch/abi, each segment escaped (see escape_segment)
    std::string relative_path() const;

    // Percent-encode bytes outside [A-Za-z0-9._+@-] so "@scope/pkg" stays one
    // segment and distinct inputs never collide. "." and ".." are encoded too.
    static std::string escape_segment(const std::string& s);

    bool operator==(const CacheKey& o) const {
        return name == o.name && version == o.version &&
               arch == o.arch && abi == o.abi;
    }
};

// Layout:
//   <root>/<name>/<version>/<arch>/<abi>/   one installed node_modules tree
//   <root>/.staging/                        in-flight cross-device commits
class CacheStore {
public:
    explicit CacheStore(std::string root, log::Sink logger = {});

    // Default: ~/.fastinstall/cache
    static std::string default_root();

    // Create the root directory if missing
    Status init() const;

    std::string entry_path(const CacheKey& key) const;

    // Existence of the entry directory is the only record
    bool exists(const CacheKey& key) const;

    // Move a fetched node_modules tree into place. An entry that already
    // exists (or appears while committing) counts as success. Fails with
    // CacheWrite. The staged directory is consumed on success.
    Status commit(const std::string& staged_dir, const CacheKey& key) const;

    // Merge the entry into dest_root (Directory Merger)
    Status read_into(const CacheKey& key, const std::string& dest_root) const;

    const std::string& root() const { return root_; }

private:
    Status commit_by_copy(const std::string& staged_dir,
                          const std::string& dest, const CacheKey& key) const;

    std::string root_;
    log::Sink logger_;
};

} // namespace fastinstall
