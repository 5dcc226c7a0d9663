#pragma once

#include <fastinstall/result.hpp>
#include <string>

namespace fastinstall {

// Copy the contents of source into dest_root, one top-level entry at a time.
//
// Several packages are merged into the same node_modules concurrently and
// often share top-level names (".bin"). Each top-level directory is created
// if missing ("already exists" is fine) and then filled recursively, so one
// package never replaces a directory another package is populating. Regular
// files are overwritten, symlinks recreated. Fails with Copy.
Status merge_tree(const std::string& source, const std::string& dest_root);

} // namespace fastinstall
