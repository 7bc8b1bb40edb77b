// core/symlink.hpp - Symbolic link resolution over any backend
#pragma once

#include "fs.hpp"
#include <optional>
#include <string>

namespace layerfs {

// Resolves every symbolic link in path using the backend's lstat and
// readlink capabilities. Returns std::nullopt when the backend offers
// neither, so callers can fall back to plain stat semantics.
//
// The walk starts at the full path and shortens it one segment at a time.
// A link found on the way is spliced in: absolute targets replace the
// prefix, relative targets are resolved against the link's directory.
// Resolution is bounded by SYMLINK_MAX_ITERATIONS lstat rounds and throws
// invalid_argument when the bound is hit. Cycles and very long acyclic
// chains are not told apart.
std::optional<std::string> eval_symlinks(Fs &fsys, const std::string &path);

// Joins dir and a relative link target, collapsing "//", "." and "..".
// Throws invalid_argument when ".." climbs above the first segment.
std::string resolve_relative(const std::string &dir, const std::string &link);

} // namespace layerfs
