// core/ioutil.hpp - Convenience helpers over any Fs
#pragma once

#include "fs.hpp"
#include <functional>
#include <string>
#include <vector>

namespace layerfs {

std::string read_file(Fs &fsys, const std::string &name);
void write_file(Fs &fsys, const std::string &name, const std::string &data,
                fs::perms perm);
void append_file(Fs &fsys, const std::string &name, const std::string &data);

// Entries of a directory sorted by name
std::vector<FileInfo> read_dir(Fs &fsys, const std::string &name);

bool exists(Fs &fsys, const std::string &name);
bool dir_exists(Fs &fsys, const std::string &name);
bool is_dir(Fs &fsys, const std::string &name);
// True for an empty regular file or a directory without entries
bool is_empty(Fs &fsys, const std::string &name);

// Visits root and everything below it in lexical order. Returning false
// from the callback for a directory skips its contents.
using WalkFunc =
    std::function<bool(const std::string &path, const FileInfo &info)>;
void walk(Fs &fsys, const std::string &root, const WalkFunc &fn);

// Copies bytes and permission bits of one regular file
void copy_file(Fs &src_fs, const std::string &src, Fs &dst_fs,
               const std::string &dst);

} // namespace layerfs
