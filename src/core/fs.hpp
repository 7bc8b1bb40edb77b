// core/fs.hpp - Filesystem capability contract
#pragma once

#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace layerfs {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class FileType { Regular, Directory, Symlink };

// Snapshot of an entry taken when it was queried. Later changes to the
// entry are not reflected.
struct FileInfo {
  std::string name; // base name
  int64_t size = 0;
  FileType type = FileType::Regular;
  fs::perms perms = fs::perms::none;
  TimePoint mod_time;
  // Set only for synthetic directories produced by a mount namespace
  bool mount_point = false;

  bool is_dir() const { return type == FileType::Directory; }
  bool is_symlink() const { return type == FileType::Symlink; }
  bool is_regular() const { return type == FileType::Regular; }
};

class File {
public:
  virtual ~File() = default;

  virtual std::string name() const = 0;

  // read() returns 0 at end of file
  virtual size_t read(void *buf, size_t len) = 0;
  virtual size_t read_at(void *buf, size_t len, int64_t offset) = 0;
  virtual size_t write(const void *buf, size_t len) = 0;
  virtual size_t write_at(const void *buf, size_t len, int64_t offset) = 0;
  virtual int64_t seek(int64_t offset, int whence) = 0;
  virtual void truncate(int64_t size) = 0;
  virtual void sync() = 0;
  virtual void close() = 0;
  virtual FileInfo stat() = 0;

  // Returns up to count entries, or every remaining one when count <= 0.
  // With count > 0 an exhausted directory yields std::nullopt, an empty
  // vector only means nothing was left for this particular call.
  virtual std::optional<std::vector<FileInfo>> read_dir(int count) = 0;

  std::optional<std::vector<std::string>> read_dir_names(int count);
  size_t write_string(const std::string &s) {
    return write(s.data(), s.size());
  }
};

using FilePtr = std::unique_ptr<File>;

class Fs {
public:
  virtual ~Fs() = default;

  virtual std::string name() const = 0;

  virtual FilePtr create(const std::string &name) = 0;
  virtual FilePtr open(const std::string &name) = 0;
  virtual FilePtr open_file(const std::string &name, int flags,
                            fs::perms perm) = 0;
  virtual void mkdir(const std::string &name, fs::perms perm) = 0;
  virtual void mkdir_all(const std::string &path, fs::perms perm) = 0;
  virtual void remove(const std::string &name) = 0;
  virtual void remove_all(const std::string &path) = 0;
  virtual void rename(const std::string &oldname,
                      const std::string &newname) = 0;
  virtual FileInfo stat(const std::string &name) = 0;
  virtual void chmod(const std::string &name, fs::perms mode) = 0;
  virtual void chtimes(const std::string &name, TimePoint atime,
                       TimePoint mtime) = 0;
};

using FsPtr = std::shared_ptr<Fs>;

// Optional capabilities. Backends advertise them by also deriving from
// these interfaces; callers probe with dynamic_cast.

class Lstater {
public:
  virtual ~Lstater() = default;
  // Second member is false when the call fell back to a plain stat
  virtual std::pair<FileInfo, bool>
  lstat_if_possible(const std::string &name) = 0;
};

class Symlinker {
public:
  virtual ~Symlinker() = default;
  // Returns false when no link could be created by this backend
  virtual bool symlink_if_possible(const std::string &oldname,
                                   const std::string &newname) = 0;
};

class Readlinker {
public:
  virtual ~Readlinker() = default;
  // std::nullopt when this backend cannot read links
  virtual std::optional<std::string>
  readlink_if_possible(const std::string &name) = 0;
};

// Probing helpers with the documented fallbacks
std::pair<FileInfo, bool> lstat_if_possible(Fs &fsys, const std::string &name);
bool symlink_if_possible(Fs &fsys, const std::string &oldname,
                         const std::string &newname);
std::optional<std::string> readlink_if_possible(Fs &fsys,
                                                const std::string &name);

bool is_write_flags(int flags);

} // namespace layerfs
