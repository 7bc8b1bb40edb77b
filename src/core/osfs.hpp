// core/osfs.hpp - Passthrough to the host filesystem
#pragma once

#include "fs.hpp"

namespace layerfs {

// Handle on an open host file descriptor
class OsFile : public File {
public:
  OsFile(int fd, std::string name);
  ~OsFile() override;

  OsFile(const OsFile &) = delete;
  OsFile &operator=(const OsFile &) = delete;

  std::string name() const override { return name_; }
  size_t read(void *buf, size_t len) override;
  size_t read_at(void *buf, size_t len, int64_t offset) override;
  size_t write(const void *buf, size_t len) override;
  size_t write_at(const void *buf, size_t len, int64_t offset) override;
  int64_t seek(int64_t offset, int whence) override;
  void truncate(int64_t size) override;
  void sync() override;
  void close() override;
  FileInfo stat() override;
  std::optional<std::vector<FileInfo>> read_dir(int count) override;

private:
  void check_open(const char *op) const;

  int fd_;
  std::string name_;
  // Directory listing snapshot, taken on the first read_dir call
  std::optional<std::vector<FileInfo>> entries_;
  size_t read_dir_pos_ = 0;
};

// Unconfined access to host paths. Paths are passed to the kernel as they
// are, so this backend must be wrapped in a BasePathFs before it is
// mounted anywhere.
class OsFs : public Fs, public Lstater, public Symlinker, public Readlinker {
public:
  std::string name() const override;

  FilePtr create(const std::string &name) override;
  FilePtr open(const std::string &name) override;
  FilePtr open_file(const std::string &name, int flags,
                    fs::perms perm) override;
  void mkdir(const std::string &name, fs::perms perm) override;
  void mkdir_all(const std::string &path, fs::perms perm) override;
  void remove(const std::string &name) override;
  void remove_all(const std::string &path) override;
  void rename(const std::string &oldname, const std::string &newname) override;
  FileInfo stat(const std::string &name) override;
  void chmod(const std::string &name, fs::perms mode) override;
  void chtimes(const std::string &name, TimePoint atime,
               TimePoint mtime) override;

  std::pair<FileInfo, bool>
  lstat_if_possible(const std::string &name) override;
  bool symlink_if_possible(const std::string &oldname,
                           const std::string &newname) override;
  std::optional<std::string>
  readlink_if_possible(const std::string &name) override;
};

} // namespace layerfs
