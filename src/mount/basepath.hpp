// mount/basepath.hpp - Path confinement (BasePathFs, Root)
#pragma once

#include "../core/fs.hpp"
#include <memory>
#include <string>

namespace layerfs {

// File handle whose name is reported relative to the confining base
class BasePathFile : public File {
public:
  BasePathFile(FilePtr file, std::string base);

  std::string name() const override;
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
  FilePtr file_;
  std::string base_;
};

// Restricts every operation to a directory of the source backend. Each name
// is joined to the base and cleaned; a result that no longer lies under the
// base is reported as not_found with the caller's name, without ever
// reaching the source.
class BasePathFs : public Fs,
                   public Lstater,
                   public Symlinker,
                   public Readlinker {
public:
  BasePathFs(FsPtr source, const std::string &base);

  std::string name() const override;
  const std::string &base() const { return base_; }
  const FsPtr &source() const { return source_; }

  // Path on the source backend, throws not_found for escaping names
  std::string real_path(const std::string &op, const std::string &name) const;

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

private:
  FsPtr source_;
  std::string base_;
};

// A confinement that is opened, used and closed. On top of the prefix check
// every name must be local: relative, without a leading "..". Any call on a
// closed root fails with invalid_argument, and so does a second close.
class Root : public Fs, public Lstater, public Symlinker, public Readlinker {
  // Only open_root can name this, which keeps the constructor private in
  // effect while std::make_unique can still reach it.
  struct Token {
    explicit Token() = default;
  };

public:
  Root(Token, std::unique_ptr<BasePathFs> fs) : fs_(std::move(fs)) {}

  // Fails with invalid_argument unless dir is an existing directory
  static std::unique_ptr<Root> open_root(FsPtr source, const std::string &dir);

  // Name of the root directory, empty once closed
  std::string name() const override;
  bool closed() const { return !fs_; }

  // Derives an independent root one level deeper
  std::unique_ptr<Root> open_root(const std::string &name);
  void close();

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
  FileInfo lstat(const std::string &name);
  void chmod(const std::string &name, fs::perms mode) override;
  void chtimes(const std::string &name, TimePoint atime,
               TimePoint mtime) override;

  std::pair<FileInfo, bool>
  lstat_if_possible(const std::string &name) override;
  bool symlink_if_possible(const std::string &oldname,
                           const std::string &newname) override;
  std::optional<std::string>
  readlink_if_possible(const std::string &name) override;

private:
  BasePathFs &check(const char *op, const std::string &name) const;

  std::unique_ptr<BasePathFs> fs_;
};

} // namespace layerfs
