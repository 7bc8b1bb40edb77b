// mount/filter.hpp - Read-only, predicate and regexp filtering wrappers
#pragma once

#include "../core/fs.hpp"
#include <functional>
#include <regex>
#include <string>

namespace layerfs {

// Rejects every change with permission_denied, reads pass through
class ReadOnlyFs : public Fs, public Lstater, public Readlinker {
public:
  explicit ReadOnlyFs(FsPtr source);

  std::string name() const override;
  const FsPtr &source() const { return source_; }

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
  std::optional<std::string>
  readlink_if_possible(const std::string &name) override;

private:
  FsPtr source_;
};

// Decides whether a regular file is visible, given its normalized path
using FilePredicate = std::function<bool(const std::string &path)>;

// Directory handle that leaves out regular files the predicate rejects
class PredicateFile : public File {
public:
  PredicateFile(FilePtr file, std::string path, FilePredicate pred);

  std::string name() const override { return file_->name(); }
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
  std::string path_;
  FilePredicate pred_;
};

// Only regular files whose path satisfies the predicate are visible.
// Directories are never filtered, so the tree stays walkable. Hidden files
// look missing to every operation, and new files must satisfy the
// predicate, including the target of a rename.
class PredicateFs : public Fs {
public:
  PredicateFs(FsPtr source, FilePredicate pred);

  std::string name() const override;
  const FsPtr &source() const { return source_; }

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

private:
  bool matches(const std::string &name) const;
  // Throws not_found for a regular file hidden by the filter
  void check_visible(const char *op, const std::string &name);

  FsPtr source_;
  FilePredicate pred_;
};

// A PredicateFs that searches the path for a regular expression. An invalid
// pattern throws std::regex_error from the constructor.
class RegexpFs : public PredicateFs {
public:
  RegexpFs(FsPtr source, const std::string &pattern);

  std::string name() const override;
};

} // namespace layerfs
