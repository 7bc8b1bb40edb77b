// core/memfs.hpp - Concurrent in-memory filesystem
#pragma once

#include "fs.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace layerfs {

// One entry of a MemFs. The store's flat path map owns every node; the
// children index of a directory only refers to them. type and link_target
// are fixed before the node is published.
struct FileData {
  mutable std::mutex mutex; // guards the fields that change
  std::string name;         // full normalized path
  FileType type = FileType::Regular;
  std::vector<char> data;
  std::string link_target;
  fs::perms mode = fs::perms::none;
  TimePoint mod_time;
  std::map<std::string, std::weak_ptr<FileData>> children; // by base name
};

FileInfo file_info(const FileData &node);

// Handle on a MemFs node. The cursor is private to the handle, the bytes
// are shared with every other handle on the same path. A single handle is
// not meant to be used from several threads at once.
class MemFile : public File {
public:
  MemFile(std::shared_ptr<FileData> data, bool readable, bool writable,
          bool append);

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
  void check_open(const char *op) const;
  size_t read_locked(void *buf, size_t len, int64_t offset);
  size_t write_locked(const void *buf, size_t len, int64_t offset);

  std::shared_ptr<FileData> data_;
  int64_t at_ = 0;
  int64_t read_dir_count_ = 0;
  bool closed_ = false;
  bool readable_;
  bool writable_;
  bool append_;
};

// Reference backend. All nodes live in one path map guarded by a single
// reader/writer lock: lookups take it shared, structural changes take it
// exclusive for their whole duration, so remove_all and rename are atomic
// to other threads. File contents are guarded by the node's own mutex.
class MemFs : public Fs, public Lstater, public Symlinker, public Readlinker {
public:
  MemFs();

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

  // Number of entries including the root, mostly useful in tests
  size_t size() const;

private:
  using NodePtr = std::shared_ptr<FileData>;

  NodePtr find_locked(const std::string &path) const;
  NodePtr make_dir_locked(const std::string &op, const std::string &path,
                          fs::perms perm);
  void register_with_parent_locked(const std::string &op,
                                   const NodePtr &node);
  void unregister_with_parent_locked(const std::string &path);
  // Expands symbolic links in path against the map, one component at a
  // time. The last component is only followed when follow_leaf is set.
  // Throws invalid_argument after SYMLINK_MAX_ITERATIONS expansions.
  std::string resolve_locked(const std::string &op, const std::string &name,
                             const std::string &path, bool follow_leaf) const;

  mutable std::shared_mutex mutex_;
  std::map<std::string, NodePtr> data_;
  std::atomic<size_t> symlink_count_{0};
};

} // namespace layerfs
