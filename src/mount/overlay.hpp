// mount/overlay.hpp - Copy-on-write overlay of two backends
#pragma once

#include "../core/fs.hpp"
#include <optional>
#include <string>
#include <vector>

namespace layerfs {

// Directory handle merging a base and a layer listing. Entries of the layer
// hide base entries of the same name. Everything except read_dir goes to
// the layer handle.
class UnionFile : public File {
public:
  UnionFile(FilePtr base, FilePtr layer);

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
  FilePtr base_;
  FilePtr layer_;
  std::optional<std::vector<FileInfo>> merged_;
  size_t read_dir_pos_ = 0;
};

// Read-only base with a writable layer on top. Anything that changes an
// entry present only in base (write-mode open, chmod, chtimes) first copies
// it up: content, permission bits and modification time.
//
// There are no whiteouts. An entry is shadowed only while the layer holds
// it, so removing a copied-up entry brings the base version back, and
// entries living only in base cannot be removed or renamed at all
// (permission_denied).
class CopyOnWriteFs : public Fs,
                      public Lstater,
                      public Symlinker,
                      public Readlinker {
public:
  CopyOnWriteFs(FsPtr base, FsPtr layer);

  std::string name() const override;
  const FsPtr &base() const { return base_; }
  const FsPtr &layer() const { return layer_; }

  // True when name exists in base but not in the layer
  bool is_base_file(const std::string &name);

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
  void copy_to_layer(const std::string &name);
  void prepare_parent(const std::string &op, const std::string &name);

  FsPtr base_;
  FsPtr layer_;
};

} // namespace layerfs
