// mount/mountfs.hpp - Mount namespace routing paths to backends
#pragma once

#include "../core/fs.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace layerfs {

struct MountOptions {
  // Mount over an existing file or directory of the enclosing backend
  bool allow_masking = false;
  // Mount a backend below another mount of the same instance
  bool allow_recursive_mount = false;
};

// One node of the mount tree. Nodes live in an arena and refer to each
// other by index; index 0 is the root.
struct MountNode {
  std::string name; // path segment, empty for the root
  FsPtr fs;         // attached backend, only set on mount points
  int parent = -1;
  std::map<std::string, int> children;
  int mounted_nodes = 0; // mount points below this node
  TimePoint mod_time;
  int depth = 0;
};

struct MountInfo {
  std::string path;
  std::string fs_name;
};

// Result of routing a namespace path
struct Route {
  FsPtr fs;
  int node;         // node the backend is attached to
  std::string base; // namespace path of that mount point
  std::string rel;  // path inside the backend, always absolute
};

// Directory handle of a mount namespace. Lists the backend's entries plus
// the mount points directly below, which take precedence on name clashes.
// The list of mount points is taken when the handle is opened.
class MountFile : public File {
public:
  MountFile(FilePtr file, std::string name, std::optional<FileInfo> self,
            std::vector<FileInfo> mounts);

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
  File &backing(const char *op);

  FilePtr file_; // null for a mount placeholder with no directory behind it
  std::string name_;
  std::optional<FileInfo> self_;
  std::vector<FileInfo> mounts_;
  std::optional<std::vector<FileInfo>> merged_;
  size_t read_dir_pos_ = 0;
  bool closed_ = false;
};

// Serves different parts of one namespace from different backends. A path
// is handled by the innermost mount point above it, with the path made
// relative to that mount point.
//
// mount, umount and remount are not synchronized: they must not race with
// each other or with any other call. Routed operations are as thread safe
// as the backends they reach.
class MountFs : public Fs, public Lstater, public Symlinker, public Readlinker {
public:
  explicit MountFs(FsPtr root, MountOptions options = {});

  std::string name() const override;
  const MountOptions &options() const { return options_; }

  // An OsFs must be wrapped in a BasePathFs before it can be mounted
  void mount(const std::string &path, FsPtr fs);
  void umount(const std::string &path);
  void remount(const std::string &path, FsPtr fs);
  // Every mount point including the root, in path order
  std::vector<MountInfo> mounts() const;

  // Node index of path in the mount tree, -1 when path is not part of it
  int find_node(const std::string &path) const;
  Route find_path(const std::string &path) const;

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
  // Link targets are stored as given and read back unchanged, so absolute
  // targets are resolved in this namespace by eval_symlinks.
  bool symlink_if_possible(const std::string &oldname,
                           const std::string &newname) override;
  std::optional<std::string>
  readlink_if_possible(const std::string &name) override;

private:
  int alloc_node(const std::string &name, int parent);
  void free_node(int idx);
  std::string full_name(int idx) const;
  FileInfo mounted_dir_info(int idx) const;
  std::vector<FileInfo> child_mount_infos(int idx) const;
  bool really_exists(const std::string &name);
  void depart_walk(const std::string &path, const FileInfo &info);

  std::vector<MountNode> nodes_;
  std::vector<int> free_;
  MountOptions options_;
};

} // namespace layerfs
