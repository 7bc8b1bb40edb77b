// mount/mountfs.cpp - Mount namespace implementation
#include "mountfs.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "../core/errors.hpp"
#include "../core/memfs.hpp"
#include "../core/osfs.hpp"
#include <algorithm>

namespace layerfs {

// Reports backend errors under the namespace path the caller used
template <typename Fn>
static auto at_path(const std::string &name, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const FsError &e) {
    throw FsError(e.op(), name, e.code());
  }
}

// MountFile

MountFile::MountFile(FilePtr file, std::string name,
                     std::optional<FileInfo> self,
                     std::vector<FileInfo> mounts)
    : file_(std::move(file)), name_(std::move(name)), self_(std::move(self)),
      mounts_(std::move(mounts)) {}

File &MountFile::backing(const char *op) {
  if (closed_) {
    throw_error(op, name_, errc::file_closed);
  }
  if (!file_) {
    throw_error(op, name_, errc::is_a_directory);
  }
  return *file_;
}

size_t MountFile::read(void *buf, size_t len) {
  return backing("read").read(buf, len);
}

size_t MountFile::read_at(void *buf, size_t len, int64_t offset) {
  return backing("read_at").read_at(buf, len, offset);
}

size_t MountFile::write(const void *buf, size_t len) {
  return backing("write").write(buf, len);
}

size_t MountFile::write_at(const void *buf, size_t len, int64_t offset) {
  return backing("write_at").write_at(buf, len, offset);
}

int64_t MountFile::seek(int64_t offset, int whence) {
  return backing("seek").seek(offset, whence);
}

void MountFile::truncate(int64_t size) { backing("truncate").truncate(size); }

void MountFile::sync() { backing("sync").sync(); }

void MountFile::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  if (file_) {
    file_->close();
  }
}

FileInfo MountFile::stat() {
  if (closed_) {
    throw_error("stat", name_, errc::file_closed);
  }
  if (self_) {
    return *self_;
  }
  return backing("stat").stat();
}

std::optional<std::vector<FileInfo>> MountFile::read_dir(int count) {
  if (closed_) {
    throw_error("readdir", name_, errc::file_closed);
  }

  if (!merged_) {
    std::map<std::string, FileInfo> entries;
    if (file_) {
      if (auto listed = file_->read_dir(-1)) {
        for (auto &info : *listed) {
          entries[info.name] = std::move(info);
        }
      }
    }
    for (const auto &info : mounts_) {
      entries[info.name] = info;
    }
    merged_.emplace();
    for (auto &[entry_name, info] : entries) {
      merged_->push_back(std::move(info));
    }
  }

  size_t remaining = merged_->size() - read_dir_pos_;
  size_t out_len = remaining;
  if (count > 0) {
    if (remaining == 0) {
      return std::nullopt;
    }
    out_len = std::min<size_t>(remaining, static_cast<size_t>(count));
  }

  std::vector<FileInfo> out(merged_->begin() + read_dir_pos_,
                            merged_->begin() + read_dir_pos_ + out_len);
  read_dir_pos_ += out_len;
  return out;
}

// MountFs

MountFs::MountFs(FsPtr root, MountOptions options) : options_(options) {
  if (!root) {
    root = std::make_shared<MemFs>();
  }
  MountNode node;
  node.fs = std::move(root);
  node.mod_time = Clock::now();
  nodes_.push_back(std::move(node));
}

std::string MountFs::name() const { return MOUNTFS_NAME; }

int MountFs::alloc_node(const std::string &name, int parent) {
  int idx;
  if (!free_.empty()) {
    idx = free_.back();
    free_.pop_back();
    nodes_[idx] = MountNode();
  } else {
    idx = static_cast<int>(nodes_.size());
    nodes_.emplace_back();
  }

  MountNode &node = nodes_[idx];
  node.name = name;
  node.parent = parent;
  node.depth = nodes_[parent].depth + 1;
  node.mod_time = Clock::now();
  nodes_[parent].children[name] = idx;
  return idx;
}

void MountFs::free_node(int idx) {
  MountNode &node = nodes_[idx];
  nodes_[node.parent].children.erase(node.name);
  node = MountNode();
  free_.push_back(idx);
}

std::string MountFs::full_name(int idx) const {
  std::vector<std::string> parts;
  for (int cur = idx; cur > 0; cur = nodes_[cur].parent) {
    parts.push_back(nodes_[cur].name);
  }
  std::reverse(parts.begin(), parts.end());
  return join_segments(parts, 0, parts.size());
}

int MountFs::find_node(const std::string &path) const {
  int cur = 0;
  for (const auto &part : split_path(normalize_path(path))) {
    auto it = nodes_[cur].children.find(part);
    if (it == nodes_[cur].children.end()) {
      return -1;
    }
    cur = it->second;
  }
  return cur;
}

Route MountFs::find_path(const std::string &path) const {
  auto parts = split_path(normalize_path(path));

  int out = 0;
  size_t out_depth = 0;
  int cur = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    auto it = nodes_[cur].children.find(parts[i]);
    if (it == nodes_[cur].children.end()) {
      break;
    }
    cur = it->second;
    if (nodes_[cur].fs) {
      out = cur;
      out_depth = i + 1;
    }
  }

  return {nodes_[out].fs, out, join_segments(parts, 0, out_depth),
          join_segments(parts, out_depth, parts.size())};
}

FileInfo MountFs::mounted_dir_info(int idx) const {
  const MountNode &node = nodes_[idx];
  FileInfo info;
  info.name = node.name;
  info.type = FileType::Directory;
  info.perms = MOUNT_NODE_PERMS;
  info.mod_time = node.mod_time;
  info.mount_point = true;
  if (node.fs) {
    // A mount point looks like the root of the backend mounted there
    FileInfo root = node.fs->stat("/");
    info.perms = root.perms;
    info.mod_time = root.mod_time;
  }
  return info;
}

std::vector<FileInfo> MountFs::child_mount_infos(int idx) const {
  std::vector<FileInfo> out;
  for (const auto &[child_name, child] : nodes_[idx].children) {
    out.push_back(mounted_dir_info(child));
  }
  return out;
}

void MountFs::mount(const std::string &path, FsPtr fs) {
  if (!fs) {
    throw_error("mount", path, errc::invalid_argument);
  }
  if (dynamic_cast<OsFs *>(fs.get())) {
    LOG_WARN("MountFs: refusing to mount unconfined " + fs->name() + " at " +
             path);
    throw_error("mount", path, errc::invalid_argument);
  }

  std::string clean = normalize_path(path);

  std::optional<FileInfo> existing;
  try {
    existing = stat(clean);
  } catch (const FsError &e) {
    if (!is_not_found(e)) {
      throw;
    }
  }
  if (existing && !existing->mount_point && !options_.allow_masking) {
    throw_error("mount", path, errc::already_exists);
  }

  auto parts = split_path(clean);
  if (nodes_[0].fs == fs && !options_.allow_recursive_mount) {
    throw_error("mount", path, errc::recursive_mount);
  }

  int cur = 0;
  size_t i = 0;
  for (; i < parts.size(); ++i) {
    auto it = nodes_[cur].children.find(parts[i]);
    if (it == nodes_[cur].children.end()) {
      break;
    }
    cur = it->second;
    if (nodes_[cur].fs == fs && !options_.allow_recursive_mount) {
      throw_error("mount", path, errc::recursive_mount);
    }
  }
  if (i == parts.size() && nodes_[cur].fs) {
    throw_error("mount", path, errc::already_mounted);
  }

  for (; i < parts.size(); ++i) {
    cur = alloc_node(parts[i], cur);
  }
  nodes_[cur].fs = std::move(fs);
  for (int p = nodes_[cur].parent; p >= 0; p = nodes_[p].parent) {
    ++nodes_[p].mounted_nodes;
  }

  LOG_DEBUG("MountFs: mounted " + nodes_[cur].fs->name() + " at " + clean);
}

void MountFs::umount(const std::string &path) {
  int idx = find_node(path);
  if (idx <= 0 || !nodes_[idx].fs) {
    throw_error("umount", path, errc::not_mounted);
  }

  std::string fs_name = nodes_[idx].fs->name();
  nodes_[idx].fs.reset();
  for (int p = nodes_[idx].parent; p >= 0; p = nodes_[p].parent) {
    --nodes_[p].mounted_nodes;
  }

  // Drop placeholders that no longer lead to any mount point
  int cur = idx;
  while (cur > 0 && !nodes_[cur].fs && nodes_[cur].mounted_nodes == 0) {
    int parent = nodes_[cur].parent;
    free_node(cur);
    cur = parent;
  }

  LOG_DEBUG("MountFs: unmounted " + fs_name + " from " + normalize_path(path));
}

void MountFs::remount(const std::string &path, FsPtr fs) {
  int idx = find_node(path);
  if (idx <= 0 || !nodes_[idx].fs) {
    throw_error("remount", path, errc::not_mounted);
  }
  if (!fs) {
    throw_error("remount", path, errc::invalid_argument);
  }
  if (dynamic_cast<OsFs *>(fs.get())) {
    throw_error("remount", path, errc::invalid_argument);
  }
  if (!options_.allow_recursive_mount) {
    for (int p = nodes_[idx].parent; p >= 0; p = nodes_[p].parent) {
      if (nodes_[p].fs == fs) {
        throw_error("remount", path, errc::recursive_mount);
      }
    }
  }

  LOG_DEBUG("MountFs: remounting " + normalize_path(path) + " from " +
            nodes_[idx].fs->name() + " to " + fs->name());
  nodes_[idx].fs = std::move(fs);
}

std::vector<MountInfo> MountFs::mounts() const {
  std::vector<MountInfo> out;
  std::vector<int> stack = {0};
  while (!stack.empty()) {
    int idx = stack.back();
    stack.pop_back();
    if (nodes_[idx].fs) {
      out.push_back({full_name(idx), nodes_[idx].fs->name()});
    }
    const auto &children = nodes_[idx].children;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back(it->second);
    }
  }
  return out;
}

bool MountFs::really_exists(const std::string &name) {
  try {
    return !stat(name).mount_point;
  } catch (const FsError &e) {
    if (is_not_found(e)) {
      return false;
    }
    throw;
  }
}

FilePtr MountFs::create(const std::string &name) {
  return open_file(name, O_RDWR | O_CREAT | O_TRUNC, DEFAULT_FILE_PERMS);
}

FilePtr MountFs::open(const std::string &name) {
  return open_file(name, O_RDONLY, fs::perms::none);
}

FilePtr MountFs::open_file(const std::string &name, int flags,
                           fs::perms perm) {
  std::string clean = normalize_path(name);
  Route route = find_path(clean);

  std::optional<FileInfo> info;
  try {
    info = route.fs->stat(route.rel);
  } catch (const FsError &e) {
    if (!is_not_found(e)) {
      throw FsError(e.op(), name, e.code());
    }
  }

  if (!info || info->is_dir()) {
    int idx = find_node(clean);
    if (idx >= 0) {
      FilePtr file;
      if (info) {
        file = at_path(name, [&] {
          return route.fs->open_file(route.rel, flags, perm);
        });
      } else if (is_write_flags(flags)) {
        throw_error("open", name, errc::is_a_directory);
      }
      std::optional<FileInfo> self;
      if (idx > 0) {
        self = mounted_dir_info(idx);
      }
      return std::make_unique<MountFile>(std::move(file), clean, self,
                                         child_mount_infos(idx));
    }
  }

  // Creating below a placeholder that has no directory behind it: create
  // the directories in the backend that owns the path
  if (flags & O_CREAT) {
    int parent = find_node(parent_path(clean));
    if (parent >= 0 && !nodes_[parent].fs) {
      at_path(name, [&] {
        route.fs->mkdir_all(parent_path(route.rel), DEFAULT_DIR_PERMS);
      });
    }
  }

  return at_path(name,
                 [&] { return route.fs->open_file(route.rel, flags, perm); });
}

void MountFs::mkdir(const std::string &name, fs::perms perm) {
  std::string clean = normalize_path(name);
  int idx = find_node(clean);
  if (idx < 0) {
    Route route = find_path(clean);
    at_path(name, [&] { route.fs->mkdir(route.rel, perm); });
    return;
  }

  if (really_exists(clean)) {
    return;
  }

  // Back the mount tree node with a real directory in the enclosing backend
  int owner = nodes_[idx].parent;
  while (owner >= 0 && !nodes_[owner].fs) {
    owner = nodes_[owner].parent;
  }
  if (owner < 0) {
    throw_error("mkdir", name, errc::not_found);
  }
  auto parts = split_path(clean);
  std::string rel =
      join_segments(parts, static_cast<size_t>(nodes_[owner].depth),
                    parts.size());
  at_path(name, [&] { nodes_[owner].fs->mkdir(rel, perm); });
}

void MountFs::mkdir_all(const std::string &path, fs::perms perm) {
  auto parts = split_path(normalize_path(path));
  for (size_t i = 0; i <= parts.size(); ++i) {
    try {
      mkdir(join_segments(parts, 0, i), perm);
    } catch (const FsError &e) {
      if (!is_exist(e)) {
        throw;
      }
    }
  }
}

void MountFs::remove(const std::string &name) {
  int idx = find_node(name);
  if (idx >= 0 && nodes_[idx].fs) {
    // Mount points go away with umount only
    throw_error("remove", name, errc::permission_denied);
  }
  Route route = find_path(name);
  at_path(name, [&] { route.fs->remove(route.rel); });
}

void MountFs::depart_walk(const std::string &path, const FileInfo &info) {
  if (info.is_dir()) {
    std::vector<std::string> names;
    FilePtr dir = open(path);
    if (auto listed = dir->read_dir_names(-1)) {
      names = std::move(*listed);
    }
    dir->close();

    for (const auto &entry : names) {
      std::string child = join_path(path, entry);
      depart_walk(child, lstat_if_possible(child).first);
    }
  }

  if (info.mount_point) {
    return;
  }
  if (info.is_dir() && find_node(path) >= 0) {
    return;
  }
  remove(path);
}

void MountFs::remove_all(const std::string &path) {
  std::string clean = normalize_path(path);
  FileInfo info;
  try {
    info = lstat_if_possible(clean).first;
  } catch (const FsError &e) {
    if (is_not_found(e)) {
      return;
    }
    throw;
  }
  depart_walk(clean, info);
}

void MountFs::rename(const std::string &oldname, const std::string &newname) {
  Route from = find_path(oldname);
  Route to = find_path(newname);
  if (from.fs != to.fs) {
    throw FsError("rename", oldname, newname, errc::cross_backend);
  }
  try {
    from.fs->rename(from.rel, to.rel);
  } catch (const FsError &e) {
    throw FsError(e.op(), oldname, newname, e.code());
  }
}

FileInfo MountFs::stat(const std::string &name) {
  int idx = find_node(name);
  if (idx > 0) {
    return mounted_dir_info(idx);
  }
  Route route = find_path(name);
  return at_path(name, [&] { return route.fs->stat(route.rel); });
}

void MountFs::chmod(const std::string &name, fs::perms mode) {
  Route route = find_path(name);
  at_path(name, [&] { route.fs->chmod(route.rel, mode); });
}

void MountFs::chtimes(const std::string &name, TimePoint atime,
                      TimePoint mtime) {
  Route route = find_path(name);
  bool exists = true;
  try {
    route.fs->stat(route.rel);
  } catch (const FsError &e) {
    if (!is_not_found(e)) {
      throw FsError(e.op(), name, e.code());
    }
    exists = false;
  }

  if (exists) {
    at_path(name, [&] { route.fs->chtimes(route.rel, atime, mtime); });
    return;
  }

  int idx = find_node(name);
  if (idx < 0) {
    throw_error("chtimes", name, errc::not_found);
  }
  nodes_[idx].mod_time = mtime;
}

std::pair<FileInfo, bool>
MountFs::lstat_if_possible(const std::string &name) {
  int idx = find_node(name);
  if (idx > 0) {
    return {mounted_dir_info(idx), true};
  }
  Route route = find_path(name);
  return at_path(name, [&] {
    return layerfs::lstat_if_possible(*route.fs, route.rel);
  });
}

bool MountFs::symlink_if_possible(const std::string &oldname,
                                  const std::string &newname) {
  Route route = find_path(newname);
  try {
    return layerfs::symlink_if_possible(*route.fs, oldname, route.rel);
  } catch (const FsError &e) {
    throw FsError(e.op(), oldname, newname, e.code());
  }
}

std::optional<std::string>
MountFs::readlink_if_possible(const std::string &name) {
  int idx = find_node(name);
  if (idx > 0) {
    throw_error("readlink", name, errc::invalid_argument);
  }
  Route route = find_path(name);
  return at_path(name, [&] {
    return layerfs::readlink_if_possible(*route.fs, route.rel);
  });
}

} // namespace layerfs
