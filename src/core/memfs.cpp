// core/memfs.cpp - Concurrent in-memory filesystem implementation
#include "memfs.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <deque>
#include <unistd.h>

namespace layerfs {

static std::shared_ptr<FileData> make_node(const std::string &path,
                                           FileType type, fs::perms perm) {
  auto node = std::make_shared<FileData>();
  node->name = path;
  node->type = type;
  node->mode = perm & fs::perms::mask;
  node->mod_time = Clock::now();
  return node;
}

FileInfo file_info(const FileData &node) {
  std::lock_guard<std::mutex> lock(node.mutex);
  FileInfo info;
  info.name = base_name(node.name);
  info.type = node.type;
  info.perms = node.mode;
  info.mod_time = node.mod_time;
  switch (node.type) {
  case FileType::Regular:
    info.size = static_cast<int64_t>(node.data.size());
    break;
  case FileType::Symlink:
    info.size = static_cast<int64_t>(node.link_target.size());
    break;
  case FileType::Directory:
    info.size = 0;
    break;
  }
  return info;
}

// MemFile

MemFile::MemFile(std::shared_ptr<FileData> data, bool readable, bool writable,
                 bool append)
    : data_(std::move(data)), readable_(readable), writable_(writable),
      append_(append) {}

std::string MemFile::name() const {
  std::lock_guard<std::mutex> lock(data_->mutex);
  return data_->name;
}

void MemFile::check_open(const char *op) const {
  if (closed_) {
    throw_error(op, name(), errc::file_closed);
  }
}

size_t MemFile::read_locked(void *buf, size_t len, int64_t offset) {
  if (data_->type == FileType::Directory) {
    throw_error("read", data_->name, errc::is_a_directory);
  }
  auto size = static_cast<int64_t>(data_->data.size());
  if (offset >= size || len == 0) {
    return 0;
  }
  size_t n = std::min<size_t>(len, static_cast<size_t>(size - offset));
  std::memcpy(buf, data_->data.data() + offset, n);
  return n;
}

size_t MemFile::read(void *buf, size_t len) {
  check_open("read");
  if (!readable_) {
    throw_error("read", name(), errc::permission_denied);
  }
  std::lock_guard<std::mutex> lock(data_->mutex);
  size_t n = read_locked(buf, len, at_);
  at_ += static_cast<int64_t>(n);
  return n;
}

size_t MemFile::read_at(void *buf, size_t len, int64_t offset) {
  check_open("read_at");
  if (!readable_) {
    throw_error("read_at", name(), errc::permission_denied);
  }
  if (offset < 0) {
    throw_error("read_at", name(), errc::invalid_argument);
  }
  std::lock_guard<std::mutex> lock(data_->mutex);
  return read_locked(buf, len, offset);
}

size_t MemFile::write_locked(const void *buf, size_t len, int64_t offset) {
  if (data_->type == FileType::Directory) {
    throw_error("write", data_->name, errc::is_a_directory);
  }
  auto &bytes = data_->data;
  auto end = static_cast<size_t>(offset) + len;
  // Writing past the end leaves a zero filled gap
  if (end > bytes.size()) {
    bytes.resize(end, 0);
  }
  if (len > 0) {
    std::memcpy(bytes.data() + offset, buf, len);
  }
  data_->mod_time = Clock::now();
  return len;
}

size_t MemFile::write(const void *buf, size_t len) {
  check_open("write");
  if (!writable_) {
    throw_error("write", name(), errc::permission_denied);
  }
  std::lock_guard<std::mutex> lock(data_->mutex);
  int64_t offset = append_ ? static_cast<int64_t>(data_->data.size()) : at_;
  size_t n = write_locked(buf, len, offset);
  at_ = offset + static_cast<int64_t>(n);
  return n;
}

size_t MemFile::write_at(const void *buf, size_t len, int64_t offset) {
  check_open("write_at");
  if (!writable_) {
    throw_error("write_at", name(), errc::permission_denied);
  }
  if (append_ || offset < 0) {
    throw_error("write_at", name(), errc::invalid_argument);
  }
  std::lock_guard<std::mutex> lock(data_->mutex);
  return write_locked(buf, len, offset);
}

int64_t MemFile::seek(int64_t offset, int whence) {
  check_open("seek");
  int64_t next = 0;
  switch (whence) {
  case SEEK_SET:
    next = offset;
    break;
  case SEEK_CUR:
    next = at_ + offset;
    break;
  case SEEK_END: {
    std::lock_guard<std::mutex> lock(data_->mutex);
    next = static_cast<int64_t>(data_->data.size()) + offset;
    break;
  }
  default:
    throw_error("seek", name(), errc::invalid_argument);
  }
  if (next < 0) {
    throw_error("seek", name(), errc::invalid_argument);
  }
  at_ = next;
  return at_;
}

void MemFile::truncate(int64_t size) {
  check_open("truncate");
  if (!writable_) {
    throw_error("truncate", name(), errc::permission_denied);
  }
  if (size < 0) {
    throw_error("truncate", name(), errc::out_of_range);
  }
  std::lock_guard<std::mutex> lock(data_->mutex);
  if (data_->type == FileType::Directory) {
    throw_error("truncate", data_->name, errc::is_a_directory);
  }
  data_->data.resize(static_cast<size_t>(size), 0);
  data_->mod_time = Clock::now();
}

void MemFile::sync() { check_open("sync"); }

void MemFile::close() { closed_ = true; }

FileInfo MemFile::stat() {
  check_open("stat");
  return file_info(*data_);
}

std::optional<std::vector<FileInfo>> MemFile::read_dir(int count) {
  check_open("readdir");

  std::vector<std::shared_ptr<FileData>> members;
  {
    std::lock_guard<std::mutex> lock(data_->mutex);
    if (data_->type != FileType::Directory) {
      throw_error("readdir", data_->name, errc::not_a_directory);
    }
    for (const auto &[child_name, weak] : data_->children) {
      if (auto child = weak.lock()) {
        members.push_back(std::move(child));
      }
    }
  }

  size_t start = std::min<size_t>(static_cast<size_t>(read_dir_count_),
                                  members.size());
  size_t remaining = members.size() - start;
  size_t out_len = remaining;

  if (count > 0) {
    if (remaining == 0) {
      return std::nullopt;
    }
    out_len = std::min<size_t>(remaining, static_cast<size_t>(count));
  }
  read_dir_count_ += static_cast<int64_t>(out_len);

  std::vector<FileInfo> out;
  out.reserve(out_len);
  for (size_t i = start; i < start + out_len; ++i) {
    out.push_back(file_info(*members[i]));
  }
  return out;
}

// MemFs

MemFs::MemFs() {
  data_["/"] = make_node("/", FileType::Directory, DEFAULT_DIR_PERMS);
}

std::string MemFs::name() const { return MEMFS_NAME; }

size_t MemFs::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return data_.size();
}

MemFs::NodePtr MemFs::find_locked(const std::string &path) const {
  auto it = data_.find(path);
  if (it == data_.end()) {
    return nullptr;
  }
  return it->second;
}

void MemFs::register_with_parent_locked(const std::string &op,
                                        const NodePtr &node) {
  if (node->name == "/") {
    return;
  }
  // Missing parents are materialized, mkdir_all style
  NodePtr parent = make_dir_locked(op, parent_path(node->name),
                                   DEFAULT_DIR_PERMS);
  std::lock_guard<std::mutex> lock(parent->mutex);
  parent->children[base_name(node->name)] = node;
}

void MemFs::unregister_with_parent_locked(const std::string &path) {
  NodePtr parent = find_locked(parent_path(path));
  if (!parent) {
    LOG_WARN("MemFs: parent of " + path + " is missing");
    return;
  }
  std::lock_guard<std::mutex> lock(parent->mutex);
  parent->children.erase(base_name(path));
}

MemFs::NodePtr MemFs::make_dir_locked(const std::string &op,
                                      const std::string &path,
                                      fs::perms perm) {
  if (NodePtr existing = find_locked(path)) {
    if (existing->type != FileType::Directory) {
      throw_error(op, path, errc::not_a_directory);
    }
    return existing;
  }
  NodePtr node = make_node(path, FileType::Directory, perm);
  register_with_parent_locked(op, node);
  data_[path] = node;
  return node;
}

std::string MemFs::resolve_locked(const std::string &op,
                                  const std::string &name,
                                  const std::string &path,
                                  bool follow_leaf) const {
  if (symlink_count_.load() == 0) {
    return path;
  }

  auto parts = split_path(path);
  std::deque<std::string> pending(parts.begin(), parts.end());
  std::string resolved(1, PATH_SEPARATOR);
  int expansions = 0;

  while (!pending.empty()) {
    std::string part = std::move(pending.front());
    pending.pop_front();
    if (part == ".") {
      continue;
    }
    if (part == "..") {
      resolved = parent_path(resolved);
      continue;
    }

    std::string next = join_path(resolved, part);
    NodePtr node = find_locked(next);
    if (!node || node->type != FileType::Symlink ||
        (pending.empty() && !follow_leaf)) {
      resolved = next;
      continue;
    }

    if (++expansions > SYMLINK_MAX_ITERATIONS) {
      LOG_WARN("MemFs: symlink resolution of " + path + " exceeded " +
               std::to_string(SYMLINK_MAX_ITERATIONS) + " expansions");
      throw_error(op, name, errc::invalid_argument);
    }
    // The target replaces the link; relative targets continue from the
    // link's directory
    const std::string &target = node->link_target;
    if (!target.empty() && target[0] == PATH_SEPARATOR) {
      resolved = std::string(1, PATH_SEPARATOR);
    }
    auto target_parts = split_path(target);
    pending.insert(pending.begin(), target_parts.begin(), target_parts.end());
  }
  return resolved;
}

FilePtr MemFs::create(const std::string &name) {
  return open_file(name, O_RDWR | O_CREAT | O_TRUNC, DEFAULT_FILE_PERMS);
}

FilePtr MemFs::open(const std::string &name) {
  return open_file(name, O_RDONLY, fs::perms::none);
}

FilePtr MemFs::open_file(const std::string &name, int flags, fs::perms perm) {
  std::string path = normalize_path(name);
  int access = flags & O_ACCMODE;
  bool writable = access == O_WRONLY || access == O_RDWR;
  bool readable = access != O_WRONLY;
  bool exclusive = (flags & O_CREAT) && (flags & O_EXCL);
  bool created = false;

  // An exclusive create never follows a link in the last component, any
  // other open creates or opens the link's target.
  NodePtr node;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    node = find_locked(resolve_locked("open", name, path, !exclusive));
  }

  if (!node) {
    if (!(flags & O_CREAT)) {
      throw_error("open", name, errc::not_found);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string target = resolve_locked("open", name, path, !exclusive);
    node = find_locked(target);
    if (!node) {
      node = make_node(target, FileType::Regular, perm);
      register_with_parent_locked("open", node);
      data_[target] = node;
      created = true;
    } else if (exclusive) {
      throw_error("open", name, errc::already_exists);
    }
  } else if (exclusive) {
    throw_error("open", name, errc::already_exists);
  }

  if (node->type == FileType::Directory && writable) {
    throw_error("open", name, errc::is_a_directory);
  }

  if ((flags & O_TRUNC) && writable && !created) {
    std::lock_guard<std::mutex> lock(node->mutex);
    node->data.clear();
    node->mod_time = Clock::now();
  }

  auto file = std::make_unique<MemFile>(node, readable, writable,
                                        (flags & O_APPEND) != 0);
  if (flags & O_APPEND) {
    file->seek(0, SEEK_END);
  }
  return file;
}

void MemFs::mkdir(const std::string &name, fs::perms perm) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string path = resolve_locked("mkdir", name, normalize_path(name), false);
  if (NodePtr existing = find_locked(path)) {
    if (existing->type == FileType::Directory) {
      return;
    }
    throw_error("mkdir", name, errc::already_exists);
  }
  make_dir_locked("mkdir", path, perm);
}

void MemFs::mkdir_all(const std::string &name, fs::perms perm) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto parts =
      split_path(resolve_locked("mkdir_all", name, normalize_path(name), true));
  for (size_t i = 1; i <= parts.size(); ++i) {
    make_dir_locked("mkdir_all", join_segments(parts, 0, i), perm);
  }
}

void MemFs::remove(const std::string &name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string path = resolve_locked("remove", name, normalize_path(name), false);
  if (path == "/") {
    throw_error("remove", name, errc::permission_denied);
  }

  NodePtr node = find_locked(path);
  if (!node) {
    throw_error("remove", name, errc::not_found);
  }
  {
    std::lock_guard<std::mutex> node_lock(node->mutex);
    if (node->type == FileType::Directory && !node->children.empty()) {
      throw_error("remove", name, errc::directory_not_empty);
    }
    if (node->type == FileType::Symlink) {
      --symlink_count_;
    }
  }
  unregister_with_parent_locked(path);
  data_.erase(path);
}

void MemFs::remove_all(const std::string &name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string path =
      resolve_locked("remove_all", name, normalize_path(name), false);

  if (path != "/") {
    if (!find_locked(path)) {
      return;
    }
    unregister_with_parent_locked(path);
  }

  auto drop = [this](const NodePtr &node) {
    std::lock_guard<std::mutex> node_lock(node->mutex);
    node->children.clear();
    if (node->type == FileType::Symlink) {
      --symlink_count_;
    }
  };

  // The root itself is never deleted, only emptied
  if (path == "/") {
    drop(data_["/"]);
  } else {
    drop(data_[path]);
    data_.erase(path);
  }

  std::string prefix = path == "/" ? path : path + PATH_SEPARATOR;
  auto it = data_.lower_bound(prefix);
  size_t removed = 0;
  while (it != data_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
    if (it->first == "/") {
      ++it;
      continue;
    }
    drop(it->second);
    it = data_.erase(it);
    ++removed;
  }
  LOG_DEBUG("MemFs: remove_all " + path + " dropped " +
            std::to_string(removed) + " descendants");
}

void MemFs::rename(const std::string &oldname, const std::string &newname) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string from =
      resolve_locked("rename", oldname, normalize_path(oldname), false);
  std::string to =
      resolve_locked("rename", newname, normalize_path(newname), false);
  if (from == to) {
    return;
  }
  if (from == "/" || to == "/" || has_path_prefix(to, from)) {
    throw FsError("rename", oldname, newname, errc::invalid_argument);
  }

  NodePtr node = find_locked(from);
  if (!node) {
    throw FsError("rename", oldname, newname, errc::not_found);
  }
  if (find_locked(to)) {
    throw FsError("rename", oldname, newname, errc::already_exists);
  }

  // Create the destination directory first so nothing is moved when it
  // cannot exist.
  NodePtr parent = make_dir_locked("rename", parent_path(to), DEFAULT_DIR_PERMS);

  std::vector<std::pair<std::string, NodePtr>> moved;
  moved.emplace_back(from, node);
  std::string prefix = from + PATH_SEPARATOR;
  for (auto it = data_.lower_bound(prefix);
       it != data_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it) {
    moved.emplace_back(it->first, it->second);
  }

  unregister_with_parent_locked(from);
  for (auto &[old_path, moved_node] : moved) {
    std::string new_path = to + old_path.substr(from.size());
    {
      std::lock_guard<std::mutex> node_lock(moved_node->mutex);
      moved_node->name = new_path;
    }
    data_.erase(old_path);
    data_[new_path] = moved_node;
  }

  std::lock_guard<std::mutex> parent_lock(parent->mutex);
  parent->children[base_name(to)] = node;
}

FileInfo MemFs::stat(const std::string &name) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  NodePtr node =
      find_locked(resolve_locked("stat", name, normalize_path(name), true));
  if (!node) {
    throw_error("stat", name, errc::not_found);
  }
  return file_info(*node);
}

void MemFs::chmod(const std::string &name, fs::perms mode) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  NodePtr node =
      find_locked(resolve_locked("chmod", name, normalize_path(name), true));
  if (!node) {
    throw_error("chmod", name, errc::not_found);
  }
  std::lock_guard<std::mutex> node_lock(node->mutex);
  node->mode = mode & fs::perms::mask;
}

void MemFs::chtimes(const std::string &name, TimePoint atime,
                    TimePoint mtime) {
  (void)atime; // only modification times are tracked
  std::shared_lock<std::shared_mutex> lock(mutex_);
  NodePtr node =
      find_locked(resolve_locked("chtimes", name, normalize_path(name), true));
  if (!node) {
    throw_error("chtimes", name, errc::not_found);
  }
  std::lock_guard<std::mutex> node_lock(node->mutex);
  node->mod_time = mtime;
}

std::pair<FileInfo, bool> MemFs::lstat_if_possible(const std::string &name) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  NodePtr node =
      find_locked(resolve_locked("lstat", name, normalize_path(name), false));
  if (!node) {
    throw_error("lstat", name, errc::not_found);
  }
  return {file_info(*node), true};
}

bool MemFs::symlink_if_possible(const std::string &oldname,
                                const std::string &newname) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string path =
      resolve_locked("symlink", newname, normalize_path(newname), false);
  if (find_locked(path)) {
    throw FsError("symlink", oldname, newname, errc::already_exists);
  }
  NodePtr node = make_node(path, FileType::Symlink, fs::perms::all);
  node->link_target = oldname;
  register_with_parent_locked("symlink", node);
  data_[path] = node;
  ++symlink_count_;
  return true;
}

std::optional<std::string>
MemFs::readlink_if_possible(const std::string &name) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  NodePtr node =
      find_locked(resolve_locked("readlink", name, normalize_path(name), false));
  if (!node) {
    throw_error("readlink", name, errc::not_found);
  }
  std::lock_guard<std::mutex> node_lock(node->mutex);
  if (node->type != FileType::Symlink) {
    throw_error("readlink", name, errc::invalid_argument);
  }
  return node->link_target;
}

} // namespace layerfs
