// mount/overlay.cpp - Copy-on-write overlay implementation
#include "overlay.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "../core/errors.hpp"
#include <algorithm>
#include <map>

namespace layerfs {

// Errors that mean "no such entry on this side of the overlay"
static bool is_absent(const FsError &e) {
  return is_not_found(e) || is_error(e, errc::not_a_directory);
}

static std::optional<FileInfo> try_stat(Fs &fsys, const std::string &name) {
  try {
    return fsys.stat(name);
  } catch (const FsError &e) {
    if (is_absent(e)) {
      return std::nullopt;
    }
    throw;
  }
}

// UnionFile

UnionFile::UnionFile(FilePtr base, FilePtr layer)
    : base_(std::move(base)), layer_(std::move(layer)) {}

std::string UnionFile::name() const { return layer_->name(); }

size_t UnionFile::read(void *buf, size_t len) { return layer_->read(buf, len); }

size_t UnionFile::read_at(void *buf, size_t len, int64_t offset) {
  return layer_->read_at(buf, len, offset);
}

size_t UnionFile::write(const void *buf, size_t len) {
  return layer_->write(buf, len);
}

size_t UnionFile::write_at(const void *buf, size_t len, int64_t offset) {
  return layer_->write_at(buf, len, offset);
}

int64_t UnionFile::seek(int64_t offset, int whence) {
  return layer_->seek(offset, whence);
}

void UnionFile::truncate(int64_t size) { layer_->truncate(size); }

void UnionFile::sync() { layer_->sync(); }

void UnionFile::close() {
  layer_->close();
  if (base_) {
    base_->close();
  }
}

FileInfo UnionFile::stat() { return layer_->stat(); }

std::optional<std::vector<FileInfo>> UnionFile::read_dir(int count) {
  if (!merged_) {
    std::map<std::string, FileInfo> entries;
    if (auto layer_entries = layer_->read_dir(-1)) {
      for (auto &info : *layer_entries) {
        entries.emplace(info.name, std::move(info));
      }
    }
    if (base_) {
      if (auto base_entries = base_->read_dir(-1)) {
        for (auto &info : *base_entries) {
          // emplace keeps the layer entry on a name clash
          entries.emplace(info.name, std::move(info));
        }
      }
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

// CopyOnWriteFs

CopyOnWriteFs::CopyOnWriteFs(FsPtr base, FsPtr layer)
    : base_(std::move(base)), layer_(std::move(layer)) {}

std::string CopyOnWriteFs::name() const { return COPY_ON_WRITE_NAME; }

bool CopyOnWriteFs::is_base_file(const std::string &name) {
  if (try_stat(*layer_, name)) {
    return false;
  }
  return try_stat(*base_, name).has_value();
}

void CopyOnWriteFs::copy_to_layer(const std::string &name) {
  FileInfo info = base_->stat(name);

  if (info.is_dir()) {
    layer_->mkdir_all(name, info.perms);
    layer_->chmod(name, info.perms);
    layer_->chtimes(name, info.mod_time, info.mod_time);
    LOG_DEBUG("CopyOnWriteFs: copied up directory " + name);
    return;
  }

  std::string parent = parent_path(name);
  if (!try_stat(*layer_, parent)) {
    auto parent_info = try_stat(*base_, parent);
    layer_->mkdir_all(parent,
                      parent_info ? parent_info->perms : DEFAULT_DIR_PERMS);
  }

  FilePtr in = base_->open(name);
  FilePtr out =
      layer_->open_file(name, O_WRONLY | O_CREAT | O_TRUNC, info.perms);
  try {
    std::vector<char> buf(COPY_BUFFER_SIZE);
    int64_t copied = 0;
    for (;;) {
      size_t n = in->read(buf.data(), buf.size());
      if (n == 0) {
        break;
      }
      out->write(buf.data(), n);
      copied += static_cast<int64_t>(n);
    }
    if (copied != info.size) {
      LOG_WARN("CopyOnWriteFs: " + name + " changed during copy-up");
      throw_error("copy_up", name, errc::invalid_argument);
    }
  } catch (const FsError &) {
    out->close();
    in->close();
    layer_->remove(name);
    throw;
  }
  out->close();
  in->close();

  layer_->chmod(name, info.perms);
  layer_->chtimes(name, info.mod_time, info.mod_time);
  LOG_DEBUG("CopyOnWriteFs: copied up " + name + " (" +
            std::to_string(info.size) + " bytes)");
}

// Makes sure a new entry can be created in the layer: a parent directory
// that only base has is created in the layer first
void CopyOnWriteFs::prepare_parent(const std::string &op,
                                   const std::string &name) {
  std::string dir = parent_path(name);

  auto base_dir = try_stat(*base_, dir);
  if (base_dir && base_dir->is_dir()) {
    if (!try_stat(*layer_, dir)) {
      layer_->mkdir_all(dir, base_dir->perms);
    }
    return;
  }

  auto layer_dir = try_stat(*layer_, dir);
  if (layer_dir && layer_dir->is_dir()) {
    return;
  }
  if (base_dir || layer_dir) {
    throw_error(op, name, errc::not_a_directory);
  }
  throw_error(op, name, errc::not_found);
}

FilePtr CopyOnWriteFs::create(const std::string &name) {
  return open_file(name, O_RDWR | O_CREAT | O_TRUNC, DEFAULT_FILE_PERMS);
}

FilePtr CopyOnWriteFs::open(const std::string &name) {
  if (is_base_file(name)) {
    return base_->open(name);
  }

  auto layer_info = try_stat(*layer_, name);
  if (!layer_info || !layer_info->is_dir()) {
    return layer_->open(name);
  }

  FilePtr base_dir;
  auto base_info = try_stat(*base_, name);
  if (base_info && base_info->is_dir()) {
    base_dir = base_->open(name);
  }
  FilePtr layer_dir = layer_->open(name);
  if (!base_dir) {
    return layer_dir;
  }
  return std::make_unique<UnionFile>(std::move(base_dir),
                                     std::move(layer_dir));
}

FilePtr CopyOnWriteFs::open_file(const std::string &name, int flags,
                                 fs::perms perm) {
  if (!is_write_flags(flags)) {
    return open(name);
  }

  if (is_base_file(name)) {
    copy_to_layer(name);
    return layer_->open_file(name, flags, perm);
  }
  if (try_stat(*layer_, name)) {
    return layer_->open_file(name, flags, perm);
  }

  prepare_parent("open", name);
  return layer_->open_file(name, flags, perm);
}

void CopyOnWriteFs::mkdir(const std::string &name, fs::perms perm) {
  auto info = try_stat(*base_, name);
  if (info && info->is_dir()) {
    throw_error("mkdir", name, errc::already_exists);
  }
  layer_->mkdir_all(name, perm);
}

void CopyOnWriteFs::mkdir_all(const std::string &path, fs::perms perm) {
  auto info = try_stat(*base_, path);
  if (info && info->is_dir()) {
    return;
  }
  layer_->mkdir_all(path, perm);
}

void CopyOnWriteFs::remove(const std::string &name) {
  if (is_base_file(name)) {
    throw_error("remove", name, errc::permission_denied);
  }
  layer_->remove(name);
}

void CopyOnWriteFs::remove_all(const std::string &path) {
  if (is_base_file(path)) {
    throw_error("remove_all", path, errc::permission_denied);
  }
  layer_->remove_all(path);
}

void CopyOnWriteFs::rename(const std::string &oldname,
                           const std::string &newname) {
  if (is_base_file(oldname)) {
    throw FsError("rename", oldname, newname, errc::permission_denied);
  }
  layer_->rename(oldname, newname);
}

FileInfo CopyOnWriteFs::stat(const std::string &name) {
  if (auto info = try_stat(*layer_, name)) {
    return *info;
  }
  return base_->stat(name);
}

void CopyOnWriteFs::chmod(const std::string &name, fs::perms mode) {
  if (is_base_file(name)) {
    copy_to_layer(name);
  }
  layer_->chmod(name, mode);
}

void CopyOnWriteFs::chtimes(const std::string &name, TimePoint atime,
                            TimePoint mtime) {
  if (is_base_file(name)) {
    copy_to_layer(name);
  }
  layer_->chtimes(name, atime, mtime);
}

std::pair<FileInfo, bool>
CopyOnWriteFs::lstat_if_possible(const std::string &name) {
  try {
    return layerfs::lstat_if_possible(*layer_, name);
  } catch (const FsError &e) {
    if (!is_absent(e)) {
      throw;
    }
  }
  return layerfs::lstat_if_possible(*base_, name);
}

bool CopyOnWriteFs::symlink_if_possible(const std::string &oldname,
                                        const std::string &newname) {
  if (!dynamic_cast<Symlinker *>(layer_.get())) {
    return false;
  }
  prepare_parent("symlink", newname);
  return layerfs::symlink_if_possible(*layer_, oldname, newname);
}

std::optional<std::string>
CopyOnWriteFs::readlink_if_possible(const std::string &name) {
  try {
    return layerfs::readlink_if_possible(*layer_, name);
  } catch (const FsError &e) {
    if (!is_absent(e)) {
      throw;
    }
  }
  return layerfs::readlink_if_possible(*base_, name);
}

} // namespace layerfs
