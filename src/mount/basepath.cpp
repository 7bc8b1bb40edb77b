// mount/basepath.cpp - Path confinement implementation
#include "basepath.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "../core/errors.hpp"

namespace layerfs {

// Maps a source path back into the confined namespace
static std::string strip_base(const std::string &path, const std::string &base) {
  if (base == "/" || !has_path_prefix(path, base)) {
    return path;
  }
  std::string rel = path.substr(base.size());
  return rel.empty() ? std::string(1, PATH_SEPARATOR) : rel;
}

// BasePathFile

BasePathFile::BasePathFile(FilePtr file, std::string base)
    : file_(std::move(file)), base_(std::move(base)) {}

std::string BasePathFile::name() const {
  return strip_base(file_->name(), base_);
}

size_t BasePathFile::read(void *buf, size_t len) {
  return file_->read(buf, len);
}

size_t BasePathFile::read_at(void *buf, size_t len, int64_t offset) {
  return file_->read_at(buf, len, offset);
}

size_t BasePathFile::write(const void *buf, size_t len) {
  return file_->write(buf, len);
}

size_t BasePathFile::write_at(const void *buf, size_t len, int64_t offset) {
  return file_->write_at(buf, len, offset);
}

int64_t BasePathFile::seek(int64_t offset, int whence) {
  return file_->seek(offset, whence);
}

void BasePathFile::truncate(int64_t size) { file_->truncate(size); }

void BasePathFile::sync() { file_->sync(); }

void BasePathFile::close() { file_->close(); }

FileInfo BasePathFile::stat() { return file_->stat(); }

std::optional<std::vector<FileInfo>> BasePathFile::read_dir(int count) {
  return file_->read_dir(count);
}

// BasePathFs

BasePathFs::BasePathFs(FsPtr source, const std::string &base)
    : source_(std::move(source)), base_(clean_path(base)) {}

std::string BasePathFs::name() const { return BASEPATHFS_NAME; }

std::string BasePathFs::real_path(const std::string &op,
                                  const std::string &name) const {
  std::string path = clean_path(base_ + PATH_SEPARATOR + name);
  if (!has_path_prefix(path, base_)) {
    throw_error(op, name, errc::not_found);
  }
  return path;
}

FilePtr BasePathFs::create(const std::string &name) {
  return std::make_unique<BasePathFile>(
      source_->create(real_path("create", name)), base_);
}

FilePtr BasePathFs::open(const std::string &name) {
  return std::make_unique<BasePathFile>(
      source_->open(real_path("open", name)), base_);
}

FilePtr BasePathFs::open_file(const std::string &name, int flags,
                              fs::perms perm) {
  return std::make_unique<BasePathFile>(
      source_->open_file(real_path("open", name), flags, perm), base_);
}

void BasePathFs::mkdir(const std::string &name, fs::perms perm) {
  source_->mkdir(real_path("mkdir", name), perm);
}

void BasePathFs::mkdir_all(const std::string &path, fs::perms perm) {
  source_->mkdir_all(real_path("mkdir_all", path), perm);
}

void BasePathFs::remove(const std::string &name) {
  source_->remove(real_path("remove", name));
}

void BasePathFs::remove_all(const std::string &path) {
  source_->remove_all(real_path("remove_all", path));
}

void BasePathFs::rename(const std::string &oldname,
                        const std::string &newname) {
  std::string from = real_path("rename", oldname);
  std::string to = real_path("rename", newname);
  source_->rename(from, to);
}

FileInfo BasePathFs::stat(const std::string &name) {
  return source_->stat(real_path("stat", name));
}

void BasePathFs::chmod(const std::string &name, fs::perms mode) {
  source_->chmod(real_path("chmod", name), mode);
}

void BasePathFs::chtimes(const std::string &name, TimePoint atime,
                         TimePoint mtime) {
  source_->chtimes(real_path("chtimes", name), atime, mtime);
}

std::pair<FileInfo, bool>
BasePathFs::lstat_if_possible(const std::string &name) {
  return layerfs::lstat_if_possible(*source_, real_path("lstat", name));
}

bool BasePathFs::symlink_if_possible(const std::string &oldname,
                                     const std::string &newname) {
  // Relative targets are kept as written so they resolve the same way on
  // both sides of the confinement
  std::string target = oldname;
  if (!oldname.empty() && oldname[0] == PATH_SEPARATOR) {
    target = real_path("symlink", oldname);
  }
  return layerfs::symlink_if_possible(*source_, target,
                                      real_path("symlink", newname));
}

std::optional<std::string>
BasePathFs::readlink_if_possible(const std::string &name) {
  auto target =
      layerfs::readlink_if_possible(*source_, real_path("readlink", name));
  if (!target) {
    return std::nullopt;
  }
  return strip_base(*target, base_);
}

// Root

std::unique_ptr<Root> Root::open_root(FsPtr source, const std::string &dir) {
  FileInfo info;
  try {
    info = source->stat(dir);
  } catch (const FsError &e) {
    LOG_DEBUG("Root: cannot open " + dir + ": " + e.what());
    throw FsError("open_root", dir, errc::invalid_argument);
  }
  if (!info.is_dir()) {
    throw_error("open_root", dir, errc::invalid_argument);
  }
  return std::make_unique<Root>(
      Token{}, std::make_unique<BasePathFs>(std::move(source), dir));
}

std::string Root::name() const { return fs_ ? fs_->base() : std::string(); }

BasePathFs &Root::check(const char *op, const std::string &name) const {
  if (!fs_) {
    throw_error(op, name, errc::invalid_argument);
  }
  if (!is_local_path(name)) {
    throw_error(op, name, errc::invalid_argument);
  }
  return *fs_;
}

std::unique_ptr<Root> Root::open_root(const std::string &name) {
  BasePathFs &base = check("open_root", name);
  return open_root(base.source(), join_path(base.base(), name));
}

void Root::close() {
  if (!fs_) {
    throw_error("close", "", errc::invalid_argument);
  }
  LOG_DEBUG("Root: closing " + fs_->base());
  fs_.reset();
}

FilePtr Root::create(const std::string &name) {
  return check("create", name).create(name);
}

FilePtr Root::open(const std::string &name) {
  return check("open", name).open(name);
}

FilePtr Root::open_file(const std::string &name, int flags, fs::perms perm) {
  return check("open", name).open_file(name, flags, perm);
}

void Root::mkdir(const std::string &name, fs::perms perm) {
  check("mkdir", name).mkdir(name, perm);
}

void Root::mkdir_all(const std::string &path, fs::perms perm) {
  check("mkdir_all", path).mkdir_all(path, perm);
}

void Root::remove(const std::string &name) {
  check("remove", name).remove(name);
}

void Root::remove_all(const std::string &path) {
  check("remove_all", path).remove_all(path);
}

void Root::rename(const std::string &oldname, const std::string &newname) {
  check("rename", oldname);
  check("rename", newname).rename(oldname, newname);
}

FileInfo Root::stat(const std::string &name) {
  return check("stat", name).stat(name);
}

FileInfo Root::lstat(const std::string &name) {
  return lstat_if_possible(name).first;
}

void Root::chmod(const std::string &name, fs::perms mode) {
  check("chmod", name).chmod(name, mode);
}

void Root::chtimes(const std::string &name, TimePoint atime,
                   TimePoint mtime) {
  check("chtimes", name).chtimes(name, atime, mtime);
}

std::pair<FileInfo, bool> Root::lstat_if_possible(const std::string &name) {
  return check("lstat", name).lstat_if_possible(name);
}

bool Root::symlink_if_possible(const std::string &oldname,
                               const std::string &newname) {
  return check("symlink", newname).symlink_if_possible(oldname, newname);
}

std::optional<std::string>
Root::readlink_if_possible(const std::string &name) {
  return check("readlink", name).readlink_if_possible(name);
}

} // namespace layerfs
