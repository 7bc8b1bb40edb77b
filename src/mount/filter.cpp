// mount/filter.cpp - Read-only and name filtering wrappers implementation
#include "filter.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "../core/errors.hpp"

namespace layerfs {

// ReadOnlyFs

ReadOnlyFs::ReadOnlyFs(FsPtr source) : source_(std::move(source)) {}

std::string ReadOnlyFs::name() const { return READONLYFS_NAME; }

FilePtr ReadOnlyFs::create(const std::string &name) {
  throw_error("create", name, errc::permission_denied);
}

FilePtr ReadOnlyFs::open(const std::string &name) {
  return source_->open(name);
}

FilePtr ReadOnlyFs::open_file(const std::string &name, int flags,
                              fs::perms perm) {
  if (is_write_flags(flags)) {
    throw_error("open", name, errc::permission_denied);
  }
  return source_->open_file(name, flags, perm);
}

void ReadOnlyFs::mkdir(const std::string &name, fs::perms) {
  throw_error("mkdir", name, errc::permission_denied);
}

void ReadOnlyFs::mkdir_all(const std::string &path, fs::perms) {
  throw_error("mkdir_all", path, errc::permission_denied);
}

void ReadOnlyFs::remove(const std::string &name) {
  throw_error("remove", name, errc::permission_denied);
}

void ReadOnlyFs::remove_all(const std::string &path) {
  throw_error("remove_all", path, errc::permission_denied);
}

void ReadOnlyFs::rename(const std::string &oldname,
                        const std::string &newname) {
  throw FsError("rename", oldname, newname, errc::permission_denied);
}

FileInfo ReadOnlyFs::stat(const std::string &name) {
  return source_->stat(name);
}

void ReadOnlyFs::chmod(const std::string &name, fs::perms) {
  throw_error("chmod", name, errc::permission_denied);
}

void ReadOnlyFs::chtimes(const std::string &name, TimePoint, TimePoint) {
  throw_error("chtimes", name, errc::permission_denied);
}

std::pair<FileInfo, bool>
ReadOnlyFs::lstat_if_possible(const std::string &name) {
  return layerfs::lstat_if_possible(*source_, name);
}

std::optional<std::string>
ReadOnlyFs::readlink_if_possible(const std::string &name) {
  return layerfs::readlink_if_possible(*source_, name);
}

// PredicateFile

PredicateFile::PredicateFile(FilePtr file, std::string path, FilePredicate pred)
    : file_(std::move(file)), path_(std::move(path)), pred_(std::move(pred)) {}

size_t PredicateFile::read(void *buf, size_t len) {
  return file_->read(buf, len);
}

size_t PredicateFile::read_at(void *buf, size_t len, int64_t offset) {
  return file_->read_at(buf, len, offset);
}

size_t PredicateFile::write(const void *buf, size_t len) {
  return file_->write(buf, len);
}

size_t PredicateFile::write_at(const void *buf, size_t len, int64_t offset) {
  return file_->write_at(buf, len, offset);
}

int64_t PredicateFile::seek(int64_t offset, int whence) {
  return file_->seek(offset, whence);
}

void PredicateFile::truncate(int64_t size) { file_->truncate(size); }

void PredicateFile::sync() { file_->sync(); }

void PredicateFile::close() { file_->close(); }

FileInfo PredicateFile::stat() { return file_->stat(); }

std::optional<std::vector<FileInfo>> PredicateFile::read_dir(int count) {
  // Keep asking until something survives the filter, an empty batch would
  // otherwise look like a short directory
  for (;;) {
    auto batch = file_->read_dir(count);
    if (!batch) {
      return std::nullopt;
    }
    std::vector<FileInfo> out;
    for (auto &info : *batch) {
      if (info.is_dir() || pred_(join_path(path_, info.name))) {
        out.push_back(std::move(info));
      }
    }
    if (!out.empty() || count <= 0) {
      return out;
    }
  }
}

// PredicateFs

PredicateFs::PredicateFs(FsPtr source, FilePredicate pred)
    : source_(std::move(source)), pred_(std::move(pred)) {}

std::string PredicateFs::name() const { return PREDICATEFS_NAME; }

bool PredicateFs::matches(const std::string &name) const {
  return pred_(normalize_path(name));
}

void PredicateFs::check_visible(const char *op, const std::string &name) {
  if (matches(name)) {
    return;
  }
  if (!source_->stat(name).is_dir()) {
    throw_error(op, name, errc::not_found);
  }
}

FilePtr PredicateFs::create(const std::string &name) {
  if (!matches(name)) {
    throw_error("create", name, errc::permission_denied);
  }
  return source_->create(name);
}

FilePtr PredicateFs::open(const std::string &name) {
  check_visible("open", name);
  FilePtr file = source_->open(name);
  if (!file->stat().is_dir()) {
    return file;
  }
  return std::make_unique<PredicateFile>(std::move(file), normalize_path(name),
                                         pred_);
}

FilePtr PredicateFs::open_file(const std::string &name, int flags,
                               fs::perms perm) {
  if (!is_write_flags(flags)) {
    return open(name);
  }
  if (!matches(name)) {
    try {
      check_visible("open", name);
    } catch (const FsError &e) {
      // A hidden name must not be created either
      if (is_not_found(e) && (flags & O_CREAT)) {
        throw_error("open", name, errc::permission_denied);
      }
      throw;
    }
  }
  return source_->open_file(name, flags, perm);
}

void PredicateFs::mkdir(const std::string &name, fs::perms perm) {
  source_->mkdir(name, perm);
}

void PredicateFs::mkdir_all(const std::string &path, fs::perms perm) {
  source_->mkdir_all(path, perm);
}

void PredicateFs::remove(const std::string &name) {
  check_visible("remove", name);
  source_->remove(name);
}

void PredicateFs::remove_all(const std::string &path) {
  check_visible("remove_all", path);
  source_->remove_all(path);
}

void PredicateFs::rename(const std::string &oldname,
                         const std::string &newname) {
  check_visible("rename", oldname);
  if (!source_->stat(oldname).is_dir() && !matches(newname)) {
    throw FsError("rename", oldname, newname, errc::permission_denied);
  }
  source_->rename(oldname, newname);
}

FileInfo PredicateFs::stat(const std::string &name) {
  FileInfo info = source_->stat(name);
  if (!info.is_dir() && !matches(name)) {
    throw_error("stat", name, errc::not_found);
  }
  return info;
}

void PredicateFs::chmod(const std::string &name, fs::perms mode) {
  check_visible("chmod", name);
  source_->chmod(name, mode);
}

void PredicateFs::chtimes(const std::string &name, TimePoint atime,
                          TimePoint mtime) {
  check_visible("chtimes", name);
  source_->chtimes(name, atime, mtime);
}

// RegexpFs

RegexpFs::RegexpFs(FsPtr source, const std::string &pattern)
    : PredicateFs(std::move(source),
                  [re = std::regex(pattern)](const std::string &path) {
                    return std::regex_search(path, re);
                  }) {}

std::string RegexpFs::name() const { return REGEXPFS_NAME; }

} // namespace layerfs
