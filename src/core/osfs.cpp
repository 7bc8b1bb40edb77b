// core/osfs.cpp - Host filesystem passthrough implementation
#include "osfs.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace layerfs {

[[noreturn]] static void throw_errno(const std::string &op,
                                     const std::string &path) {
  throw FsError(op, path, error_from_errno(errno));
}

static FileInfo info_from_stat(const std::string &path, const struct stat &st) {
  FileInfo info;
  info.name = base_name(path);
  info.perms = static_cast<fs::perms>(st.st_mode) & fs::perms::mask;
  info.mod_time =
      Clock::from_time_t(st.st_mtim.tv_sec) +
      std::chrono::duration_cast<Clock::duration>(
          std::chrono::nanoseconds(st.st_mtim.tv_nsec));
  if (S_ISDIR(st.st_mode)) {
    info.type = FileType::Directory;
    info.size = 0;
  } else if (S_ISLNK(st.st_mode)) {
    info.type = FileType::Symlink;
    info.size = st.st_size;
  } else {
    info.type = FileType::Regular;
    info.size = st.st_size;
  }
  return info;
}

static struct timespec to_timespec(TimePoint tp) {
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                tp.time_since_epoch())
                .count();
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ns / 1000000000);
  ts.tv_nsec = static_cast<long>(ns % 1000000000);
  if (ts.tv_nsec < 0) {
    ts.tv_sec -= 1;
    ts.tv_nsec += 1000000000;
  }
  return ts;
}

// OsFile

OsFile::OsFile(int fd, std::string name) : fd_(fd), name_(std::move(name)) {}

OsFile::~OsFile() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void OsFile::check_open(const char *op) const {
  if (fd_ < 0) {
    throw_error(op, name_, errc::file_closed);
  }
}

size_t OsFile::read(void *buf, size_t len) {
  check_open("read");
  ssize_t n = ::read(fd_, buf, len);
  if (n < 0) {
    throw_errno("read", name_);
  }
  return static_cast<size_t>(n);
}

size_t OsFile::read_at(void *buf, size_t len, int64_t offset) {
  check_open("read_at");
  ssize_t n = ::pread(fd_, buf, len, static_cast<off_t>(offset));
  if (n < 0) {
    throw_errno("read_at", name_);
  }
  return static_cast<size_t>(n);
}

size_t OsFile::write(const void *buf, size_t len) {
  check_open("write");
  ssize_t n = ::write(fd_, buf, len);
  if (n < 0) {
    throw_errno("write", name_);
  }
  return static_cast<size_t>(n);
}

size_t OsFile::write_at(const void *buf, size_t len, int64_t offset) {
  check_open("write_at");
  ssize_t n = ::pwrite(fd_, buf, len, static_cast<off_t>(offset));
  if (n < 0) {
    throw_errno("write_at", name_);
  }
  return static_cast<size_t>(n);
}

int64_t OsFile::seek(int64_t offset, int whence) {
  check_open("seek");
  off_t pos = ::lseek(fd_, static_cast<off_t>(offset), whence);
  if (pos < 0) {
    throw_errno("seek", name_);
  }
  return pos;
}

void OsFile::truncate(int64_t size) {
  check_open("truncate");
  if (size < 0) {
    throw_error("truncate", name_, errc::out_of_range);
  }
  if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
    throw_errno("truncate", name_);
  }
}

void OsFile::sync() {
  check_open("sync");
  if (::fsync(fd_) != 0) {
    throw_errno("sync", name_);
  }
}

void OsFile::close() {
  check_open("close");
  int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0) {
    throw_errno("close", name_);
  }
}

FileInfo OsFile::stat() {
  check_open("stat");
  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    throw_errno("stat", name_);
  }
  return info_from_stat(name_, st);
}

std::optional<std::vector<FileInfo>> OsFile::read_dir(int count) {
  check_open("readdir");

  if (!entries_) {
    int dup_fd = ::dup(fd_);
    if (dup_fd < 0) {
      throw_errno("readdir", name_);
    }
    DIR *dir = ::fdopendir(dup_fd);
    if (!dir) {
      int err = errno;
      ::close(dup_fd);
      throw FsError("readdir", name_, error_from_errno(err));
    }

    std::vector<FileInfo> entries;
    while (struct dirent *ent = ::readdir(dir)) {
      std::string entry = ent->d_name;
      if (entry == "." || entry == "..") {
        continue;
      }
      struct stat st;
      if (::fstatat(::dirfd(dir), ent->d_name, &st, AT_SYMLINK_NOFOLLOW) !=
          0) {
        // Entry vanished between readdir and stat
        LOG_DEBUG("OsFs: skipping " + entry + " in " + name_ + ": " +
                  strerror(errno));
        continue;
      }
      entries.push_back(info_from_stat(entry, st));
    }
    ::closedir(dir);

    std::sort(entries.begin(), entries.end(),
              [](const FileInfo &a, const FileInfo &b) {
                return a.name < b.name;
              });
    entries_ = std::move(entries);
  }

  size_t remaining = entries_->size() - read_dir_pos_;
  size_t out_len = remaining;
  if (count > 0) {
    if (remaining == 0) {
      return std::nullopt;
    }
    out_len = std::min<size_t>(remaining, static_cast<size_t>(count));
  }

  std::vector<FileInfo> out(entries_->begin() + read_dir_pos_,
                            entries_->begin() + read_dir_pos_ + out_len);
  read_dir_pos_ += out_len;
  return out;
}

// OsFs

std::string OsFs::name() const { return OSFS_NAME; }

FilePtr OsFs::create(const std::string &name) {
  return open_file(name, O_RDWR | O_CREAT | O_TRUNC, DEFAULT_FILE_PERMS);
}

FilePtr OsFs::open(const std::string &name) {
  return open_file(name, O_RDONLY, fs::perms::none);
}

FilePtr OsFs::open_file(const std::string &name, int flags, fs::perms perm) {
  int fd = ::open(name.c_str(), flags | O_CLOEXEC,
                  static_cast<mode_t>(perm & fs::perms::mask));
  if (fd < 0) {
    throw_errno("open", name);
  }
  return std::make_unique<OsFile>(fd, name);
}

void OsFs::mkdir(const std::string &name, fs::perms perm) {
  if (::mkdir(name.c_str(), static_cast<mode_t>(perm & fs::perms::mask)) !=
      0) {
    throw_errno("mkdir", name);
  }
}

void OsFs::mkdir_all(const std::string &path, fs::perms perm) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return;
  }
  std::string parent = parent_path(path);
  if (parent != path && parent != "." && parent != "/") {
    mkdir_all(parent, perm);
  }
  if (::mkdir(path.c_str(), static_cast<mode_t>(perm & fs::perms::mask)) !=
          0 &&
      errno != EEXIST) {
    throw_errno("mkdir_all", path);
  }
  if (!fs::is_directory(path, ec)) {
    throw_error("mkdir_all", path, errc::not_a_directory);
  }
}

void OsFs::remove(const std::string &name) {
  if (::unlink(name.c_str()) == 0) {
    return;
  }
  if (errno == EISDIR || errno == EPERM) {
    if (::rmdir(name.c_str()) == 0) {
      return;
    }
  }
  throw_errno("remove", name);
}

void OsFs::remove_all(const std::string &path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    throw FsError("remove_all", path, error_from_errno(ec.value()));
  }
}

void OsFs::rename(const std::string &oldname, const std::string &newname) {
  if (::rename(oldname.c_str(), newname.c_str()) != 0) {
    throw FsError("rename", oldname, newname, error_from_errno(errno));
  }
}

FileInfo OsFs::stat(const std::string &name) {
  struct stat st;
  if (::stat(name.c_str(), &st) != 0) {
    throw_errno("stat", name);
  }
  return info_from_stat(name, st);
}

void OsFs::chmod(const std::string &name, fs::perms mode) {
  if (::chmod(name.c_str(), static_cast<mode_t>(mode & fs::perms::mask)) !=
      0) {
    throw_errno("chmod", name);
  }
}

void OsFs::chtimes(const std::string &name, TimePoint atime,
                   TimePoint mtime) {
  struct timespec times[2] = {to_timespec(atime), to_timespec(mtime)};
  if (::utimensat(AT_FDCWD, name.c_str(), times, 0) != 0) {
    throw_errno("chtimes", name);
  }
}

std::pair<FileInfo, bool> OsFs::lstat_if_possible(const std::string &name) {
  struct stat st;
  if (::lstat(name.c_str(), &st) != 0) {
    throw_errno("lstat", name);
  }
  return {info_from_stat(name, st), true};
}

bool OsFs::symlink_if_possible(const std::string &oldname,
                               const std::string &newname) {
  if (::symlink(oldname.c_str(), newname.c_str()) != 0) {
    throw FsError("symlink", oldname, newname, error_from_errno(errno));
  }
  return true;
}

std::optional<std::string>
OsFs::readlink_if_possible(const std::string &name) {
  std::vector<char> buf(256);
  for (;;) {
    ssize_t n = ::readlink(name.c_str(), buf.data(), buf.size());
    if (n < 0) {
      throw_errno("readlink", name);
    }
    if (static_cast<size_t>(n) < buf.size()) {
      return std::string(buf.data(), static_cast<size_t>(n));
    }
    buf.resize(buf.size() * 2);
  }
}

} // namespace layerfs
