// core/ioutil.cpp - Convenience helpers implementation
#include "ioutil.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>

namespace layerfs {

std::string read_file(Fs &fsys, const std::string &name) {
  FilePtr f = fsys.open(name);
  std::string out;
  std::vector<char> buf(COPY_BUFFER_SIZE);
  for (;;) {
    size_t n = f->read(buf.data(), buf.size());
    if (n == 0) {
      break;
    }
    out.append(buf.data(), n);
  }
  f->close();
  return out;
}

void write_file(Fs &fsys, const std::string &name, const std::string &data,
                fs::perms perm) {
  FilePtr f = fsys.open_file(name, O_WRONLY | O_CREAT | O_TRUNC, perm);
  f->write(data.data(), data.size());
  f->close();
}

void append_file(Fs &fsys, const std::string &name, const std::string &data) {
  FilePtr f = fsys.open_file(name, O_WRONLY | O_CREAT | O_APPEND,
                             DEFAULT_FILE_PERMS);
  f->write(data.data(), data.size());
  f->close();
}

std::vector<FileInfo> read_dir(Fs &fsys, const std::string &name) {
  FilePtr f = fsys.open(name);
  auto entries = f->read_dir(-1);
  f->close();
  if (!entries) {
    return {};
  }
  std::sort(entries->begin(), entries->end(),
            [](const FileInfo &a, const FileInfo &b) {
              return a.name < b.name;
            });
  return *entries;
}

bool exists(Fs &fsys, const std::string &name) {
  try {
    fsys.stat(name);
    return true;
  } catch (const FsError &e) {
    if (is_not_found(e)) {
      return false;
    }
    throw;
  }
}

bool dir_exists(Fs &fsys, const std::string &name) {
  try {
    return fsys.stat(name).is_dir();
  } catch (const FsError &e) {
    if (is_not_found(e)) {
      return false;
    }
    throw;
  }
}

bool is_dir(Fs &fsys, const std::string &name) {
  return fsys.stat(name).is_dir();
}

bool is_empty(Fs &fsys, const std::string &name) {
  FileInfo info = fsys.stat(name);
  if (!info.is_dir()) {
    return info.size == 0;
  }
  FilePtr f = fsys.open(name);
  auto entries = f->read_dir(1);
  f->close();
  return !entries || entries->empty();
}

static void walk_entry(Fs &fsys, const std::string &path, const FileInfo &info,
                       const WalkFunc &fn) {
  if (!fn(path, info) || !info.is_dir()) {
    return;
  }
  for (const auto &entry : read_dir(fsys, path)) {
    walk_entry(fsys, join_path(path, entry.name), entry, fn);
  }
}

void walk(Fs &fsys, const std::string &root, const WalkFunc &fn) {
  auto [info, lstat_called] = lstat_if_possible(fsys, root);
  (void)lstat_called;
  walk_entry(fsys, root, info, fn);
}

void copy_file(Fs &src_fs, const std::string &src, Fs &dst_fs,
               const std::string &dst) {
  FilePtr in = src_fs.open(src);
  FileInfo info = in->stat();
  if (info.is_dir()) {
    throw_error("copy_file", src, errc::is_a_directory);
  }

  FilePtr out = dst_fs.open_file(dst, O_WRONLY | O_CREAT | O_TRUNC, info.perms);
  std::vector<char> buf(COPY_BUFFER_SIZE);
  for (;;) {
    size_t n = in->read(buf.data(), buf.size());
    if (n == 0) {
      break;
    }
    out->write(buf.data(), n);
  }
  out->close();
  in->close();
  dst_fs.chmod(dst, info.perms);
  LOG_DEBUG("Copied " + src + " (" + std::to_string(info.size) +
            " bytes) to " + dst);
}

} // namespace layerfs
