// core/fs.cpp - Capability probing helpers
#include "fs.hpp"

namespace layerfs {

std::optional<std::vector<std::string>> File::read_dir_names(int count) {
  auto infos = read_dir(count);
  if (!infos) {
    return std::nullopt;
  }
  std::vector<std::string> names;
  names.reserve(infos->size());
  for (const auto &info : *infos) {
    names.push_back(info.name);
  }
  return names;
}

std::pair<FileInfo, bool> lstat_if_possible(Fs &fsys,
                                            const std::string &name) {
  if (auto *lstater = dynamic_cast<Lstater *>(&fsys)) {
    return lstater->lstat_if_possible(name);
  }
  return {fsys.stat(name), false};
}

bool symlink_if_possible(Fs &fsys, const std::string &oldname,
                         const std::string &newname) {
  if (auto *linker = dynamic_cast<Symlinker *>(&fsys)) {
    return linker->symlink_if_possible(oldname, newname);
  }
  return false;
}

std::optional<std::string> readlink_if_possible(Fs &fsys,
                                                const std::string &name) {
  if (auto *reader = dynamic_cast<Readlinker *>(&fsys)) {
    return reader->readlink_if_possible(name);
  }
  return std::nullopt;
}

bool is_write_flags(int flags) {
  return (flags & (O_WRONLY | O_RDWR | O_APPEND | O_CREAT | O_TRUNC)) != 0;
}

} // namespace layerfs
