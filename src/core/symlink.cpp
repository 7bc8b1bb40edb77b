// core/symlink.cpp - Symbolic link resolution implementation
#include "symlink.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <vector>

namespace layerfs {

static bool is_absolute(const std::string &path) {
  return !path.empty() && path[0] == PATH_SEPARATOR;
}

static std::string dir_of(const std::string &path) {
  auto sep = path.rfind(PATH_SEPARATOR);
  if (sep == std::string::npos) {
    return "";
  }
  return path.substr(0, sep);
}

std::string resolve_relative(const std::string &dir, const std::string &link) {
  if (dir.empty()) {
    return link;
  }

  std::string joined = dir + PATH_SEPARATOR + link;
  bool rooted = is_absolute(joined);

  std::vector<std::string> out;
  for (const auto &part : split_path(joined)) {
    if (part == ".") {
      continue;
    }
    if (part == "..") {
      if (out.empty()) {
        throw_error("readlink", joined, errc::invalid_argument);
      }
      out.pop_back();
      continue;
    }
    out.push_back(part);
  }

  std::string result = rooted ? std::string(1, PATH_SEPARATOR) : "";
  for (size_t i = 0; i < out.size(); ++i) {
    if (i > 0) {
      result += PATH_SEPARATOR;
    }
    result += out[i];
  }
  return result;
}

std::optional<std::string> eval_symlinks(Fs &fsys, const std::string &input) {
  auto *lstater = dynamic_cast<Lstater *>(&fsys);
  auto *readlinker = dynamic_cast<Readlinker *>(&fsys);
  if (!lstater || !readlinker) {
    return std::nullopt;
  }

  std::string path = input;
  size_t idx = path.size();

  for (int iterations = 0; iterations < SYMLINK_MAX_ITERATIONS;
       ++iterations) {
    std::string prefix = path.substr(0, idx);
    auto [info, called] = lstater->lstat_if_possible(prefix);
    if (!called) {
      return std::nullopt;
    }

    if (info.is_symlink()) {
      auto link = readlinker->readlink_if_possible(prefix);
      if (!link) {
        return std::nullopt;
      }

      std::string tail = path.substr(idx);
      if (is_absolute(*link)) {
        path = *link + tail;
        idx = path.size() - tail.size();
        continue;
      }

      path = resolve_relative(dir_of(prefix), *link);
      idx = path.size();
      path += tail;
      continue;
    }

    auto sep = prefix.rfind(PATH_SEPARATOR);
    if (sep == std::string::npos || sep == 0) {
      return path;
    }
    idx = sep;
  }

  LOG_WARN("Symlink resolution of " + input + " exceeded " +
           std::to_string(SYMLINK_MAX_ITERATIONS) + " iterations");
  throw_error("eval_symlinks", input, errc::invalid_argument);
}

} // namespace layerfs
