// utils.cpp - Logging and path utilities implementation
#include "utils.hpp"
#include "defs.hpp"
#include <ctime>
#include <iostream>

namespace layerfs {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  verbose_.store(verbose);

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  } else {
    log_file_.reset();
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_.load()) {
    return;
  }

  auto now = std::time(nullptr);
  std::tm tm_buf{};
  localtime_r(&now, &tm_buf);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// Path utilities
std::vector<std::string> split_path(const std::string &path) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find(PATH_SEPARATOR, start);
    if (end == std::string::npos) {
      end = path.size();
    }
    if (end > start) {
      parts.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return parts;
}

std::string join_segments(const std::vector<std::string> &parts, size_t begin,
                          size_t end) {
  std::string out;
  for (size_t i = begin; i < end && i < parts.size(); ++i) {
    out += PATH_SEPARATOR;
    out += parts[i];
  }
  return out.empty() ? std::string(1, PATH_SEPARATOR) : out;
}

std::string clean_path(const std::string &path) {
  if (path.empty()) {
    return ".";
  }

  bool rooted = path[0] == PATH_SEPARATOR;
  std::vector<std::string> out;

  for (const auto &part : split_path(path)) {
    if (part == ".") {
      continue;
    }
    if (part == "..") {
      if (!out.empty() && out.back() != "..") {
        out.pop_back();
      } else if (!rooted) {
        out.push_back(part);
      }
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
  return result.empty() ? "." : result;
}

std::string normalize_path(const std::string &path) {
  // Relative names and anything climbing above the root resolve against "/"
  return clean_path(std::string(1, PATH_SEPARATOR) + path);
}

std::string join_path(const std::string &base, const std::string &name) {
  if (base.empty()) {
    return clean_path(name);
  }
  if (name.empty()) {
    return clean_path(base);
  }
  return clean_path(base + PATH_SEPARATOR + name);
}

std::string parent_path(const std::string &path) {
  std::string cleaned = clean_path(path);
  auto pos = cleaned.rfind(PATH_SEPARATOR);
  if (pos == std::string::npos) {
    return ".";
  }
  if (pos == 0) {
    return std::string(1, PATH_SEPARATOR);
  }
  return cleaned.substr(0, pos);
}

std::string base_name(const std::string &path) {
  std::string cleaned = clean_path(path);
  if (cleaned == "/") {
    return cleaned;
  }
  auto pos = cleaned.rfind(PATH_SEPARATOR);
  if (pos == std::string::npos) {
    return cleaned;
  }
  return cleaned.substr(pos + 1);
}

bool has_path_prefix(const std::string &path, const std::string &prefix) {
  if (prefix == "/") {
    return !path.empty() && path[0] == PATH_SEPARATOR;
  }
  if (path == prefix) {
    return true;
  }
  return path.size() > prefix.size() &&
         path.compare(0, prefix.size(), prefix) == 0 &&
         path[prefix.size()] == PATH_SEPARATOR;
}

bool is_local_path(const std::string &path) {
  if (path.empty() || path[0] == PATH_SEPARATOR) {
    return false;
  }
  std::string cleaned = clean_path(path);
  if (cleaned == "..") {
    return false;
  }
  return cleaned.compare(0, 3, "../") != 0;
}

std::string format_mode(bool is_dir, bool is_symlink, fs::perms perms) {
  std::string out;
  out += is_symlink ? 'l' : (is_dir ? 'd' : '-');

  const std::pair<fs::perms, char> bits[] = {
      {fs::perms::owner_read, 'r'},  {fs::perms::owner_write, 'w'},
      {fs::perms::owner_exec, 'x'},  {fs::perms::group_read, 'r'},
      {fs::perms::group_write, 'w'}, {fs::perms::group_exec, 'x'},
      {fs::perms::others_read, 'r'}, {fs::perms::others_write, 'w'},
      {fs::perms::others_exec, 'x'}};

  for (const auto &[bit, ch] : bits) {
    out += (perms & bit) != fs::perms::none ? ch : '-';
  }
  return out;
}

} // namespace layerfs
