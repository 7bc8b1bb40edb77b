// utils.hpp - Logging and path utilities
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace layerfs {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);
  bool verbose() const { return verbose_.load(); }

private:
  Logger() = default;
  // Read on every log call without taking mutex_
  std::atomic<bool> verbose_{false};
  std::unique_ptr<std::ofstream> log_file_;
  std::mutex mutex_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// Slash separated virtual paths. These never consult the host filesystem,
// backends are free to use different path semantics.
std::string clean_path(const std::string &path);
std::string normalize_path(const std::string &path);
std::string join_path(const std::string &base, const std::string &name);
std::vector<std::string> split_path(const std::string &path);
std::string join_segments(const std::vector<std::string> &parts, size_t begin,
                          size_t end);
std::string parent_path(const std::string &path);
std::string base_name(const std::string &path);
bool has_path_prefix(const std::string &path, const std::string &prefix);
bool is_local_path(const std::string &path);

// Permission bits formatted like ls(1), e.g. "drwxr-xr-x"
std::string format_mode(bool is_dir, bool is_symlink, fs::perms perms);

} // namespace layerfs
