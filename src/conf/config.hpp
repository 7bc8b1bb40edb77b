// conf/config.hpp - Configuration management
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace layerfs {

// One "mount:<path> = <source>" line
struct MountEntry {
  std::string path;
  std::string source;
};

struct Config {
  bool verbose = false;
  fs::path log_file;
  bool allow_masking = false;
  bool allow_recursive_mount = false;
  std::vector<MountEntry> mounts;

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  // Command line mounts replace configured mounts of the same path
  void merge_with_cli(const fs::path &log_file_override, bool verbose_override,
                      const std::vector<MountEntry> &mounts_override);
};

// Parses "<path>=<source>" as given with --mount
std::optional<MountEntry> parse_mount_arg(const std::string &arg);

} // namespace layerfs
