// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>
#include <stdexcept>

namespace layerfs {

static void trim(std::string &s, const char *chars = " \t") {
  s.erase(0, s.find_first_not_of(chars));
  s.erase(s.find_last_not_of(chars) + 1);
}

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path = fs::path(DEFAULT_CONFIG_DIR) / CONFIG_FILENAME;
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path.string());
  }

  std::string line;
  int line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      LOG_WARN(path.string() + ":" + std::to_string(line_no) +
               ": ignoring line without '='");
      continue;
    }

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);
    trim(key);
    trim(value, " \t\"");

    if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "allow_masking")
      config.allow_masking = (value == "true");
    else if (key == "allow_recursive_mount")
      config.allow_recursive_mount = (value == "true");
    else if (key.rfind("mount:", 0) == 0) {
      std::string mount_path = key.substr(6);
      trim(mount_path);
      if (mount_path.empty() || value.empty()) {
        LOG_WARN(path.string() + ":" + std::to_string(line_no) +
                 ": incomplete mount entry");
        continue;
      }
      config.mounts.push_back({mount_path, value});
    } else {
      LOG_WARN(path.string() + ":" + std::to_string(line_no) +
               ": unknown key " + key);
    }
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# layerfs configuration\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }
  file << "allow_masking = " << (allow_masking ? "true" : "false") << "\n";
  file << "allow_recursive_mount = "
       << (allow_recursive_mount ? "true" : "false") << "\n";

  if (!mounts.empty()) {
    file << "\n# Format: mount:<path> = <source>\n";
    file << "# Sources: mem, os:<dir>, readonly:<source>, overlay:<dir>,\n";
    file << "#          regexp:<pattern>:<source>\n";
    for (const auto &entry : mounts) {
      file << "mount:" << entry.path << " = " << entry.source << "\n";
    }
  }

  return file.good();
}

void Config::merge_with_cli(const fs::path &log_file_override,
                            bool verbose_override,
                            const std::vector<MountEntry> &mounts_override) {
  if (!log_file_override.empty()) {
    log_file = log_file_override;
  }
  if (verbose_override) {
    verbose = true;
  }
  for (const auto &entry : mounts_override) {
    bool replaced = false;
    for (auto &existing : mounts) {
      if (normalize_path(existing.path) == normalize_path(entry.path)) {
        existing.source = entry.source;
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      mounts.push_back(entry);
    }
  }
}

std::optional<MountEntry> parse_mount_arg(const std::string &arg) {
  auto eq_pos = arg.find('=');
  if (eq_pos == std::string::npos) {
    return std::nullopt;
  }
  MountEntry entry{arg.substr(0, eq_pos), arg.substr(eq_pos + 1)};
  trim(entry.path);
  trim(entry.source);
  if (entry.path.empty() || entry.source.empty()) {
    return std::nullopt;
  }
  return entry;
}

} // namespace layerfs
