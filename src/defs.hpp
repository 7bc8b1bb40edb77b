// Constants and definitions
#pragma once

#include <cstddef>
#include <filesystem>

#define LAYERFS_VERSION "1.0.0"

namespace layerfs {

constexpr char PATH_SEPARATOR = '/';

// Files
constexpr const char *CONFIG_FILENAME = "layerfs.conf";
constexpr const char *DEFAULT_CONFIG_DIR = "/etc/layerfs/";

// Backend names reported by Fs::name()
constexpr const char *MEMFS_NAME = "MemFs";
constexpr const char *OSFS_NAME = "OsFs";
constexpr const char *BASEPATHFS_NAME = "BasePathFs";
constexpr const char *COPY_ON_WRITE_NAME = "CopyOnWriteFs";
constexpr const char *MOUNTFS_NAME = "MountFs";
constexpr const char *READONLYFS_NAME = "ReadOnlyFs";
constexpr const char *PREDICATEFS_NAME = "PredicateFs";
constexpr const char *REGEXPFS_NAME = "RegexpFs";

// Permissions
constexpr std::filesystem::perms DEFAULT_DIR_PERMS =
    std::filesystem::perms(0755);
constexpr std::filesystem::perms DEFAULT_FILE_PERMS =
    std::filesystem::perms(0666);
constexpr std::filesystem::perms MOUNT_NODE_PERMS =
    std::filesystem::perms(0777);

// Symlink resolution gives up after this many lstat rounds
constexpr int SYMLINK_MAX_ITERATIONS = 1024;

// Chunk size for copy-up and file copies
constexpr std::size_t COPY_BUFFER_SIZE = 32 * 1024;

} // namespace layerfs
