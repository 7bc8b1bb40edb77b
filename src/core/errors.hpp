// core/errors.hpp - Error taxonomy shared by every backend
#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace layerfs {

enum class errc {
  not_found = 1,
  already_exists,
  permission_denied,
  not_a_directory,
  is_a_directory,
  directory_not_empty,
  invalid_argument,
  cross_backend,
  already_mounted,
  not_mounted,
  recursive_mount,
  file_closed,
  out_of_range,
  not_supported,
};

const std::error_category &error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// Carries the failing operation, the path as the caller named it, and the
// cause. what() reads "<op>: <cause>: [<path>]".
class FsError : public fs::filesystem_error {
public:
  FsError(const std::string &op, const std::string &path, std::error_code ec);
  FsError(const std::string &op, const std::string &path, errc e);
  FsError(const std::string &op, const std::string &path,
          const std::string &path2, std::error_code ec);
  FsError(const std::string &op, const std::string &path,
          const std::string &path2, errc e);

  const std::string &op() const noexcept { return op_; }

private:
  std::string op_;
};

[[noreturn]] void throw_error(const std::string &op, const std::string &path,
                              errc e);

// Maps an errno value onto the taxonomy, unknown values keep the system
// category.
std::error_code error_from_errno(int err);

bool is_error(const std::exception &e, errc code);
bool is_not_found(const std::exception &e);
bool is_exist(const std::exception &e);
bool is_permission(const std::exception &e);

} // namespace layerfs

namespace std {
template <> struct is_error_code_enum<layerfs::errc> : true_type {};
} // namespace std
