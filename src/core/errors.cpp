// core/errors.cpp - Error taxonomy implementation
#include "errors.hpp"
#include <cerrno>

namespace layerfs {

namespace {

class LayerfsCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "layerfs"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::not_found:
      return "file does not exist";
    case errc::already_exists:
      return "file already exists";
    case errc::permission_denied:
      return "permission denied";
    case errc::not_a_directory:
      return "not a directory";
    case errc::is_a_directory:
      return "is a directory";
    case errc::directory_not_empty:
      return "directory not empty";
    case errc::invalid_argument:
      return "invalid argument";
    case errc::cross_backend:
      return "cross-fs rename";
    case errc::already_mounted:
      return "already mounted";
    case errc::not_mounted:
      return "not mounted";
    case errc::recursive_mount:
      return "recursive mount";
    case errc::file_closed:
      return "file already closed";
    case errc::out_of_range:
      return "out of range";
    case errc::not_supported:
      return "operation not supported";
    }
    return "unknown error";
  }

  std::error_condition
  default_error_condition(int ev) const noexcept override {
    switch (static_cast<errc>(ev)) {
    case errc::not_found:
      return std::errc::no_such_file_or_directory;
    case errc::already_exists:
    case errc::already_mounted:
      return std::errc::file_exists;
    case errc::permission_denied:
      return std::errc::operation_not_permitted;
    case errc::not_a_directory:
      return std::errc::not_a_directory;
    case errc::is_a_directory:
      return std::errc::is_a_directory;
    case errc::directory_not_empty:
      return std::errc::directory_not_empty;
    case errc::invalid_argument:
    case errc::not_mounted:
    case errc::recursive_mount:
      return std::errc::invalid_argument;
    case errc::cross_backend:
      return std::errc::cross_device_link;
    case errc::file_closed:
      return std::errc::bad_file_descriptor;
    case errc::out_of_range:
      return std::errc::result_out_of_range;
    case errc::not_supported:
      return std::errc::not_supported;
    }
    return std::error_condition(ev, *this);
  }
};

} // namespace

const std::error_category &error_category() noexcept {
  static LayerfsCategory category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

FsError::FsError(const std::string &op, const std::string &path,
                 std::error_code ec)
    : fs::filesystem_error(op, fs::path(path), ec), op_(op) {}

FsError::FsError(const std::string &op, const std::string &path, errc e)
    : FsError(op, path, make_error_code(e)) {}

FsError::FsError(const std::string &op, const std::string &path,
                 const std::string &path2, std::error_code ec)
    : fs::filesystem_error(op, fs::path(path), fs::path(path2), ec), op_(op) {}

FsError::FsError(const std::string &op, const std::string &path,
                 const std::string &path2, errc e)
    : FsError(op, path, path2, make_error_code(e)) {}

void throw_error(const std::string &op, const std::string &path, errc e) {
  throw FsError(op, path, e);
}

std::error_code error_from_errno(int err) {
  switch (err) {
  case ENOENT:
    return make_error_code(errc::not_found);
  case EEXIST:
    return make_error_code(errc::already_exists);
  case EACCES:
  case EPERM:
  case EROFS:
    return make_error_code(errc::permission_denied);
  case ENOTDIR:
    return make_error_code(errc::not_a_directory);
  case EISDIR:
    return make_error_code(errc::is_a_directory);
  case ENOTEMPTY:
    return make_error_code(errc::directory_not_empty);
  case EINVAL:
  case ELOOP:
  case ENAMETOOLONG:
    return make_error_code(errc::invalid_argument);
  case EXDEV:
    return make_error_code(errc::cross_backend);
  case EBADF:
    return make_error_code(errc::file_closed);
  default:
    return {err, std::generic_category()};
  }
}

bool is_error(const std::exception &e, errc code) {
  if (auto *fe = dynamic_cast<const fs::filesystem_error *>(&e)) {
    return fe->code() == make_error_code(code);
  }
  return false;
}

bool is_not_found(const std::exception &e) {
  if (auto *fe = dynamic_cast<const fs::filesystem_error *>(&e)) {
    return fe->code() == std::errc::no_such_file_or_directory;
  }
  return false;
}

bool is_exist(const std::exception &e) {
  if (auto *fe = dynamic_cast<const fs::filesystem_error *>(&e)) {
    return fe->code() == std::errc::file_exists;
  }
  return false;
}

bool is_permission(const std::exception &e) {
  if (auto *fe = dynamic_cast<const fs::filesystem_error *>(&e)) {
    return fe->code() == std::errc::operation_not_permitted ||
           fe->code() == std::errc::permission_denied;
  }
  return false;
}

} // namespace layerfs
