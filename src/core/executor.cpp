// core/executor.cpp - Mount execution implementation
#include "executor.hpp"
#include "../defs.hpp"
#include "../mount/basepath.hpp"
#include "../mount/filter.hpp"
#include "../mount/overlay.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include "memfs.hpp"
#include "osfs.hpp"
#include <regex>

namespace layerfs {

static FsPtr confined_os_dir(const std::string &dir) {
  auto host = std::make_shared<OsFs>();
  if (!host->stat(dir).is_dir()) {
    throw_error("mount", dir, errc::not_a_directory);
  }
  return std::make_shared<BasePathFs>(host, dir);
}

FsPtr build_source(const SourceSpec &spec) {
  switch (spec.kind) {
  case SourceKind::Mem:
    return std::make_shared<MemFs>();
  case SourceKind::Os:
    return confined_os_dir(spec.arg);
  case SourceKind::ReadOnly:
    return std::make_shared<ReadOnlyFs>(build_source(*spec.inner));
  case SourceKind::Overlay: {
    auto base = std::make_shared<ReadOnlyFs>(confined_os_dir(spec.arg));
    return std::make_shared<CopyOnWriteFs>(base, std::make_shared<MemFs>());
  }
  case SourceKind::Regexp:
    try {
      return std::make_shared<RegexpFs>(build_source(*spec.inner), spec.arg);
    } catch (const std::regex_error &e) {
      LOG_ERROR("Bad pattern '" + spec.arg + "': " + e.what());
      throw_error("mount", spec.arg, errc::invalid_argument);
    }
  }
  throw_error("mount", describe_source(spec), errc::not_supported);
}

ExecutionResult execute_plan(const MountPlan &plan, const Config &config) {
  MountOptions options;
  options.allow_masking = config.allow_masking;
  options.allow_recursive_mount = config.allow_recursive_mount;

  ExecutionResult result;
  result.fs = std::make_shared<MountFs>(std::make_shared<MemFs>(), options);

  for (const auto &op : plan.ops) {
    LOG_DEBUG("Mounting " + op.target + " [" + describe_source(op.source) +
              "]");
    try {
      result.fs->mount(op.target, build_source(op.source));
      result.mounted.push_back(op.target);
    } catch (const std::exception &e) {
      LOG_WARN("Mount of " + op.source_text + " at " + op.target +
               " failed: " + e.what());
      result.failed.push_back(op.target);
    }
  }

  LOG_INFO("Mounted " + std::to_string(result.mounted.size()) + " of " +
           std::to_string(plan.ops.size()) + " sources");
  return result;
}

} // namespace layerfs
