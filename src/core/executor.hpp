// core/executor.hpp - Mount execution
#pragma once

#include "../conf/config.hpp"
#include "../mount/mountfs.hpp"
#include "planner.hpp"
#include <memory>
#include <string>
#include <vector>

namespace layerfs {

struct ExecutionResult {
  std::shared_ptr<MountFs> fs;
  std::vector<std::string> mounted;
  std::vector<std::string> failed;
};

// Builds the backend a source describes
FsPtr build_source(const SourceSpec &spec);

// Mounts every planned source on a MountFs over an in-memory root. A mount
// that fails is logged and reported, the others still go ahead.
ExecutionResult execute_plan(const MountPlan &plan, const Config &config);

} // namespace layerfs
