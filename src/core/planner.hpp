// core/planner.hpp - Mount planning
#pragma once

#include "../conf/config.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace layerfs {

enum class SourceKind { Mem, Os, ReadOnly, Overlay, Regexp };

// Parsed form of a mount source such as "readonly:os:/srv/data"
struct SourceSpec {
  SourceKind kind = SourceKind::Mem;
  std::string arg; // directory or pattern
  std::shared_ptr<SourceSpec> inner;
};

struct MountOperation {
  std::string target;
  std::string source_text;
  SourceSpec source;
};

struct MountPlan {
  std::vector<MountOperation> ops; // parents before children
  std::vector<std::string> rejected;

  bool is_covered(const std::string &path) const;
};

std::optional<SourceSpec> parse_source(const std::string &text);
std::string describe_source(const SourceSpec &spec);

MountPlan generate_plan(const Config &config);

} // namespace layerfs
