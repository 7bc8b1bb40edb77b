// core/planner.cpp - Mount planning implementation
#include "planner.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <set>

namespace layerfs {

bool MountPlan::is_covered(const std::string &path) const {
  std::string p_str = normalize_path(path);
  for (const auto &op : ops) {
    if (has_path_prefix(p_str, op.target)) {
      return true;
    }
  }
  return false;
}

std::optional<SourceSpec> parse_source(const std::string &text) {
  SourceSpec spec;
  auto colon = text.find(':');
  std::string kind = text.substr(0, colon);
  std::string rest = colon == std::string::npos ? "" : text.substr(colon + 1);

  if (kind == "mem") {
    if (colon != std::string::npos) {
      return std::nullopt;
    }
    spec.kind = SourceKind::Mem;
    return spec;
  }

  if (kind == "os" || kind == "overlay") {
    // Host directories must be absolute
    if (rest.empty() || rest[0] != PATH_SEPARATOR) {
      return std::nullopt;
    }
    spec.kind = kind == "os" ? SourceKind::Os : SourceKind::Overlay;
    spec.arg = clean_path(rest);
    return spec;
  }

  if (kind == "readonly") {
    auto inner = parse_source(rest);
    if (!inner) {
      return std::nullopt;
    }
    spec.kind = SourceKind::ReadOnly;
    spec.inner = std::make_shared<SourceSpec>(std::move(*inner));
    return spec;
  }

  if (kind == "regexp") {
    // regexp:<pattern>:<source>, the pattern cannot contain ':'
    auto sep = rest.find(':');
    if (sep == std::string::npos || sep == 0) {
      return std::nullopt;
    }
    auto inner = parse_source(rest.substr(sep + 1));
    if (!inner) {
      return std::nullopt;
    }
    spec.kind = SourceKind::Regexp;
    spec.arg = rest.substr(0, sep);
    spec.inner = std::make_shared<SourceSpec>(std::move(*inner));
    return spec;
  }

  return std::nullopt;
}

std::string describe_source(const SourceSpec &spec) {
  switch (spec.kind) {
  case SourceKind::Mem:
    return "mem";
  case SourceKind::Os:
    return "os:" + spec.arg;
  case SourceKind::Overlay:
    return "overlay:" + spec.arg;
  case SourceKind::ReadOnly:
    return "readonly:" + describe_source(*spec.inner);
  case SourceKind::Regexp:
    return "regexp:" + spec.arg + ":" + describe_source(*spec.inner);
  }
  return "";
}

MountPlan generate_plan(const Config &config) {
  MountPlan plan;
  std::set<std::string> seen;

  for (const auto &entry : config.mounts) {
    std::string target = normalize_path(entry.path);

    if (target == "/") {
      LOG_WARN("Skipping mount on / (the root is always in-memory)");
      plan.rejected.push_back(entry.path);
      continue;
    }
    if (!seen.insert(target).second) {
      LOG_WARN("Duplicate mount for " + target + ", keeping the first one");
      plan.rejected.push_back(entry.path);
      continue;
    }

    auto source = parse_source(entry.source);
    if (!source) {
      LOG_WARN("Invalid mount source '" + entry.source + "' for " + target);
      plan.rejected.push_back(entry.path);
      continue;
    }

    plan.ops.push_back({target, entry.source, std::move(*source)});
  }

  // Mount parents first so nested mounts land inside them
  std::stable_sort(plan.ops.begin(), plan.ops.end(),
                   [](const MountOperation &a, const MountOperation &b) {
                     return split_path(a.target).size() <
                            split_path(b.target).size();
                   });

  LOG_DEBUG("Mount plan: " + std::to_string(plan.ops.size()) +
            " mounts, " + std::to_string(plan.rejected.size()) + " rejected");
  return plan;
}

} // namespace layerfs
