#include "carryover/restore/project_scope.hpp"

#include "carryover/common/fs.hpp"

namespace carryover::restore {

namespace {

bool has_marker(const std::filesystem::path &dir, const std::string &marker) {
  std::error_code ec;
  const auto candidate = dir / marker;
  if (!marker.empty() && marker.front() == '.') {
    return std::filesystem::exists(candidate, ec);
  }
  return std::filesystem::is_regular_file(candidate, ec);
}

} // namespace

std::filesystem::path resolve_project_root(const std::filesystem::path &cwd,
                                           const std::vector<std::string> &markers) {
  const auto start = common::normalize_path(cwd);
  auto dir = start;
  while (true) {
    for (const auto &marker : markers) {
      if (has_marker(dir, marker)) {
        return dir;
      }
    }
    const auto parent = dir.parent_path();
    if (parent.empty() || parent == dir) {
      return start;
    }
    dir = parent;
  }
}

bool in_scope(const std::optional<std::string> &recorded_root,
              const std::filesystem::path &current_root, const bool widen) {
  if (widen) {
    return true;
  }
  if (!recorded_root.has_value() || recorded_root->empty()) {
    return false;
  }
  return common::normalize_path(*recorded_root) == common::normalize_path(current_root);
}

} // namespace carryover::restore
