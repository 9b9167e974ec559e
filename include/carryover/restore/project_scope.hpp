#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace carryover::restore {

/// Walks upward from `cwd` to the first directory holding one of `markers`. "AGENTS.md"-style
/// markers must be regular files; ".git" may be any entry (worktrees use a file). Falls back to
/// `cwd` itself when no ancestor matches.
[[nodiscard]] std::filesystem::path
resolve_project_root(const std::filesystem::path &cwd,
                     const std::vector<std::string> &markers = {"AGENTS.md", ".git"});

/// Exact path match between a rollout's recorded root and the current root. Logs without a
/// recorded root are out of scope unless the scope is widened.
[[nodiscard]] bool in_scope(const std::optional<std::string> &recorded_root,
                            const std::filesystem::path &current_root, bool widen);

} // namespace carryover::restore
