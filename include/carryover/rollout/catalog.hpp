#pragma once

#include "carryover/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace carryover::rollout {

struct RolloutSummary {
  std::filesystem::path path;
  std::string timestamp;
  std::string session_id;
  std::size_t user_messages = 0;
  std::size_t tool_calls = 0;
  std::string first_message;
  std::optional<std::string> resume_token;
  std::optional<std::string> recorded_project_root;
};

struct CatalogFilter {
  bool show_all = false;
  std::filesystem::path project_root;
  std::string query;
};

/// Summary of one rollout. Seed messages are not counted as user messages.
[[nodiscard]] common::Result<RolloutSummary> summarize_rollout(const std::filesystem::path &path);

/// Every readable `*.jsonl` rollout below `dir`, recursively, in no particular order.
/// Unreadable files and files with a corrupt header are left out.
[[nodiscard]] std::vector<RolloutSummary> scan_rollouts(const std::filesystem::path &dir);

/// Rollouts eligible for restore: at least one user message, within the project scope unless
/// `show_all`, matching `query` (case-insensitive, first message or path), newest first.
[[nodiscard]] std::vector<RolloutSummary> list_rollouts(const std::filesystem::path &dir,
                                                        const CatalogFilter &filter);

/// One-line label: "2025-08-12 10:20 · 3 msgs/1 tools · first message".
[[nodiscard]] std::string format_summary_label(const RolloutSummary &summary);

} // namespace carryover::rollout
