#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace carryover::config {

struct RestoreConfig {
  std::int64_t max_tokens_per_segment = 2000;
  std::int64_t handshake_timeout_ms = 10'000;
  bool auto_fallback = false;
  bool unattended_replay = false;
  bool show_all_projects = false;
  bool interactive = true;
};

struct ProjectConfig {
  std::vector<std::string> markers = {"AGENTS.md", ".git"};
};

struct ExecutionConfig {
  std::string model;
  std::string reasoning_effort;
  std::string sandbox_policy;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string sessions_dir;
  RestoreConfig restore;
  ProjectConfig project;
  ExecutionConfig execution;
  ObservabilityConfig observability;
};

} // namespace carryover::config
