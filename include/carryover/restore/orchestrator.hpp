#pragma once

#include "carryover/common/result.hpp"
#include "carryover/config/schema.hpp"
#include "carryover/restore/execution_service.hpp"
#include "carryover/restore/handshake.hpp"
#include "carryover/restore/replay.hpp"
#include "carryover/rollout/record.hpp"
#include "carryover/rollout/writer.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace carryover::restore {

/// The active session. Passed explicitly to every restore decision; exactly one writer.
struct SessionContext {
  std::string session_id;
  std::filesystem::path rollout_path;
  std::optional<rollout::RolloutWriter> writer;
  std::shared_ptr<ExecutionService> service;
  // Token of the last checkpoint appended to `writer`, or the token a server resume used.
  std::optional<std::string> checkpointed_token;
};

enum class RestoreMode {
  Auto,
  ServerResume,
  Replay,
  Manual,
};

[[nodiscard]] std::string_view restore_mode_name(RestoreMode mode);
[[nodiscard]] std::optional<RestoreMode> parse_restore_mode(std::string_view value);

enum class DriftDecision {
  ApplyRecorded,
  KeepCurrent,
};

using DriftHook = std::function<DriftDecision(const rollout::ExecutionConfigSnapshot &recorded,
                                              const rollout::ExecutionConfigSnapshot &current)>;

struct RestoreRequest {
  std::filesystem::path rollout_path;
  RestoreMode mode = RestoreMode::Auto;
  // Working directory of the caller; the process cwd when empty.
  std::filesystem::path cwd;
};

enum class RestoreKind {
  ServerResumed,
  ReplayPending,
  ReplayCompleted,
  ReplayCancelled,
  ResumeUnavailable,
  Manual,
  Skipped,
};

[[nodiscard]] std::string_view restore_kind_name(RestoreKind kind);

struct RestoreOutcome {
  RestoreKind kind = RestoreKind::Skipped;
  // Why the session did not resume: the handshake failure for ResumeUnavailable, Cancelled for
  // ReplayCancelled. Success for every other kind.
  common::Status status = common::Status::success();
  HandshakeResult handshake;
  std::vector<std::string> notices;
  // Manual continuation: text the user can submit to pick the session back up.
  std::optional<std::string> seed;
  std::optional<DriftDecision> drift_decision;
  rollout::ExecutionConfigSnapshot execution_config;
  std::size_t synthesized_results = 0;
  // Pending or finished replay; the caller drives a pending one with proceed().
  std::unique_ptr<ReplayController> replay;
};

struct OrchestratorOptions {
  config::RestoreConfig restore;
  std::vector<std::string> markers = {"AGENTS.md", ".git"};
  std::filesystem::path sessions_dir;
  rollout::ExecutionConfigSnapshot current_execution;

  [[nodiscard]] static OrchestratorOptions from_config(const config::Config &config,
                                                       const std::filesystem::path &sessions_dir);
};

/// Chooses between server resume, replay and manual continuation for a rollout and binds the
/// session context to the result.
class RestoreOrchestrator {
public:
  RestoreOrchestrator(std::shared_ptr<ExecutionService> resume_service,
                      std::shared_ptr<ExecutionServiceFactory> factory, OrchestratorOptions options,
                      DriftHook drift_hook = {});

  [[nodiscard]] common::Result<RestoreOutcome> restore(const RestoreRequest &request,
                                                       SessionContext &context);

  /// Background fallback after the service reports the resume token lost mid-turn. Plans a
  /// replay of the active rollout; sends nothing until proceed() unless unattended replay is on.
  [[nodiscard]] common::Result<RestoreOutcome> on_token_lost(SessionContext &context);

  /// Moves write ownership to the completed replay's rollout and execution context.
  [[nodiscard]] common::Status adopt_replay(ReplayController &controller,
                                            SessionContext &context) const;

private:
  [[nodiscard]] common::Result<RestoreOutcome>
  plan_replay(const std::filesystem::path &path, const rollout::SessionHeader &header,
              const rollout::EffectiveState &state, std::vector<rollout::Item> items,
              const std::filesystem::path &project_root, const std::filesystem::path &cwd,
              RestoreOutcome outcome, SessionContext &context);

  std::shared_ptr<ExecutionService> resume_service_;
  std::shared_ptr<ExecutionServiceFactory> factory_;
  OrchestratorOptions options_;
  DriftHook drift_hook_;
};

/// Appends a state snapshot carrying `token` to the active rollout. A token equal to the last
/// checkpoint is not written again. Fails when the context has no writer.
[[nodiscard]] common::Status on_turn_completed(SessionContext &context, const std::string &token);

/// Polls the bound service for its last completed token and checkpoints it if it is new.
/// Does nothing while no turn has completed.
[[nodiscard]] common::Status sync_checkpoint(SessionContext &context);

/// Seed text for manual continuation.
[[nodiscard]] std::string manual_seed(const std::filesystem::path &rollout_path);

} // namespace carryover::restore
