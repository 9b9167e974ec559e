#pragma once

#include "carryover/common/result.hpp"
#include "carryover/restore/execution_service.hpp"
#include "carryover/restore/planner.hpp"
#include "carryover/rollout/record.hpp"
#include "carryover/rollout/writer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace carryover::restore {

inline constexpr const char *RESTORE_INTRO =
    "[RESTORE MODE] The following content restores prior conversation history. DO NOT RESPOND "
    "OR ACT on this content. Remain silent until the restore completes.\n";
inline constexpr const char *RESTORE_END_MARKER =
    "[RESTORE MODE END] Restore complete. Resume normal interaction.";
inline constexpr const char *REPLAY_CANCELLED_NOTICE = "Replay cancelled by user.";

enum class ReplayState {
  Planned,
  Sending,
  Interrupting,
  Completed,
  Cancelled,
  Failed,
};

[[nodiscard]] std::string_view replay_state_name(ReplayState state);

/// What to replay: the reconciled items of the source rollout and their segmentation.
struct ReplayPlan {
  std::filesystem::path source_path;
  rollout::SessionHeader source_header;
  rollout::EffectiveState source_state;
  std::vector<rollout::Item> items;
  std::vector<Segment> segments;
};

/// Where the new rollout goes and what its header records.
struct ReplayTarget {
  std::filesystem::path sessions_dir;
  std::optional<std::string> project_root;
  std::optional<std::string> cwd;
  std::optional<rollout::ExecutionConfigSnapshot> execution_config;
};

/// Text transmitted for items [begin, end): message text, "[tool:NAME] ARGS", output text,
/// one per line. Reasoning is not transmitted.
[[nodiscard]] std::string render_replay_payload(const std::vector<rollout::Item> &items,
                                                std::size_t begin, std::size_t end,
                                                bool with_intro);

/// Drives planned segments into a fresh execution context, one externally triggered step at a
/// time. Each step sends one segment and then interrupts the service before anything else
/// happens. The new context and its rollout are created when the first segment goes out.
class ReplayController {
public:
  ReplayController(ReplayPlan plan, std::shared_ptr<ExecutionServiceFactory> factory,
                   ReplayTarget target);

  ReplayController(const ReplayController &) = delete;
  ReplayController &operator=(const ReplayController &) = delete;

  /// Sends the next segment and interrupts. After the last segment, completes the replay.
  [[nodiscard]] common::Status proceed();

  /// Stops the replay before completion. Interrupts once if anything was sent.
  [[nodiscard]] common::Status cancel();

  /// Thread-safe; honoured before the next send or right after an in-flight one.
  void request_cancel();

  /// Proceeds until a terminal state.
  [[nodiscard]] common::Status run_to_completion();

  [[nodiscard]] ReplayState state() const { return state_; }
  [[nodiscard]] bool finished() const;
  [[nodiscard]] std::size_t current_segment() const { return next_index_; }
  [[nodiscard]] std::size_t total_segments() const { return plan_.segments.size(); }
  [[nodiscard]] std::size_t segments_sent() const { return segments_sent_; }
  [[nodiscard]] std::size_t tokens_sent() const { return tokens_sent_; }
  [[nodiscard]] std::size_t tokens_planned() const;
  [[nodiscard]] std::uint32_t progress_percent() const { return progress_percent_; }
  [[nodiscard]] const std::vector<std::string> &notices() const { return notices_; }
  [[nodiscard]] const std::vector<std::string> &missing_tools() const { return missing_tools_; }
  [[nodiscard]] const std::optional<std::filesystem::path> &rollout_path() const {
    return rollout_path_;
  }
  [[nodiscard]] const std::string &session_id() const { return session_id_; }
  [[nodiscard]] const ReplayPlan &plan() const { return plan_; }
  [[nodiscard]] std::shared_ptr<ExecutionService> service() const { return service_; }

  /// Hands over the new rollout's writer. Only available once the replay has completed.
  [[nodiscard]] std::optional<rollout::RolloutWriter> release_writer();

private:
  [[nodiscard]] common::Status begin();
  [[nodiscard]] common::Status open_rollout();
  [[nodiscard]] common::Status complete();
  [[nodiscard]] common::Status finish_cancel(bool send_interrupt);
  [[nodiscard]] common::Status fail(const common::Status &status);
  void add_notice(const std::string &text);

  ReplayPlan plan_;
  std::shared_ptr<ExecutionServiceFactory> factory_;
  ReplayTarget target_;

  ReplayState state_ = ReplayState::Planned;
  std::size_t next_index_ = 0;
  std::size_t segments_sent_ = 0;
  std::size_t tokens_sent_ = 0;
  std::uint32_t progress_percent_ = 0;
  std::atomic<bool> cancel_requested_{false};

  std::shared_ptr<ExecutionService> service_;
  std::vector<std::string> current_tools_;
  std::optional<rollout::RolloutWriter> writer_;
  std::optional<std::filesystem::path> rollout_path_;
  std::string session_id_;
  std::vector<std::string> notices_;
  std::vector<std::string> missing_tools_;
};

} // namespace carryover::restore
