#include "carryover/restore/orchestrator.hpp"

#include "carryover/common/fs.hpp"
#include "carryover/observability/global.hpp"
#include "carryover/restore/planner.hpp"
#include "carryover/restore/project_scope.hpp"
#include "carryover/restore/reconciler.hpp"
#include "carryover/rollout/reader.hpp"

#include <chrono>

namespace carryover::restore {

namespace {

std::filesystem::path effective_cwd(const std::filesystem::path &cwd) {
  if (!cwd.empty()) {
    return cwd;
  }
  std::error_code ec;
  auto current = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path(".") : current;
}

void add_notice(RestoreOutcome &outcome, const std::string &text) {
  outcome.notices.push_back(text);
  observability::record_notice(text);
}

} // namespace

std::string_view restore_mode_name(const RestoreMode mode) {
  switch (mode) {
  case RestoreMode::Auto:
    return "auto";
  case RestoreMode::ServerResume:
    return "server";
  case RestoreMode::Replay:
    return "replay";
  case RestoreMode::Manual:
    return "manual";
  }
  return "auto";
}

std::optional<RestoreMode> parse_restore_mode(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "auto") {
    return RestoreMode::Auto;
  }
  if (normalized == "server" || normalized == "resume") {
    return RestoreMode::ServerResume;
  }
  if (normalized == "replay") {
    return RestoreMode::Replay;
  }
  if (normalized == "manual") {
    return RestoreMode::Manual;
  }
  return std::nullopt;
}

std::string_view restore_kind_name(const RestoreKind kind) {
  switch (kind) {
  case RestoreKind::ServerResumed:
    return "server_resumed";
  case RestoreKind::ReplayPending:
    return "replay_pending";
  case RestoreKind::ReplayCompleted:
    return "replay_completed";
  case RestoreKind::ReplayCancelled:
    return "replay_cancelled";
  case RestoreKind::ResumeUnavailable:
    return "resume_unavailable";
  case RestoreKind::Manual:
    return "manual";
  case RestoreKind::Skipped:
    return "skipped";
  }
  return "skipped";
}

std::string manual_seed(const std::filesystem::path &rollout_path) {
  return "Restore this session: " + rollout_path.string();
}

OrchestratorOptions OrchestratorOptions::from_config(const config::Config &config,
                                                     const std::filesystem::path &sessions_dir) {
  OrchestratorOptions options;
  options.restore = config.restore;
  options.markers = config.project.markers;
  options.sessions_dir = sessions_dir;
  options.current_execution = rollout::ExecutionConfigSnapshot{
      .model = config.execution.model,
      .reasoning_effort = config.execution.reasoning_effort,
      .sandbox_policy = config.execution.sandbox_policy,
  };
  return options;
}

RestoreOrchestrator::RestoreOrchestrator(std::shared_ptr<ExecutionService> resume_service,
                                         std::shared_ptr<ExecutionServiceFactory> factory,
                                         OrchestratorOptions options, DriftHook drift_hook)
    : resume_service_(std::move(resume_service)), factory_(std::move(factory)),
      options_(std::move(options)), drift_hook_(std::move(drift_hook)) {}

common::Result<RestoreOutcome> RestoreOrchestrator::restore(const RestoreRequest &request,
                                                            SessionContext &context) {
  observability::record_restore_start(std::string(restore_mode_name(request.mode)),
                                      request.rollout_path.string());

  RestoreOutcome outcome;
  outcome.execution_config = options_.current_execution;
  if (request.mode == RestoreMode::Manual) {
    outcome.kind = RestoreKind::Manual;
    outcome.seed = manual_seed(request.rollout_path);
    return common::Result<RestoreOutcome>::success(std::move(outcome));
  }

  auto loaded = rollout::read_rollout(request.rollout_path);
  if (!loaded.ok()) {
    observability::record_error("restore", loaded.error());
    return common::Result<RestoreOutcome>::failure(loaded.status());
  }
  auto &source = loaded.value();
  if (source.skipped_lines > 0) {
    add_notice(outcome, "Skipped " + std::to_string(source.skipped_lines) +
                            " unreadable line(s) in " + request.rollout_path.string());
  }

  const auto cwd = effective_cwd(request.cwd);
  const auto project_root = resolve_project_root(cwd, options_.markers);
  if (source.header.recorded_project_root.has_value() &&
      !in_scope(source.header.recorded_project_root, project_root, false)) {
    add_notice(outcome,
               "Session belongs to another project: " + *source.header.recorded_project_root);
  }

  if (!options_.restore.interactive && source.header.execution_config.has_value() &&
      *source.header.execution_config != options_.current_execution) {
    const DriftDecision decision =
        drift_hook_ ? drift_hook_(*source.header.execution_config, options_.current_execution)
                    : DriftDecision::KeepCurrent;
    outcome.drift_decision = decision;
    if (decision == DriftDecision::ApplyRecorded) {
      outcome.execution_config = *source.header.execution_config;
    }
  }

  const auto original_items = source.items();
  auto items = reconcile(original_items);
  outcome.synthesized_results = items.size() - original_items.size();

  if (request.mode != RestoreMode::Replay) {
    const auto timeout = std::chrono::milliseconds(options_.restore.handshake_timeout_ms);
    outcome.handshake =
        ResumeHandshake(resume_service_, timeout).run(source.state.provider_resume_token);

    if (outcome.handshake.is_confirmed()) {
      auto writer = rollout::RolloutWriter::open_existing(request.rollout_path);
      if (!writer.ok()) {
        return common::Result<RestoreOutcome>::failure(writer.status());
      }
      // Results synthesized for interrupted calls become part of the continuing log.
      for (std::size_t i = original_items.size(); i < items.size(); ++i) {
        if (auto status = writer.value().append(rollout::Record{items[i]}); !status.ok()) {
          return common::Result<RestoreOutcome>::failure(status);
        }
      }
      if (context.writer.has_value()) {
        context.writer->close();
      }
      context.writer.emplace(std::move(writer.value()));
      context.session_id = source.header.session_id;
      context.rollout_path = request.rollout_path;
      context.service = resume_service_;
      context.checkpointed_token = source.state.provider_resume_token;
      outcome.kind = RestoreKind::ServerResumed;
      add_notice(outcome, handshake_notice(outcome.handshake));
      return common::Result<RestoreOutcome>::success(std::move(outcome));
    }

    add_notice(outcome, handshake_notice(outcome.handshake));
    if (request.mode == RestoreMode::ServerResume) {
      outcome.kind = RestoreKind::ResumeUnavailable;
      outcome.status = outcome.handshake.status();
      return common::Result<RestoreOutcome>::success(std::move(outcome));
    }
  }

  return plan_replay(request.rollout_path, source.header, source.state, std::move(items),
                     project_root, cwd, std::move(outcome), context);
}

common::Result<RestoreOutcome> RestoreOrchestrator::on_token_lost(SessionContext &context) {
  RestoreOutcome outcome;
  outcome.execution_config = options_.current_execution;
  if (!options_.restore.auto_fallback) {
    outcome.kind = RestoreKind::Skipped;
    add_notice(outcome, "Resume token lost; automatic fallback is disabled.");
    return common::Result<RestoreOutcome>::success(std::move(outcome));
  }
  if (context.rollout_path.empty()) {
    return common::Result<RestoreOutcome>::failure(common::ErrorCode::InvalidArgument,
                                                   "no active rollout to fall back from");
  }

  observability::record_restore_start("fallback", context.rollout_path.string());
  auto loaded = rollout::read_rollout(context.rollout_path);
  if (!loaded.ok()) {
    observability::record_error("restore", loaded.error());
    return common::Result<RestoreOutcome>::failure(loaded.status());
  }
  auto &source = loaded.value();

  const auto original_items = source.items();
  auto items = reconcile(original_items);
  outcome.synthesized_results = items.size() - original_items.size();
  outcome.handshake = HandshakeResult::rejected("token lost");
  add_notice(outcome, "Resume token lost mid-turn; replay from the rollout log is prepared.");

  const auto cwd = source.header.recorded_cwd.has_value()
                       ? std::filesystem::path(*source.header.recorded_cwd)
                       : effective_cwd({});
  const auto project_root = source.header.recorded_project_root.has_value()
                                ? std::filesystem::path(*source.header.recorded_project_root)
                                : resolve_project_root(cwd, options_.markers);
  return plan_replay(context.rollout_path, source.header, source.state, std::move(items),
                     project_root, cwd, std::move(outcome), context);
}

common::Result<RestoreOutcome>
RestoreOrchestrator::plan_replay(const std::filesystem::path &path,
                                 const rollout::SessionHeader &header,
                                 const rollout::EffectiveState &state,
                                 std::vector<rollout::Item> items,
                                 const std::filesystem::path &project_root,
                                 const std::filesystem::path &cwd, RestoreOutcome outcome,
                                 SessionContext &context) {
  auto segments = plan_segments(items, options_.restore.max_tokens_per_segment);
  if (!segments.ok()) {
    return common::Result<RestoreOutcome>::failure(segments.status());
  }

  ReplayPlan plan{
      .source_path = path,
      .source_header = header,
      .source_state = state,
      .items = std::move(items),
      .segments = std::move(segments.value()),
  };
  ReplayTarget target{
      .sessions_dir = options_.sessions_dir,
      .project_root = project_root.string(),
      .cwd = cwd.string(),
      .execution_config = outcome.execution_config,
  };
  outcome.replay =
      std::make_unique<ReplayController>(std::move(plan), factory_, std::move(target));
  outcome.kind = RestoreKind::ReplayPending;

  if (!options_.restore.unattended_replay) {
    return common::Result<RestoreOutcome>::success(std::move(outcome));
  }

  if (auto status = outcome.replay->run_to_completion(); !status.ok()) {
    return common::Result<RestoreOutcome>::failure(status);
  }
  if (outcome.replay->state() == ReplayState::Cancelled) {
    outcome.kind = RestoreKind::ReplayCancelled;
    outcome.status = common::Status::error(common::ErrorCode::Cancelled, "replay cancelled");
    return common::Result<RestoreOutcome>::success(std::move(outcome));
  }
  if (auto status = adopt_replay(*outcome.replay, context); !status.ok()) {
    return common::Result<RestoreOutcome>::failure(status);
  }
  outcome.kind = RestoreKind::ReplayCompleted;
  return common::Result<RestoreOutcome>::success(std::move(outcome));
}

common::Status RestoreOrchestrator::adopt_replay(ReplayController &controller,
                                                 SessionContext &context) const {
  if (controller.state() != ReplayState::Completed) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "replay has not completed");
  }
  auto writer = controller.release_writer();
  if (!writer.has_value()) {
    // Nothing was replayed; the active rollout stays in charge.
    return common::Status::success();
  }
  if (context.writer.has_value()) {
    context.writer->close();
  }
  context.rollout_path = writer->path();
  context.session_id = writer->header().session_id;
  context.writer = std::move(writer);
  context.service = controller.service();
  context.checkpointed_token.reset();
  return common::Status::success();
}

common::Status on_turn_completed(SessionContext &context, const std::string &token) {
  if (token.empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "empty resume token");
  }
  if (!context.writer.has_value()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "no active rollout to checkpoint");
  }
  if (context.checkpointed_token == token) {
    return common::Status::success();
  }
  if (auto status = context.writer->append_checkpoint(token); !status.ok()) {
    return status;
  }
  context.checkpointed_token = token;
  return common::Status::success();
}

common::Status sync_checkpoint(SessionContext &context) {
  if (context.service == nullptr) {
    return common::Status::success();
  }
  const auto token = context.service->last_completed_token();
  if (!token.has_value() || token->empty()) {
    return common::Status::success();
  }
  return on_turn_completed(context, *token);
}

} // namespace carryover::restore
