#include "carryover/restore/replay.hpp"

#include "carryover/common/fs.hpp"
#include "carryover/observability/global.hpp"

#include <algorithm>

namespace carryover::restore {

namespace {

std::string join(const std::vector<std::string> &values, const std::string &separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += values[i];
  }
  return out;
}

} // namespace

std::string_view replay_state_name(const ReplayState state) {
  switch (state) {
  case ReplayState::Planned:
    return "planned";
  case ReplayState::Sending:
    return "sending";
  case ReplayState::Interrupting:
    return "interrupting";
  case ReplayState::Completed:
    return "completed";
  case ReplayState::Cancelled:
    return "cancelled";
  case ReplayState::Failed:
    return "failed";
  }
  return "failed";
}

std::string render_replay_payload(const std::vector<rollout::Item> &items, const std::size_t begin,
                                  const std::size_t end, const bool with_intro) {
  std::string text;
  if (with_intro) {
    text += RESTORE_INTRO;
  }
  const std::size_t last = std::min(end, items.size());
  for (std::size_t i = begin; i < last; ++i) {
    const auto &item = items[i];
    switch (item.kind) {
    case rollout::ItemKind::Message:
      for (const auto &part : item.parts) {
        text += part;
        text += '\n';
      }
      break;
    case rollout::ItemKind::FunctionCall:
      text += "[tool:" + (item.name.empty() ? std::string("tool") : item.name) + "] ";
      text += item.arguments.empty() ? "{}" : item.arguments;
      text += '\n';
      break;
    case rollout::ItemKind::FunctionCallOutput:
      if (!item.output.empty()) {
        text += item.output;
        text += '\n';
      }
      break;
    case rollout::ItemKind::Reasoning:
      break;
    }
  }
  return text;
}

ReplayController::ReplayController(ReplayPlan plan,
                                   std::shared_ptr<ExecutionServiceFactory> factory,
                                   ReplayTarget target)
    : plan_(std::move(plan)), factory_(std::move(factory)), target_(std::move(target)) {}

bool ReplayController::finished() const {
  return state_ == ReplayState::Completed || state_ == ReplayState::Cancelled ||
         state_ == ReplayState::Failed;
}

std::size_t ReplayController::tokens_planned() const {
  std::size_t total = 0;
  for (const auto &segment : plan_.segments) {
    total += segment.estimated_tokens;
  }
  return total;
}

void ReplayController::add_notice(const std::string &text) {
  notices_.push_back(text);
  observability::record_notice(text);
}

common::Status ReplayController::fail(const common::Status &status) {
  state_ = ReplayState::Failed;
  observability::record_error("replay", status.error());
  if (writer_.has_value()) {
    writer_->close();
  }
  return status;
}

common::Status ReplayController::begin() {
  if (factory_ == nullptr) {
    return common::Status::error(common::ErrorCode::ServiceError, "no execution service factory");
  }
  auto context = factory_->create_context();
  if (!context.ok()) {
    return context.status();
  }
  service_ = context.value();
  if (service_ == nullptr) {
    return common::Status::error(common::ErrorCode::ServiceError,
                                 "execution service factory returned no context");
  }

  current_tools_ = service_->current_tools();
  for (const auto &tool : plan_.source_state.available_tools) {
    if (std::find(current_tools_.begin(), current_tools_.end(), tool) == current_tools_.end()) {
      missing_tools_.push_back(tool);
    }
  }
  if (!missing_tools_.empty()) {
    add_notice("Tools no longer available: " + join(missing_tools_, ", "));
  }
  return common::Status::success();
}

common::Status ReplayController::open_rollout() {
  auto session_id = common::generate_uuid();
  if (!session_id.ok()) {
    return session_id.status();
  }
  rollout::SessionHeader header;
  header.timestamp = common::now_rfc3339();
  header.session_id = std::move(session_id.value());
  header.seed_instructions = plan_.source_header.seed_instructions;
  header.execution_config = target_.execution_config.has_value()
                                ? target_.execution_config
                                : plan_.source_header.execution_config;
  header.recorded_project_root = target_.project_root.has_value()
                                     ? target_.project_root
                                     : plan_.source_header.recorded_project_root;
  header.recorded_cwd = target_.cwd.has_value() ? target_.cwd : plan_.source_header.recorded_cwd;

  const auto path = rollout::rollout_path_for(target_.sessions_dir, header);
  auto writer = rollout::RolloutWriter::create(path, header);
  if (!writer.ok()) {
    return writer.status();
  }
  writer_.emplace(std::move(writer.value()));
  rollout_path_ = path;
  session_id_ = header.session_id;

  const auto &approved = plan_.source_state.approved_commands;
  if (approved.empty() && current_tools_.empty()) {
    return common::Status::success();
  }
  rollout::StateSnapshot imported;
  if (!approved.empty()) {
    imported.approved_commands = approved;
  }
  if (!current_tools_.empty()) {
    imported.available_tools = current_tools_;
  }
  return writer_->append(rollout::Record{std::move(imported)});
}

common::Status ReplayController::proceed() {
  if (state_ == ReplayState::Cancelled) {
    return common::Status::error(common::ErrorCode::Cancelled, "replay was cancelled");
  }
  if (finished()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 std::string("replay already ") +
                                     std::string(replay_state_name(state_)));
  }
  if (cancel_requested_.load()) {
    return finish_cancel(segments_sent_ > 0);
  }
  if (next_index_ >= plan_.segments.size()) {
    return complete();
  }

  const std::size_t index = next_index_;
  if (index == 0) {
    if (auto status = begin(); !status.ok()) {
      return fail(status);
    }
  }

  const auto &segment = plan_.segments[index];
  state_ = ReplayState::Sending;
  const ReplayInput input{
      .text = render_replay_payload(plan_.items, segment.begin, segment.end, index == 0),
      .segment = index,
  };
  if (auto status = service_->send(input); !status.ok()) {
    return fail(status);
  }
  // The new rollout exists only once a segment has actually gone out.
  if (!writer_.has_value()) {
    if (auto status = open_rollout(); !status.ok()) {
      return fail(status);
    }
  }
  // The segment counts as sent even if appending it below fails.
  next_index_ = index + 1;
  ++segments_sent_;
  tokens_sent_ += segment.estimated_tokens;
  progress_percent_ =
      static_cast<std::uint32_t>((segments_sent_ * 100) / plan_.segments.size());

  for (std::size_t i = segment.begin; i < segment.end && i < plan_.items.size(); ++i) {
    if (auto status = writer_->append(rollout::Record{plan_.items[i]}); !status.ok()) {
      return fail(status);
    }
  }
  observability::record_segment_sent(index, plan_.segments.size(), segment.size(),
                                     segment.estimated_tokens);

  state_ = ReplayState::Interrupting;
  if (auto status = service_->interrupt(); !status.ok()) {
    return fail(status);
  }

  if (cancel_requested_.load()) {
    return finish_cancel(segments_sent_ > 0);
  }
  if (next_index_ == plan_.segments.size()) {
    return complete();
  }
  return common::Status::success();
}

common::Status ReplayController::complete() {
  const std::string summary = "Replay complete: " + std::to_string(segments_sent_) + "/" +
                              std::to_string(plan_.segments.size()) + " segments (~" +
                              std::to_string(tokens_sent_) + " tokens).";
  if (service_ != nullptr) {
    // No interrupt after the marker, so the next real input is processed normally.
    if (auto status = service_->send(ReplayInput{.text = RESTORE_END_MARKER, .segment = {}});
        !status.ok()) {
      return fail(status);
    }
  }
  if (writer_.has_value()) {
    if (auto status = writer_->append(rollout::Record{rollout::Notice{.text = summary}});
        !status.ok()) {
      return fail(status);
    }
    if (auto status =
            writer_->append(rollout::Record{rollout::Item::message("user", RESTORE_END_MARKER)});
        !status.ok()) {
      return fail(status);
    }
  }

  progress_percent_ = 100;
  state_ = ReplayState::Completed;
  add_notice(summary);
  observability::record_replay_finished(true, segments_sent_, plan_.segments.size(), tokens_sent_,
                                        rollout_path_.has_value() ? rollout_path_->string() : "");
  return common::Status::success();
}

common::Status ReplayController::cancel() {
  if (state_ == ReplayState::Cancelled) {
    return common::Status::success();
  }
  if (finished()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 std::string("cannot cancel a replay that is ") +
                                     std::string(replay_state_name(state_)));
  }
  return finish_cancel(segments_sent_ > 0);
}

void ReplayController::request_cancel() { cancel_requested_.store(true); }

common::Status ReplayController::finish_cancel(const bool send_interrupt) {
  state_ = ReplayState::Cancelled;
  add_notice(REPLAY_CANCELLED_NOTICE);
  common::Status result = common::Status::success();
  if (send_interrupt && service_ != nullptr) {
    result = service_->interrupt();
  }
  if (writer_.has_value()) {
    if (auto status = writer_->append(rollout::Record{rollout::Notice{
            .text = REPLAY_CANCELLED_NOTICE}});
        !status.ok() && result.ok()) {
      result = status;
    }
    writer_->close();
  }
  observability::record_replay_finished(false, segments_sent_, plan_.segments.size(),
                                        tokens_sent_,
                                        rollout_path_.has_value() ? rollout_path_->string() : "");
  if (!result.ok()) {
    observability::record_error("replay", result.error());
  }
  return result;
}

common::Status ReplayController::run_to_completion() {
  while (!finished()) {
    if (auto status = proceed(); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

std::optional<rollout::RolloutWriter> ReplayController::release_writer() {
  if (state_ != ReplayState::Completed || !writer_.has_value()) {
    return std::nullopt;
  }
  std::optional<rollout::RolloutWriter> out = std::move(writer_);
  writer_.reset();
  return out;
}

} // namespace carryover::restore
