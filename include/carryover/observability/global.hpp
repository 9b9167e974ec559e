#pragma once

#include "carryover/observability/observer.hpp"

#include <memory>

namespace carryover::observability {

/// Replaces the process-wide observer; the previous one is flushed. nullptr disables recording.
void set_global_observer(std::unique_ptr<IObserver> observer);
/// Borrowed pointer, valid only until the next set_global_observer call.
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_restore_start(const std::string &mode, const std::string &rollout_path);
void record_handshake(const std::string &outcome, const std::string &reason,
                      std::chrono::milliseconds duration);
void record_segment_sent(std::size_t index, std::size_t total, std::size_t items,
                         std::size_t estimated_tokens);
void record_replay_finished(bool completed, std::size_t segments_sent, std::size_t total_segments,
                            std::size_t tokens_sent, const std::string &rollout_path);
void record_rollout_skipped(const std::string &path, const std::string &reason);
void record_notice(const std::string &text);
void record_error(const std::string &component, const std::string &message);

} // namespace carryover::observability
