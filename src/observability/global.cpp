#include "carryover/observability/global.hpp"

#include <mutex>
#include <utility>

namespace carryover::observability {

namespace {

std::mutex g_observer_mutex;
// Recorders hold their own reference for the duration of a call.
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::exchange(g_observer, std::shared_ptr<IObserver>(std::move(observer)));
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

IObserver *get_global_observer() { return current_observer().get(); }

void record_event(const ObserverEvent &event) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_restore_start(const std::string &mode, const std::string &rollout_path) {
  record_event(RestoreStartEvent{.mode = mode, .rollout_path = rollout_path});
}

void record_handshake(const std::string &outcome, const std::string &reason,
                      const std::chrono::milliseconds duration) {
  record_event(HandshakeEvent{.outcome = outcome, .reason = reason, .duration = duration});
  record_metric(HandshakeLatencyMetric{.latency = duration});
}

void record_segment_sent(const std::size_t index, const std::size_t total, const std::size_t items,
                         const std::size_t estimated_tokens) {
  record_event(SegmentSentEvent{
      .index = index, .total = total, .items = items, .estimated_tokens = estimated_tokens});
  if (total > 0) {
    record_metric(
        ReplayProgressMetric{.percent = static_cast<std::uint32_t>(((index + 1) * 100) / total)});
  }
}

void record_replay_finished(const bool completed, const std::size_t segments_sent,
                            const std::size_t total_segments, const std::size_t tokens_sent,
                            const std::string &rollout_path) {
  record_event(ReplayFinishedEvent{.completed = completed,
                                   .segments_sent = segments_sent,
                                   .total_segments = total_segments,
                                   .tokens_sent = tokens_sent,
                                   .rollout_path = rollout_path});
  record_metric(ReplayTokensMetric{.tokens = tokens_sent});
}

void record_rollout_skipped(const std::string &path, const std::string &reason) {
  record_event(RolloutSkippedEvent{.path = path, .reason = reason});
}

void record_notice(const std::string &text) { record_event(NoticeEvent{.text = text}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace carryover::observability
