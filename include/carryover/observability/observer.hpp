#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace carryover::observability {

struct RestoreStartEvent {
  std::string mode;
  std::string rollout_path;
};

struct HandshakeEvent {
  std::string outcome;
  std::string reason;
  std::chrono::milliseconds duration{0};
};

struct SegmentSentEvent {
  std::size_t index = 0;
  std::size_t total = 0;
  std::size_t items = 0;
  std::size_t estimated_tokens = 0;
};

struct ReplayFinishedEvent {
  bool completed = false;
  std::size_t segments_sent = 0;
  std::size_t total_segments = 0;
  std::size_t tokens_sent = 0;
  std::string rollout_path;
};

struct RolloutSkippedEvent {
  std::string path;
  std::string reason;
};

struct NoticeEvent {
  std::string text;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<RestoreStartEvent, HandshakeEvent, SegmentSentEvent, ReplayFinishedEvent,
                 RolloutSkippedEvent, NoticeEvent, ErrorEvent>;

struct HandshakeLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ReplayTokensMetric {
  std::uint64_t tokens = 0;
};

struct ReplayProgressMetric {
  std::uint32_t percent = 0;
};

using ObserverMetric =
    std::variant<HandshakeLatencyMetric, ReplayTokensMetric, ReplayProgressMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace carryover::observability
