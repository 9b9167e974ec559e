#include "carryover/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace carryover::observability {

namespace {

std::string quoted(const std::string &value) {
  if (value.find(' ') == std::string::npos && !value.empty()) {
    return value;
  }
  return "\"" + value + "\"";
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RestoreStartEvent>) {
          log_line("INFO", "restore.start mode=" + evt.mode + " rollout=" +
                               quoted(evt.rollout_path));
        } else if constexpr (std::is_same_v<T, HandshakeEvent>) {
          std::string line = "restore.handshake outcome=" + evt.outcome +
                             " duration_ms=" + std::to_string(evt.duration.count());
          if (!evt.reason.empty()) {
            line += " reason=" + quoted(evt.reason);
          }
          log_line(evt.outcome == "confirmed" ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, SegmentSentEvent>) {
          log_line("DEBUG", "replay.segment index=" + std::to_string(evt.index + 1) + "/" +
                                std::to_string(evt.total) + " items=" +
                                std::to_string(evt.items) +
                                " tokens=" + std::to_string(evt.estimated_tokens));
        } else if constexpr (std::is_same_v<T, ReplayFinishedEvent>) {
          log_line("INFO", std::string("replay.") + (evt.completed ? "completed" : "cancelled") +
                               " segments=" + std::to_string(evt.segments_sent) + "/" +
                               std::to_string(evt.total_segments) +
                               " tokens=" + std::to_string(evt.tokens_sent) +
                               " rollout=" + quoted(evt.rollout_path));
        } else if constexpr (std::is_same_v<T, RolloutSkippedEvent>) {
          log_line("DEBUG", "catalog.skip path=" + quoted(evt.path) + " reason=" +
                                quoted(evt.reason));
        } else if constexpr (std::is_same_v<T, NoticeEvent>) {
          log_line("INFO", "notice " + evt.text);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, HandshakeLatencyMetric>) {
          log_line("DEBUG", "metric.handshake_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ReplayTokensMetric>) {
          log_line("DEBUG", "metric.replay_tokens=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, ReplayProgressMetric>) {
          log_line("DEBUG", "metric.replay_progress_pct=" + std::to_string(m.percent));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace carryover::observability
