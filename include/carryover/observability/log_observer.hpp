#pragma once

#include "carryover/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace carryover::observability {

/// Writes one "[LEVEL] key=value" line per event to a stream (stderr by default).
/// DEBUG lines are dropped unless `verbose` is set.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out, bool verbose = false);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool verbose_ = false;
  std::mutex mutex_;
};

} // namespace carryover::observability
