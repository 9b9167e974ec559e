#pragma once

#include "carryover/observability/observer.hpp"

#include <memory>
#include <vector>

namespace carryover::observability {

/// Installed when observability.backend is "none"; discards everything.
class NullObserver final : public IObserver {
public:
  void record_event(const ObserverEvent & /*event*/) override {}
  void record_metric(const ObserverMetric & /*metric*/) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

/// Forwards each event and metric to every child in insertion order. Null children are dropped.
class CompositeObserver final : public IObserver {
public:
  CompositeObserver() = default;
  explicit CompositeObserver(std::vector<std::unique_ptr<IObserver>> children);

  void attach(std::unique_ptr<IObserver> child);
  [[nodiscard]] std::size_t size() const { return children_.size(); }

  // Hands back the sole child when only one is attached, else nullptr.
  [[nodiscard]] std::unique_ptr<IObserver> release_single();

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "composite"; }

private:
  std::vector<std::unique_ptr<IObserver>> children_;
};

} // namespace carryover::observability
