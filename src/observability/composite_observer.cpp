#include "carryover/observability/composite_observer.hpp"

namespace carryover::observability {

CompositeObserver::CompositeObserver(std::vector<std::unique_ptr<IObserver>> children) {
  for (auto &child : children) {
    attach(std::move(child));
  }
}

void CompositeObserver::attach(std::unique_ptr<IObserver> child) {
  if (child == nullptr || dynamic_cast<NullObserver *>(child.get()) != nullptr) {
    return;
  }
  children_.push_back(std::move(child));
}

std::unique_ptr<IObserver> CompositeObserver::release_single() {
  if (children_.size() != 1) {
    return nullptr;
  }
  auto child = std::move(children_.front());
  children_.clear();
  return child;
}

void CompositeObserver::record_event(const ObserverEvent &event) {
  for (const auto &child : children_) {
    child->record_event(event);
  }
}

void CompositeObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &child : children_) {
    child->record_metric(metric);
  }
}

void CompositeObserver::flush() {
  for (const auto &child : children_) {
    child->flush();
  }
}

} // namespace carryover::observability
