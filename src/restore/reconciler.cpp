#include "carryover/restore/reconciler.hpp"

#include <unordered_map>

namespace carryover::restore {

std::vector<std::string> pending_calls(const std::vector<rollout::Item> &items) {
  std::vector<std::string> order;
  std::unordered_map<std::string, bool> awaiting;
  for (const auto &item : items) {
    if (item.kind == rollout::ItemKind::FunctionCall) {
      const auto [it, inserted] = awaiting.emplace(item.call_id, true);
      if (inserted) {
        order.push_back(item.call_id);
      } else {
        it->second = true;
      }
    } else if (item.kind == rollout::ItemKind::FunctionCallOutput) {
      if (const auto it = awaiting.find(item.call_id); it != awaiting.end()) {
        it->second = false;
      }
    }
  }

  std::vector<std::string> pending;
  for (const auto &call_id : order) {
    if (awaiting[call_id]) {
      pending.push_back(call_id);
    }
  }
  return pending;
}

std::vector<rollout::Item> reconcile(std::vector<rollout::Item> items) {
  const auto pending = pending_calls(items);
  items.reserve(items.size() + pending.size());
  for (const auto &call_id : pending) {
    items.push_back(rollout::Item::function_output(call_id, ABORTED_OUTPUT, false));
  }
  return items;
}

} // namespace carryover::restore
