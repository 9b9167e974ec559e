#include "carryover/restore/planner.hpp"

namespace carryover::restore {

std::size_t approximate_tokens(const rollout::Item &item) {
  std::size_t chars = 0;
  switch (item.kind) {
  case rollout::ItemKind::Message:
  case rollout::ItemKind::Reasoning:
    for (const auto &part : item.parts) {
      chars += part.size();
    }
    break;
  case rollout::ItemKind::FunctionCall:
    chars += item.name.size() + item.arguments.size();
    break;
  case rollout::ItemKind::FunctionCallOutput:
    chars += item.output.size();
    break;
  }
  return (chars + 3) / 4;
}

common::Result<std::vector<Segment>> plan_segments(const std::vector<rollout::Item> &items,
                                                   const std::int64_t max_tokens_per_segment,
                                                   const TokenEstimator &estimate) {
  if (max_tokens_per_segment <= 0) {
    return common::Result<std::vector<Segment>>::failure(
        common::ErrorCode::InvalidConfig, "max_tokens_per_segment must be positive");
  }
  const auto limit = static_cast<std::size_t>(max_tokens_per_segment);

  std::vector<Segment> segments;
  Segment current;
  for (std::size_t i = 0; i < items.size(); ++i) {
    const std::size_t cost = estimate(items[i]);
    if (current.size() > 0 && current.estimated_tokens + cost > limit) {
      segments.push_back(current);
      current = Segment{.begin = i, .end = i, .estimated_tokens = 0};
    }
    current.end = i + 1;
    current.estimated_tokens += cost;
    if (cost > limit) {
      // Oversized item: emitted alone so planning always makes progress.
      segments.push_back(current);
      current = Segment{.begin = i + 1, .end = i + 1, .estimated_tokens = 0};
    }
  }
  if (current.size() > 0) {
    segments.push_back(current);
  }
  return common::Result<std::vector<Segment>>::success(std::move(segments));
}

} // namespace carryover::restore
