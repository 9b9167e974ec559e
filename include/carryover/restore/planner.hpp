#pragma once

#include "carryover/common/result.hpp"
#include "carryover/rollout/record.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace carryover::restore {

/// Half-open item range [begin, end) sent as one replay transmission.
struct Segment {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::size_t estimated_tokens = 0;

  [[nodiscard]] std::size_t size() const { return end - begin; }
};

using TokenEstimator = std::function<std::size_t(const rollout::Item &)>;

/// ceil(bytes / 4) over message text, function name and arguments, output text and reasoning
/// summary text.
[[nodiscard]] std::size_t approximate_tokens(const rollout::Item &item);

/// Greedy left-to-right split. A segment grows while its estimate stays at or below
/// `max_tokens_per_segment`; an item that alone exceeds the threshold becomes its own segment.
[[nodiscard]] common::Result<std::vector<Segment>>
plan_segments(const std::vector<rollout::Item> &items, std::int64_t max_tokens_per_segment,
              const TokenEstimator &estimate = approximate_tokens);

} // namespace carryover::restore
