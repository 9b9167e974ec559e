#pragma once

#include "carryover/rollout/record.hpp"

#include <string>
#include <vector>

namespace carryover::restore {

/// Output text given to calls that never received a result.
inline constexpr const char *ABORTED_OUTPUT = "aborted";

/// Call ids with no matching function_call_output, in call order.
[[nodiscard]] std::vector<std::string> pending_calls(const std::vector<rollout::Item> &items);

/// Appends an unsuccessful "aborted" result after the last item for every pending call.
/// Idempotent; a sequence without pending calls is returned unchanged.
[[nodiscard]] std::vector<rollout::Item> reconcile(std::vector<rollout::Item> items);

} // namespace carryover::restore
