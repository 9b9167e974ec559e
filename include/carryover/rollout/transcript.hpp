#pragma once

#include "carryover/rollout/record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace carryover::rollout {

/// True for synthetic user messages that seed a session (instructions, environment context).
[[nodiscard]] bool is_seed_message(const Item &item);

/// Plain-text line for one item, or nullopt when the item is not shown (seed messages,
/// reasoning, empty text, roles other than user/assistant).
[[nodiscard]] std::optional<std::string> render_item(const Item &item);

/// Lines such as "user: ...", "assistant: ...", "tool: NAME args: ARGS", "tool.out: TEXT".
[[nodiscard]] std::vector<std::string> render_item_lines(const std::vector<Item> &items);

} // namespace carryover::rollout
