#include "carryover/rollout/transcript.hpp"

#include "carryover/common/fs.hpp"

#include <cctype>

namespace carryover::rollout {

namespace {

std::string trim_start(const std::string &value) {
  std::size_t pos = 0;
  while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])) != 0) {
    ++pos;
  }
  return value.substr(pos);
}

} // namespace

bool is_seed_message(const Item &item) {
  if (item.kind != ItemKind::Message || item.role != "user") {
    return false;
  }
  const std::string text = trim_start(item.text());
  return common::starts_with(text, "<user_instructions>") ||
         common::starts_with(text, "<environment_context>");
}

std::optional<std::string> render_item(const Item &item) {
  switch (item.kind) {
  case ItemKind::Message: {
    if (item.role != "user" && item.role != "assistant") {
      return std::nullopt;
    }
    const std::string text = item.text();
    if (text.empty() || is_seed_message(item)) {
      return std::nullopt;
    }
    return item.role + ": " + text;
  }
  case ItemKind::FunctionCall: {
    const std::string name = item.name.empty() ? "tool" : item.name;
    const std::string args = item.arguments.empty() ? "{}" : item.arguments;
    return "tool: " + name + " args: " + args;
  }
  case ItemKind::FunctionCallOutput:
    if (item.output.empty()) {
      return std::nullopt;
    }
    return "tool.out: " + item.output;
  case ItemKind::Reasoning:
    return std::nullopt;
  }
  return std::nullopt;
}

std::vector<std::string> render_item_lines(const std::vector<Item> &items) {
  std::vector<std::string> lines;
  lines.reserve(items.size());
  for (const auto &item : items) {
    if (auto line = render_item(item); line.has_value()) {
      lines.push_back(std::move(*line));
    }
  }
  return lines;
}

} // namespace carryover::rollout
