#pragma once

#include "carryover/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace carryover::rollout {

struct ExecutionConfigSnapshot {
  std::string model;
  std::string reasoning_effort;
  std::string sandbox_policy;

  bool operator==(const ExecutionConfigSnapshot &other) const = default;
};

/// First line of every rollout. Written once, never rewritten.
struct SessionHeader {
  std::string timestamp;
  std::string session_id;
  std::optional<std::string> seed_instructions;
  std::optional<ExecutionConfigSnapshot> execution_config;
  std::optional<std::string> recorded_project_root;
  std::optional<std::string> recorded_cwd;
  // Older logs carry the resume token in the header instead of a state line.
  std::optional<std::string> provider_resume_token;
};

enum class ItemKind {
  Message,
  FunctionCall,
  FunctionCallOutput,
  Reasoning,
};

[[nodiscard]] std::string_view item_kind_name(ItemKind kind);

struct Item {
  ItemKind kind = ItemKind::Message;
  std::string role;
  // Message content parts, or reasoning summary parts.
  std::vector<std::string> parts;
  std::string name;
  std::string arguments;
  std::string call_id;
  std::string output;
  bool success = true;

  [[nodiscard]] static Item message(std::string role, std::string text);
  [[nodiscard]] static Item function_call(std::string name, std::string arguments,
                                          std::string call_id);
  [[nodiscard]] static Item function_output(std::string call_id, std::string output,
                                            bool success);
  [[nodiscard]] static Item reasoning(std::string summary);

  /// Message or reasoning parts concatenated.
  [[nodiscard]] std::string text() const;

  bool operator==(const Item &other) const = default;
};

/// Sparse snapshot; absent fields leave the previous value in place.
struct StateSnapshot {
  std::optional<std::string> provider_resume_token;
  std::optional<std::vector<std::string>> approved_commands;
  std::optional<std::vector<std::string>> available_tools;
};

/// Human-readable line that is persisted but never replayed.
struct Notice {
  std::string text;
};

/// A line of a kind this version does not interpret. Re-encodes byte for byte.
struct UnknownRecord {
  std::string raw;
};

using Record = std::variant<Item, StateSnapshot, Notice, UnknownRecord>;

struct EffectiveState {
  std::optional<std::string> provider_resume_token;
  std::vector<std::string> approved_commands;
  std::vector<std::string> available_tools;

  void apply(const StateSnapshot &snapshot);
};

[[nodiscard]] std::string encode_header_jsonl(const SessionHeader &header);
[[nodiscard]] common::Result<SessionHeader> parse_header_jsonl(const std::string &line);

[[nodiscard]] std::string encode_record_jsonl(const Record &record);
[[nodiscard]] common::Result<Record> parse_record_jsonl(const std::string &line);

/// State folded from the header token and every snapshot in `records`, in order.
[[nodiscard]] EffectiveState latest_state(const SessionHeader &header,
                                          const std::vector<Record> &records);

[[nodiscard]] std::vector<Item> items_of(const std::vector<Record> &records);

} // namespace carryover::rollout
