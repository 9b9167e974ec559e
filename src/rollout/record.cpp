#include "carryover/rollout/record.hpp"

#include "carryover/common/json_util.hpp"

#include <sstream>
#include <type_traits>

namespace carryover::rollout {

namespace {

using common::json_quote;

constexpr const char *STATE_TAG = "state";
constexpr const char *NOTICE_TAG = "notice";

std::optional<std::string> optional_string(const common::JsonObject &object,
                                           const std::string &key) {
  const auto *field = common::json_find(object, key);
  if (field == nullptr || !field->is_string()) {
    return std::nullopt;
  }
  return field->text;
}

std::optional<std::vector<std::string>> optional_string_array(const common::JsonObject &object,
                                                              const std::string &key) {
  const auto *field = common::json_find(object, key);
  if (field == nullptr || field->kind != common::JsonKind::Array) {
    return std::nullopt;
  }
  return common::json_string_array(object, key);
}

// Collects the "text" member of every object element of an array value.
std::vector<std::string> text_parts(const common::JsonField &field) {
  std::vector<std::string> parts;
  const auto elements = common::json_parse_array(field.raw);
  if (!elements.has_value()) {
    return parts;
  }
  for (const auto &element : *elements) {
    if (element.is_string()) {
      parts.push_back(element.text);
      continue;
    }
    if (element.kind != common::JsonKind::Object) {
      continue;
    }
    const auto part = common::json_parse_object(element.raw);
    if (!part.has_value()) {
      continue;
    }
    if (const auto text = optional_string(*part, "text"); text.has_value()) {
      parts.push_back(*text);
    }
  }
  return parts;
}

std::string concat_parts(const std::vector<std::string> &parts) {
  std::string out;
  for (const auto &part : parts) {
    out += part;
  }
  return out;
}

// Accepts the written shape {"content":..,"success":..} as well as a bare string, an array of
// {text} parts, or an object carrying "output_text".
void read_output(const common::JsonObject &object, Item &item) {
  const auto *field = common::json_find(object, "output");
  if (field == nullptr) {
    item.output = common::json_string(object, "output_text");
    return;
  }
  switch (field->kind) {
  case common::JsonKind::String:
    item.output = field->text;
    return;
  case common::JsonKind::Array:
    item.output = concat_parts(text_parts(*field));
    return;
  case common::JsonKind::Object: {
    const auto output = common::json_parse_object(field->raw);
    if (!output.has_value()) {
      return;
    }
    const auto *content = common::json_find(*output, "content");
    if (content != nullptr && content->is_string()) {
      item.output = content->text;
    } else if (content != nullptr && content->kind == common::JsonKind::Array) {
      item.output = concat_parts(text_parts(*content));
    } else {
      item.output = common::json_string(*output, "output_text");
    }
    if (const auto *success = common::json_find(*output, "success");
        success != nullptr && success->kind == common::JsonKind::Bool) {
      item.success = success->is_true();
    }
    return;
  }
  default:
    return;
  }
}

std::optional<Item> parse_item(const common::JsonObject &object, const std::string &type) {
  Item item;
  if (type == "message") {
    item.kind = ItemKind::Message;
    item.role = common::json_string(object, "role");
    if (item.role.empty()) {
      return std::nullopt;
    }
    const auto *content = common::json_find(object, "content");
    if (content != nullptr && content->is_string()) {
      item.parts.push_back(content->text);
    } else if (content != nullptr && content->kind == common::JsonKind::Array) {
      item.parts = text_parts(*content);
    }
    return item;
  }
  if (type == "function_call") {
    item.kind = ItemKind::FunctionCall;
    item.name = common::json_string(object, "name");
    item.call_id = common::json_string(object, "call_id");
    const auto *arguments = common::json_find(object, "arguments");
    if (arguments != nullptr) {
      item.arguments = arguments->is_string() ? arguments->text : arguments->raw;
    }
    if (item.call_id.empty()) {
      return std::nullopt;
    }
    return item;
  }
  if (type == "function_call_output") {
    item.kind = ItemKind::FunctionCallOutput;
    item.call_id = common::json_string(object, "call_id");
    if (item.call_id.empty()) {
      return std::nullopt;
    }
    read_output(object, item);
    return item;
  }
  if (type == "reasoning") {
    item.kind = ItemKind::Reasoning;
    if (const auto *summary = common::json_find(object, "summary");
        summary != nullptr && summary->kind == common::JsonKind::Array) {
      item.parts = text_parts(*summary);
    }
    return item;
  }
  return std::nullopt;
}

std::string encode_item(const Item &item) {
  std::ostringstream out;
  switch (item.kind) {
  case ItemKind::Message: {
    const char *part_type = item.role == "assistant" ? "output_text" : "input_text";
    out << "{\"type\":\"message\",\"role\":" << json_quote(item.role) << ",\"content\":[";
    for (std::size_t i = 0; i < item.parts.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      out << "{\"type\":\"" << part_type << "\",\"text\":" << json_quote(item.parts[i]) << "}";
    }
    out << "]}";
    break;
  }
  case ItemKind::FunctionCall:
    out << "{\"type\":\"function_call\",\"name\":" << json_quote(item.name)
        << ",\"arguments\":" << json_quote(item.arguments)
        << ",\"call_id\":" << json_quote(item.call_id) << "}";
    break;
  case ItemKind::FunctionCallOutput:
    out << "{\"type\":\"function_call_output\",\"call_id\":" << json_quote(item.call_id)
        << ",\"output\":{\"content\":" << json_quote(item.output)
        << ",\"success\":" << (item.success ? "true" : "false") << "}}";
    break;
  case ItemKind::Reasoning:
    out << "{\"type\":\"reasoning\",\"summary\":[";
    for (std::size_t i = 0; i < item.parts.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      out << "{\"type\":\"summary_text\",\"text\":" << json_quote(item.parts[i]) << "}";
    }
    out << "]}";
    break;
  }
  return out.str();
}

std::string encode_state(const StateSnapshot &state) {
  std::ostringstream out;
  out << "{\"record_type\":\"" << STATE_TAG << "\"";
  if (state.provider_resume_token.has_value()) {
    out << ",\"provider_resume_token\":" << json_quote(*state.provider_resume_token);
  }
  if (state.approved_commands.has_value()) {
    out << ",\"approved_commands\":" << common::json_encode_string_array(*state.approved_commands);
  }
  if (state.available_tools.has_value()) {
    out << ",\"available_tools\":" << common::json_encode_string_array(*state.available_tools);
  }
  out << "}";
  return out.str();
}

} // namespace

std::string_view item_kind_name(const ItemKind kind) {
  switch (kind) {
  case ItemKind::Message:
    return "message";
  case ItemKind::FunctionCall:
    return "function_call";
  case ItemKind::FunctionCallOutput:
    return "function_call_output";
  case ItemKind::Reasoning:
    return "reasoning";
  }
  return "message";
}

Item Item::message(std::string role, std::string text) {
  Item item;
  item.kind = ItemKind::Message;
  item.role = std::move(role);
  item.parts.push_back(std::move(text));
  return item;
}

Item Item::function_call(std::string name, std::string arguments, std::string call_id) {
  Item item;
  item.kind = ItemKind::FunctionCall;
  item.name = std::move(name);
  item.arguments = std::move(arguments);
  item.call_id = std::move(call_id);
  return item;
}

Item Item::function_output(std::string call_id, std::string output, const bool success) {
  Item item;
  item.kind = ItemKind::FunctionCallOutput;
  item.call_id = std::move(call_id);
  item.output = std::move(output);
  item.success = success;
  return item;
}

Item Item::reasoning(std::string summary) {
  Item item;
  item.kind = ItemKind::Reasoning;
  item.parts.push_back(std::move(summary));
  return item;
}

std::string Item::text() const { return concat_parts(parts); }

void EffectiveState::apply(const StateSnapshot &snapshot) {
  if (snapshot.provider_resume_token.has_value()) {
    provider_resume_token = snapshot.provider_resume_token;
  }
  if (snapshot.approved_commands.has_value()) {
    approved_commands = *snapshot.approved_commands;
  }
  if (snapshot.available_tools.has_value()) {
    available_tools = *snapshot.available_tools;
  }
}

std::string encode_header_jsonl(const SessionHeader &header) {
  std::ostringstream out;
  out << "{\"timestamp\":" << json_quote(header.timestamp)
      << ",\"session_id\":" << json_quote(header.session_id);
  if (header.seed_instructions.has_value()) {
    out << ",\"seed_instructions\":" << json_quote(*header.seed_instructions);
  }
  if (header.execution_config.has_value()) {
    out << ",\"execution_config_snapshot\":{\"model\":" << json_quote(header.execution_config->model)
        << ",\"reasoning_effort\":" << json_quote(header.execution_config->reasoning_effort)
        << ",\"sandbox_policy\":" << json_quote(header.execution_config->sandbox_policy) << "}";
  }
  if (header.recorded_project_root.has_value()) {
    out << ",\"recorded_project_root\":" << json_quote(*header.recorded_project_root);
  }
  if (header.recorded_cwd.has_value()) {
    out << ",\"recorded_cwd\":" << json_quote(*header.recorded_cwd);
  }
  if (header.provider_resume_token.has_value()) {
    out << ",\"provider_resume_token\":" << json_quote(*header.provider_resume_token);
  }
  out << "}";
  return out.str();
}

common::Result<SessionHeader> parse_header_jsonl(const std::string &line) {
  const auto object = common::json_parse_object(line);
  if (!object.has_value()) {
    return common::Result<SessionHeader>::failure(common::ErrorCode::CorruptHeader,
                                                  "header is not a JSON object");
  }

  // The header is line one by position; any other fields on it, "type" included, are ignored.
  SessionHeader header;
  header.timestamp = common::json_string(*object, "timestamp");
  if (header.timestamp.empty()) {
    const bool is_record = common::json_find(*object, "record_type") != nullptr ||
                           parse_item(*object, common::json_string(*object, "type")).has_value();
    return common::Result<SessionHeader>::failure(
        common::ErrorCode::CorruptHeader,
        is_record ? "first line is a record, not a header" : "header timestamp missing");
  }
  header.session_id = common::json_string(*object, "session_id");
  header.seed_instructions = optional_string(*object, "seed_instructions");
  header.recorded_project_root = optional_string(*object, "recorded_project_root");
  header.recorded_cwd = optional_string(*object, "recorded_cwd");
  header.provider_resume_token = optional_string(*object, "provider_resume_token");

  if (const auto *snapshot = common::json_find(*object, "execution_config_snapshot");
      snapshot != nullptr && snapshot->kind == common::JsonKind::Object) {
    if (const auto fields = common::json_parse_object(snapshot->raw); fields.has_value()) {
      header.execution_config = ExecutionConfigSnapshot{
          .model = common::json_string(*fields, "model"),
          .reasoning_effort = common::json_string(*fields, "reasoning_effort"),
          .sandbox_policy = common::json_string(*fields, "sandbox_policy"),
      };
    }
  }
  return common::Result<SessionHeader>::success(std::move(header));
}

std::string encode_record_jsonl(const Record &record) {
  return std::visit(
      [](auto &&value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Item>) {
          return encode_item(value);
        } else if constexpr (std::is_same_v<T, StateSnapshot>) {
          return encode_state(value);
        } else if constexpr (std::is_same_v<T, Notice>) {
          return std::string("{\"record_type\":\"") + NOTICE_TAG +
                 "\",\"text\":" + json_quote(value.text) + "}";
        } else {
          return value.raw;
        }
      },
      record);
}

common::Result<Record> parse_record_jsonl(const std::string &line) {
  const auto object = common::json_parse_object(line);
  if (!object.has_value()) {
    return common::Result<Record>::failure(common::ErrorCode::CorruptRecord,
                                           "record is not a JSON object");
  }

  if (const auto *tag = common::json_find(*object, "record_type"); tag != nullptr) {
    if (tag->is_string() && tag->text == STATE_TAG) {
      StateSnapshot state;
      state.provider_resume_token = optional_string(*object, "provider_resume_token");
      state.approved_commands = optional_string_array(*object, "approved_commands");
      state.available_tools = optional_string_array(*object, "available_tools");
      return common::Result<Record>::success(Record{std::move(state)});
    }
    if (tag->is_string() && tag->text == NOTICE_TAG) {
      return common::Result<Record>::success(
          Record{Notice{.text = common::json_string(*object, "text")}});
    }
    return common::Result<Record>::success(Record{UnknownRecord{.raw = line}});
  }

  const std::string type = common::json_string(*object, "type");
  if (auto item = parse_item(*object, type); item.has_value()) {
    return common::Result<Record>::success(Record{std::move(*item)});
  }
  return common::Result<Record>::success(Record{UnknownRecord{.raw = line}});
}

EffectiveState latest_state(const SessionHeader &header, const std::vector<Record> &records) {
  EffectiveState state;
  state.provider_resume_token = header.provider_resume_token;
  for (const auto &record : records) {
    if (const auto *snapshot = std::get_if<StateSnapshot>(&record); snapshot != nullptr) {
      state.apply(*snapshot);
    }
  }
  return state;
}

std::vector<Item> items_of(const std::vector<Record> &records) {
  std::vector<Item> items;
  items.reserve(records.size());
  for (const auto &record : records) {
    if (const auto *item = std::get_if<Item>(&record); item != nullptr) {
      items.push_back(*item);
    }
  }
  return items;
}

} // namespace carryover::rollout
