#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace carryover::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (handles \n, \r, \t, \b, \f, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

enum class JsonKind {
  String,
  Object,
  Array,
  Number,
  Bool,
  Null,
};

/// One member of an object (or one element of an array, with an empty key).
/// `raw` is the exact source text of the value; `text` is the unescaped body for strings.
struct JsonField {
  std::string key;
  JsonKind kind = JsonKind::Null;
  std::string raw;
  std::string text;

  [[nodiscard]] bool is_string() const { return kind == JsonKind::String; }
  [[nodiscard]] bool is_true() const { return kind == JsonKind::Bool && raw == "true"; }
};

using JsonObject = std::vector<JsonField>;

/// Parse the top level of a JSON object. Nested values are kept raw.
/// Returns nullopt when the text is not a single well-formed object.
[[nodiscard]] std::optional<JsonObject> json_parse_object(const std::string &json);

/// Parse the top level of a JSON array into its elements.
[[nodiscard]] std::optional<std::vector<JsonField>> json_parse_array(const std::string &json);

/// Look up a member by key; nullptr when absent.
[[nodiscard]] const JsonField *json_find(const JsonObject &object, const std::string &key);

/// String member value, or empty when absent or not a string.
[[nodiscard]] std::string json_string(const JsonObject &object, const std::string &key);

/// String elements of an array member; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_string_array(const JsonObject &object,
                                                         const std::string &key);

/// Encode a list of strings as a JSON array.
[[nodiscard]] std::string json_encode_string_array(const std::vector<std::string> &values);

} // namespace carryover::common
