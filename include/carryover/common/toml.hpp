#pragma once

#include "carryover/common/result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace carryover::common {

enum class TomlKind {
  String,
  Integer,
  Bool,
  StringArray,
  // Anything else (floats, dates, inline tables); kept as source text and never converted.
  Other,
};

struct TomlValue {
  TomlKind kind = TomlKind::Other;
  std::string text;
  std::int64_t integer = 0;
  bool boolean = false;
  std::vector<std::string> items;
  std::size_t line = 0;
};

/// Typed view of a TOML document: keys are "section.key". Getters return the fallback when a
/// key is absent or holds a value of another type.
struct TomlDocument {
  std::unordered_map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::int64_t get_i64(const std::string &key, std::int64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

/// Parses the subset of TOML the config file uses. Arrays may span lines. Errors name the line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);
[[nodiscard]] std::string toml_string_array(const std::vector<std::string> &values);

} // namespace carryover::common
