#include "carryover/common/json_util.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace carryover::common {

namespace {

void append_utf8(std::string &out, const unsigned long code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, unsigned long &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<unsigned long>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<unsigned long>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<unsigned long>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

bool is_literal_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '+' ||
         ch == '.';
}

// Reads one value starting at pos. On success fills `field` and returns the position just past
// the value; returns npos on malformed input.
std::size_t read_value(const std::string &json, std::size_t pos, JsonField &field) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    if (end == std::string::npos) {
      return std::string::npos;
    }
    field.kind = JsonKind::String;
    field.raw = json.substr(pos, end - pos + 1);
    field.text = json_unescape(json.substr(pos + 1, end - pos - 1));
    return end + 1;
  }
  if (ch == '{' || ch == '[') {
    const char close = ch == '{' ? '}' : ']';
    const auto end = json_find_matching_token(json, pos, ch, close);
    if (end == std::string::npos) {
      return std::string::npos;
    }
    field.kind = ch == '{' ? JsonKind::Object : JsonKind::Array;
    field.raw = json.substr(pos, end - pos + 1);
    return end + 1;
  }

  std::size_t end = pos;
  while (end < json.size() && is_literal_char(json[end])) {
    ++end;
  }
  if (end == pos) {
    return std::string::npos;
  }
  field.raw = json.substr(pos, end - pos);
  if (field.raw == "true" || field.raw == "false") {
    field.kind = JsonKind::Bool;
  } else if (field.raw == "null") {
    field.kind = JsonKind::Null;
  } else if (std::isdigit(static_cast<unsigned char>(field.raw.front())) != 0 ||
             field.raw.front() == '-') {
    field.kind = JsonKind::Number;
  } else {
    return std::string::npos;
  }
  return end;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned long code_point = 0;
      if (!parse_hex4(raw, i + 1, code_point)) {
        // Not a valid escape; keep it as written.
        out += "\\u";
        break;
      }
      i += 4;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw.compare(i + 1, 2, "\\u") == 0) {
        unsigned long low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      if (code_point >= 0xD800 && code_point <= 0xDFFF) {
        // Unpaired surrogate.
        code_point = 0xFFFD;
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{' || ch == '[') {
      ++depth;
    } else if (ch == '}' || ch == ']') {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return ch == close_ch ? i : std::string::npos;
      }
    }
  }
  return std::string::npos;
}

std::optional<JsonObject> json_parse_object(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  const auto close = json_find_matching_token(json, pos, '{', '}');
  if (close == std::string::npos || json_skip_ws(json, close + 1) != json.size()) {
    return std::nullopt;
  }

  JsonObject result;
  pos = json_skip_ws(json, pos + 1);
  if (pos == close) {
    return result;
  }
  while (pos < close) {
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= close) {
      return std::nullopt;
    }
    JsonField field;
    field.key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= close || json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
    pos = read_value(json, pos, field);
    if (pos == std::string::npos || pos > close) {
      return std::nullopt;
    }
    result.push_back(std::move(field));

    pos = json_skip_ws(json, pos);
    if (pos == close) {
      return result;
    }
    if (json[pos] != ',') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
  }
  return std::nullopt;
}

std::optional<std::vector<JsonField>> json_parse_array(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '[') {
    return std::nullopt;
  }
  const auto close = json_find_matching_token(json, pos, '[', ']');
  if (close == std::string::npos || json_skip_ws(json, close + 1) != json.size()) {
    return std::nullopt;
  }

  std::vector<JsonField> out;
  pos = json_skip_ws(json, pos + 1);
  if (pos == close) {
    return out;
  }
  while (pos < close) {
    JsonField element;
    pos = read_value(json, pos, element);
    if (pos == std::string::npos || pos > close) {
      return std::nullopt;
    }
    out.push_back(std::move(element));
    pos = json_skip_ws(json, pos);
    if (pos == close) {
      return out;
    }
    if (json[pos] != ',') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
  }
  return std::nullopt;
}

const JsonField *json_find(const JsonObject &object, const std::string &key) {
  for (const auto &field : object) {
    if (field.key == key) {
      return &field;
    }
  }
  return nullptr;
}

std::string json_string(const JsonObject &object, const std::string &key) {
  const auto *field = json_find(object, key);
  if (field == nullptr || !field->is_string()) {
    return "";
  }
  return field->text;
}

std::vector<std::string> json_string_array(const JsonObject &object, const std::string &key) {
  const auto *field = json_find(object, key);
  if (field == nullptr || field->kind != JsonKind::Array) {
    return {};
  }
  const auto elements = json_parse_array(field->raw);
  if (!elements.has_value()) {
    return {};
  }
  std::vector<std::string> out;
  out.reserve(elements->size());
  for (const auto &element : *elements) {
    if (element.is_string()) {
      out.push_back(element.text);
    }
  }
  return out;
}

std::string json_encode_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << json_quote(values[i]);
  }
  out << ']';
  return out.str();
}

} // namespace carryover::common
