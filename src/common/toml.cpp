#include "carryover/common/toml.hpp"

#include "carryover/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace carryover::common {

namespace {

class Scanner {
public:
  explicit Scanner(const std::string &text) : text_(text) {}

  [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return at_end() ? '\0' : text_[pos_]; }
  [[nodiscard]] std::size_t line() const { return line_; }

  char take() {
    const char ch = text_[pos_++];
    if (ch == '\n') {
      ++line_;
    }
    return ch;
  }

  // Spaces and tabs only; newlines are significant between key/value pairs.
  void skip_blanks() {
    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
      take();
    }
  }

  void skip_comment() {
    if (peek() == '#') {
      while (!at_end() && peek() != '\n') {
        take();
      }
    }
  }

  // Whitespace, newlines and comments, for use inside arrays.
  void skip_layout() {
    while (!at_end()) {
      skip_blanks();
      skip_comment();
      if (peek() != '\n') {
        return;
      }
      take();
    }
  }

  [[nodiscard]] bool at_line_end() {
    skip_blanks();
    skip_comment();
    return at_end() || peek() == '\n';
  }

private:
  const std::string &text_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
};

Status syntax_error(const Scanner &scanner, const std::string &what) {
  return Status::error(ErrorCode::InvalidConfig,
                       what + " at line " + std::to_string(scanner.line()));
}

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

Status read_dotted_key(Scanner &scanner, std::string &out) {
  out.clear();
  while (true) {
    scanner.skip_blanks();
    std::string part;
    while (is_bare_key_char(scanner.peek())) {
      part.push_back(scanner.take());
    }
    if (part.empty()) {
      return syntax_error(scanner, "Missing key");
    }
    out += out.empty() ? part : "." + part;
    scanner.skip_blanks();
    if (scanner.peek() != '.') {
      return Status::success();
    }
    scanner.take();
  }
}

Status read_basic_string(Scanner &scanner, std::string &out) {
  scanner.take();
  out.clear();
  while (!scanner.at_end() && scanner.peek() != '\n') {
    const char ch = scanner.take();
    if (ch == '"') {
      return Status::success();
    }
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (scanner.at_end()) {
      break;
    }
    const char next = scanner.take();
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case '"':
    case '\\':
      out.push_back(next);
      break;
    default:
      return syntax_error(scanner, std::string("Unsupported escape \\") + next);
    }
  }
  return syntax_error(scanner, "Unterminated string");
}

Status read_literal_string(Scanner &scanner, std::string &out) {
  scanner.take();
  out.clear();
  while (!scanner.at_end() && scanner.peek() != '\n') {
    const char ch = scanner.take();
    if (ch == '\'') {
      return Status::success();
    }
    out.push_back(ch);
  }
  return syntax_error(scanner, "Unterminated string");
}

Status read_string(Scanner &scanner, std::string &out) {
  return scanner.peek() == '"' ? read_basic_string(scanner, out)
                               : read_literal_string(scanner, out);
}

Status read_string_array(Scanner &scanner, TomlValue &value) {
  scanner.take();
  value.kind = TomlKind::StringArray;
  while (true) {
    scanner.skip_layout();
    if (scanner.at_end()) {
      return syntax_error(scanner, "Unterminated array");
    }
    if (scanner.peek() == ']') {
      scanner.take();
      return Status::success();
    }
    if (scanner.peek() != '"' && scanner.peek() != '\'') {
      return syntax_error(scanner, "Arrays may only hold strings");
    }
    std::string item;
    if (auto status = read_string(scanner, item); !status.ok()) {
      return status;
    }
    value.items.push_back(std::move(item));
    scanner.skip_layout();
    if (scanner.peek() == ',') {
      scanner.take();
    } else if (scanner.peek() != ']') {
      return syntax_error(scanner, "Expected ',' or ']' in array");
    }
  }
}

void classify_scalar(const std::string &raw, TomlValue &value) {
  value.text = raw;
  if (raw == "true" || raw == "false") {
    value.kind = TomlKind::Bool;
    value.boolean = raw == "true";
    return;
  }
  std::string digits;
  for (const char ch : raw) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  const char *first = digits.data();
  const char *last = first + digits.size();
  if (first != last && *first == '+') {
    ++first;
  }
  std::int64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (first != last && ec == std::errc() && ptr == last) {
    value.kind = TomlKind::Integer;
    value.integer = parsed;
    return;
  }
  value.kind = TomlKind::Other;
}

Status read_value(Scanner &scanner, TomlValue &value) {
  scanner.skip_blanks();
  value.line = scanner.line();
  const char ch = scanner.peek();
  if (ch == '"' || ch == '\'') {
    value.kind = TomlKind::String;
    return read_string(scanner, value.text);
  }
  if (ch == '[') {
    return read_string_array(scanner, value);
  }
  std::string raw;
  while (!scanner.at_end() && scanner.peek() != '\n' && scanner.peek() != '#') {
    raw.push_back(scanner.take());
  }
  raw = trim(raw);
  if (raw.empty()) {
    return syntax_error(scanner, "Missing value");
  }
  classify_scalar(raw, value);
  return Status::success();
}

const TomlValue *find_value(const TomlDocument &document, const std::string &key,
                            const TomlKind kind) {
  const auto it = document.values.find(key);
  if (it == document.values.end() || it->second.kind != kind) {
    return nullptr;
  }
  return &it->second;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *value = find_value(*this, key, TomlKind::String);
  return value == nullptr ? fallback : value->text;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto *value = find_value(*this, key, TomlKind::Bool);
  return value == nullptr ? fallback : value->boolean;
}

std::int64_t TomlDocument::get_i64(const std::string &key, const std::int64_t fallback) const {
  const auto *value = find_value(*this, key, TomlKind::Integer);
  return value == nullptr ? fallback : value->integer;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto *value = find_value(*this, key, TomlKind::StringArray);
  return value == nullptr ? fallback : value->items;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  Scanner scanner(content);
  std::string section;

  while (true) {
    scanner.skip_layout();
    if (scanner.at_end()) {
      break;
    }

    if (scanner.peek() == '[') {
      scanner.take();
      if (auto status = read_dotted_key(scanner, section); !status.ok()) {
        return Result<TomlDocument>::failure(
            syntax_error(scanner, "Invalid section header"));
      }
      if (scanner.peek() != ']') {
        return Result<TomlDocument>::failure(syntax_error(scanner, "Expected ']'"));
      }
      scanner.take();
      if (!scanner.at_line_end()) {
        return Result<TomlDocument>::failure(
            syntax_error(scanner, "Unexpected text after section header"));
      }
      continue;
    }

    std::string key;
    if (auto status = read_dotted_key(scanner, key); !status.ok()) {
      return Result<TomlDocument>::failure(status);
    }
    if (scanner.peek() != '=') {
      return Result<TomlDocument>::failure(syntax_error(scanner, "Expected '=' after " + key));
    }
    scanner.take();

    TomlValue value;
    if (auto status = read_value(scanner, value); !status.ok()) {
      return Result<TomlDocument>::failure(status);
    }
    if (!scanner.at_line_end()) {
      return Result<TomlDocument>::failure(
          syntax_error(scanner, "Unexpected text after value of " + key));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, std::move(value)).second) {
      return Result<TomlDocument>::failure(syntax_error(scanner, "Duplicate key " + full_key));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(ch);
    }
  }
  out.push_back('"');
  return out;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    stream << (index > 0 ? ", " : "") << quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

} // namespace carryover::common
