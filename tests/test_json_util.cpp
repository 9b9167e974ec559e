#include "test_framework.hpp"

#include "carryover/common/json_util.hpp"

void register_json_util_tests(std::vector<carryover::tests::TestCase> &tests) {
  using carryover::tests::require;
  namespace common = carryover::common;

  tests.push_back({"json_escape_control_characters", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n",
                             "quote, backslash and newline should be escaped");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control characters should use \\u escapes");
                   }});

  tests.push_back({"json_unescape_handles_unicode", [] {
                     require(common::json_unescape("tab\\there") == "tab\there", "tab mismatch");
                     require(common::json_unescape("\\u00e9") == "\xC3\xA9",
                             "\\u00e9 should decode to UTF-8");
                   }});

  tests.push_back({"json_unescape_keeps_malformed_escapes_readable", [] {
                     require(common::json_unescape("a\\uZZZZb") == "a\\uZZZZb",
                             "invalid \\u escape should keep its backslash");
                     require(common::json_unescape("x\\ud83d") == "x\xEF\xBF\xBD",
                             "lone high surrogate should become U+FFFD");
                     require(common::json_unescape("\\ud83dy") == "\xEF\xBF\xBDy",
                             "high surrogate without a pair should become U+FFFD");
                     require(common::json_unescape("\\ude00") == "\xEF\xBF\xBD",
                             "lone low surrogate should become U+FFFD");
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pair should still combine");
                   }});

  tests.push_back({"json_parse_object_keeps_nested_values_raw", [] {
                     const auto object = common::json_parse_object(
                         R"({"a":"x","n":12,"b":true,"o":{"k":[1,2]},"arr":["p","q"],"z":null})");
                     require(object.has_value(), "object should parse");
                     require(common::json_string(*object, "a") == "x", "string member mismatch");
                     const auto *n = common::json_find(*object, "n");
                     require(n != nullptr && n->kind == common::JsonKind::Number && n->raw == "12",
                             "number member mismatch");
                     const auto *b = common::json_find(*object, "b");
                     require(b != nullptr && b->is_true(), "bool member mismatch");
                     const auto *o = common::json_find(*object, "o");
                     require(o != nullptr && o->kind == common::JsonKind::Object &&
                                 o->raw == R"({"k":[1,2]})",
                             "nested object should be kept raw");
                     const auto arr = common::json_string_array(*object, "arr");
                     require(arr.size() == 2 && arr[0] == "p" && arr[1] == "q",
                             "string array mismatch");
                     require(common::json_find(*object, "missing") == nullptr,
                             "absent key should be null");
                   }});

  tests.push_back({"json_parse_object_rejects_malformed", [] {
                     require(!common::json_parse_object("not json").has_value(),
                             "plain text should not parse");
                     require(!common::json_parse_object(R"({"a":1)").has_value(),
                             "truncated object should not parse");
                     require(!common::json_parse_object(R"({"a":1} trailing)").has_value(),
                             "trailing text should not parse");
                     require(!common::json_parse_object(R"(["a"])").has_value(),
                             "array is not an object");
                   }});

  tests.push_back({"json_encode_string_array_round_trips", [] {
                     const std::vector<std::string> values = {"ls", "git \"status\""};
                     const std::string encoded = common::json_encode_string_array(values);
                     const auto object = common::json_parse_object("{\"v\":" + encoded + "}");
                     require(object.has_value(), "encoded array should embed in an object");
                     require(common::json_string_array(*object, "v") == values,
                             "decoded array mismatch");
                   }});
}
