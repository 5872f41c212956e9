#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace crucible::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (\n, \r, \t, \", \\, \/ and \u00XX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// `"a","b"` → `["a","b"]` quoted and escaped.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Raw text of the value stored under a top-level or nested `field` (strings keep
/// their quotes, objects and arrays keep their brackets). Empty when absent.
[[nodiscard]] std::string json_get_raw(const std::string &json, const std::string &field);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                             const std::string &field);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace crucible::common
