#pragma once

#include "tutorplane/common/result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tutorplane::common {

/// Escape a string for embedding inside a JSON string literal. Control
/// characters below 0x20 are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// json_escape wrapped in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON string body (handles the short escapes and \uXXXX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object. String values are unescaped; objects,
/// arrays and scalars are kept as their raw JSON text.
using JsonFlatMap = std::map<std::string, std::string>;
[[nodiscard]] Result<JsonFlatMap> json_parse_flat(const std::string &json);

/// Parse a JSON array whose elements are all strings.
[[nodiscard]] Result<std::vector<std::string>> json_parse_string_array(const std::string &json);

/// Render an object from already-encoded member values, preserving order.
using JsonFields = std::vector<std::pair<std::string, std::string>>;
[[nodiscard]] std::string json_object(const JsonFields &fields);

/// Render a map as an object of string members.
[[nodiscard]] std::string json_string_object(const std::map<std::string, std::string> &values);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace tutorplane::common
