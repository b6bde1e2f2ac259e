#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace slackpost::common {

/// Unescape the body of a JSON string literal. \uXXXX escapes (including
/// surrogate pairs) are emitted as UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when text holds exactly one well-formed JSON value.
[[nodiscard]] bool json_validate(const std::string &text);

enum class JsonKind { Null, Bool, Number, String, Array, Object };

struct JsonField {
  JsonKind kind = JsonKind::Null;
  // Unescaped contents for strings, raw JSON text for everything else.
  std::string value;
};

/// Parse the top-level members of a JSON object. Returns an empty map when
/// the input is not an object. Expects input that passed json_validate.
using JsonFieldMap = std::unordered_map<std::string, JsonField>;
[[nodiscard]] JsonFieldMap json_parse_fields(const std::string &object_json);

/// Split a JSON array into the raw text of each element.
[[nodiscard]] std::vector<std::string> json_split_top_level_values(const std::string &array_json);

/// Kind of the JSON value that starts at the first non-whitespace character.
[[nodiscard]] JsonKind json_kind_of(const std::string &value_json);

} // namespace slackpost::common
