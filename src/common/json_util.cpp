#include "slackpost/common/json_util.hpp"

#include <cctype>
#include <cstdint>

namespace slackpost::common {

namespace {

constexpr std::size_t kMaxDepth = 256;

bool is_hex(const char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }

std::uint32_t hex_value(const std::string &text, const std::size_t pos) {
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4 && i < text.size(); ++i) {
    const char ch = text[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    }
  }
  return value;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Recursive-descent validator. Each parse_* advances pos past the value on
// success and leaves it unspecified on failure.
class Validator {
public:
  explicit Validator(const std::string &text) : text_(text) {}

  bool run() {
    std::size_t pos = json_skip_ws(text_, 0);
    if (!parse_value(pos, 0)) {
      return false;
    }
    return json_skip_ws(text_, pos) == text_.size();
  }

private:
  bool parse_value(std::size_t &pos, const std::size_t depth) {
    if (depth > kMaxDepth || pos >= text_.size()) {
      return false;
    }
    switch (text_[pos]) {
    case '{':
      return parse_object(pos, depth + 1);
    case '[':
      return parse_array(pos, depth + 1);
    case '"':
      return parse_string(pos);
    case 't':
      return parse_literal(pos, "true");
    case 'f':
      return parse_literal(pos, "false");
    case 'n':
      return parse_literal(pos, "null");
    default:
      return parse_number(pos);
    }
  }

  bool parse_object(std::size_t &pos, const std::size_t depth) {
    ++pos;
    pos = json_skip_ws(text_, pos);
    if (pos < text_.size() && text_[pos] == '}') {
      ++pos;
      return true;
    }
    while (pos < text_.size()) {
      if (text_[pos] != '"' || !parse_string(pos)) {
        return false;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size() || text_[pos] != ':') {
        return false;
      }
      pos = json_skip_ws(text_, pos + 1);
      if (!parse_value(pos, depth)) {
        return false;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return false;
      }
      if (text_[pos] == '}') {
        ++pos;
        return true;
      }
      if (text_[pos] != ',') {
        return false;
      }
      pos = json_skip_ws(text_, pos + 1);
    }
    return false;
  }

  bool parse_array(std::size_t &pos, const std::size_t depth) {
    ++pos;
    pos = json_skip_ws(text_, pos);
    if (pos < text_.size() && text_[pos] == ']') {
      ++pos;
      return true;
    }
    while (pos < text_.size()) {
      if (!parse_value(pos, depth)) {
        return false;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return false;
      }
      if (text_[pos] == ']') {
        ++pos;
        return true;
      }
      if (text_[pos] != ',') {
        return false;
      }
      pos = json_skip_ws(text_, pos + 1);
    }
    return false;
  }

  bool parse_string(std::size_t &pos) {
    ++pos;
    while (pos < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos]);
      if (ch == '"') {
        ++pos;
        return true;
      }
      if (ch < 0x20) {
        return false;
      }
      if (ch == '\\') {
        if (pos + 1 >= text_.size()) {
          return false;
        }
        const char esc = text_[pos + 1];
        if (esc == 'u') {
          if (pos + 5 >= text_.size() || !is_hex(text_[pos + 2]) || !is_hex(text_[pos + 3]) ||
              !is_hex(text_[pos + 4]) || !is_hex(text_[pos + 5])) {
            return false;
          }
          pos += 6;
          continue;
        }
        if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
            esc != 'r' && esc != 't') {
          return false;
        }
        pos += 2;
        continue;
      }
      ++pos;
    }
    return false;
  }

  bool parse_literal(std::size_t &pos, const std::string &literal) {
    if (text_.compare(pos, literal.size(), literal) != 0) {
      return false;
    }
    pos += literal.size();
    return true;
  }

  bool parse_number(std::size_t &pos) {
    const auto digit = [this](const std::size_t at) {
      return at < text_.size() && std::isdigit(static_cast<unsigned char>(text_[at])) != 0;
    };
    if (pos < text_.size() && text_[pos] == '-') {
      ++pos;
    }
    if (!digit(pos)) {
      return false;
    }
    if (text_[pos] == '0') {
      ++pos;
    } else {
      while (digit(pos)) {
        ++pos;
      }
    }
    if (pos < text_.size() && text_[pos] == '.') {
      ++pos;
      if (!digit(pos)) {
        return false;
      }
      while (digit(pos)) {
        ++pos;
      }
    }
    if (pos < text_.size() && (text_[pos] == 'e' || text_[pos] == 'E')) {
      ++pos;
      if (pos < text_.size() && (text_[pos] == '+' || text_[pos] == '-')) {
        ++pos;
      }
      if (!digit(pos)) {
        return false;
      }
      while (digit(pos)) {
        ++pos;
      }
    }
    return true;
  }

  const std::string &text_;
};

// End (exclusive) of the scalar or container value starting at pos.
std::size_t value_end(const std::string &json, const std::size_t pos) {
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end;
}

} // namespace

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
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
      if (i + 4 >= raw.size()) {
        out += "\\u";
        break;
      }
      std::uint32_t cp = hex_value(raw, i + 1);
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        const std::uint32_t low = hex_value(raw, i + 3);
        if (low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      if (cp >= 0xD800 && cp <= 0xDFFF) {
        cp = 0xFFFD; // unpaired surrogate
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(esc);
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
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_validate(const std::string &text) { return Validator(text).run(); }

JsonKind json_kind_of(const std::string &value_json) {
  const std::size_t pos = json_skip_ws(value_json, 0);
  if (pos >= value_json.size()) {
    return JsonKind::Null;
  }
  switch (value_json[pos]) {
  case '{':
    return JsonKind::Object;
  case '[':
    return JsonKind::Array;
  case '"':
    return JsonKind::String;
  case 't':
  case 'f':
    return JsonKind::Bool;
  case 'n':
    return JsonKind::Null;
  default:
    return JsonKind::Number;
  }
}

JsonFieldMap json_parse_fields(const std::string &object_json) {
  JsonFieldMap result;
  std::size_t pos = json_skip_ws(object_json, 0);
  if (pos >= object_json.size() || object_json[pos] != '{') {
    return result;
  }

  ++pos;
  while (pos < object_json.size()) {
    pos = json_skip_ws(object_json, pos);
    if (pos >= object_json.size() || object_json[pos] == '}') {
      break;
    }
    if (object_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (object_json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(object_json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(object_json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(object_json, key_end + 1);
    if (pos >= object_json.size() || object_json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(object_json, pos + 1);
    if (pos >= object_json.size()) {
      break;
    }

    const auto end = value_end(object_json, pos);
    if (end == std::string::npos || end <= pos) {
      break;
    }
    const std::string raw = object_json.substr(pos, end - pos);
    JsonField field;
    field.kind = json_kind_of(raw);
    field.value = field.kind == JsonKind::String ? json_unescape(raw.substr(1, raw.size() - 2))
                                                 : raw;
    // Duplicate keys: last one wins, as in most JSON decoders.
    result[key] = std::move(field);
    pos = end;
  }

  return result;
}

std::vector<std::string> json_split_top_level_values(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }

  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = value_end(array_json, pos);
    if (end == std::string::npos || end <= pos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

} // namespace slackpost::common
