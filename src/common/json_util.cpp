#include "tutorplane/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace tutorplane::common {

namespace {

void append_utf8(std::string &out, const unsigned int code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// Scalar value: number, true, false or null.
std::size_t scan_scalar(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

// Length of the well-formed UTF-8 sequence starting at `pos`, 0 if there is none.
std::size_t utf8_sequence_length(const std::string &text, const std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  unsigned int second_min = 0x80;
  unsigned int second_max = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    second_min = lead == 0xE0 ? 0xA0 : 0x80;
    second_max = lead == 0xED ? 0x9F : 0xBF;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    second_min = lead == 0xF0 ? 0x90 : 0x80;
    second_max = lead == 0xF4 ? 0x8F : 0xBF;
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(text[pos + i]);
    const unsigned int low = i == 1 ? second_min : 0x80;
    const unsigned int high = i == 1 ? second_max : 0xBF;
    if (byte < low || byte > high) {
      return 0;
    }
  }
  return length;
}

} // namespace

// Invalid UTF-8 bytes become U+FFFD so the output is always valid JSON.
std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
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
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default: {
      const auto byte = static_cast<unsigned char>(ch);
      if (byte < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", byte);
        escaped += buffer;
      } else if (byte < 0x80) {
        escaped.push_back(ch);
      } else if (const std::size_t length = utf8_sequence_length(value, i); length == 0) {
        escaped += "\\ufffd";
      } else {
        escaped.append(value, i, length);
        i += length - 1;
      }
      break;
    }
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
      unsigned int code_point = 0;
      bool valid = i + 4 < raw.size();
      for (std::size_t k = 1; valid && k <= 4; ++k) {
        const int digit = hex_value(raw[i + k]);
        if (digit < 0) {
          valid = false;
        } else {
          code_point = (code_point << 4) | static_cast<unsigned int>(digit);
        }
      }
      if (!valid) {
        out += "\\u";
        break;
      }
      append_utf8(out, code_point);
      i += 4;
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

Result<JsonFlatMap> json_parse_flat(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments, "expected a JSON object");
  }
  const auto object_end = json_find_matching_token(json, pos, '{', '}');
  if (object_end == std::string::npos) {
    return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments, "unterminated JSON object");
  }
  if (json_skip_ws(json, object_end + 1) != json.size()) {
    return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments,
                                        "trailing characters after JSON object");
  }

  JsonFlatMap result;
  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= object_end) {
      break;
    }
    if (json[pos] != '"') {
      return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments,
                                          "expected a member name at offset " +
                                              std::to_string(pos));
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end > object_end) {
      return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments, "unterminated member name");
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= object_end || json[pos] != ':') {
      return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments,
                                          "expected ':' after member \"" + key + "\"");
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= object_end) {
      return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments,
                                          "missing value for member \"" + key + "\"");
    }

    std::size_t value_end = std::string::npos;
    if (json[pos] == '"') {
      value_end = json_find_string_end(json, pos);
      if (value_end == std::string::npos) {
        return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments, "unterminated string");
      }
      result[key] = json_unescape(json.substr(pos + 1, value_end - pos - 1));
      ++value_end;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      value_end = json_find_matching_token(json, pos, open, close);
      if (value_end == std::string::npos) {
        return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments,
                                            "unterminated value for member \"" + key + "\"");
      }
      result[key] = json.substr(pos, value_end - pos + 1);
      ++value_end;
    } else {
      value_end = scan_scalar(json, pos);
      if (value_end == pos) {
        return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments,
                                            "missing value for member \"" + key + "\"");
      }
      result[key] = json.substr(pos, value_end - pos);
    }

    pos = json_skip_ws(json, value_end);
    if (pos < object_end && json[pos] == ',') {
      ++pos;
      continue;
    }
    if (pos != object_end) {
      return Result<JsonFlatMap>::failure(ErrorKind::InvalidArguments,
                                          "expected ',' or '}' at offset " + std::to_string(pos));
    }
  }

  return Result<JsonFlatMap>::success(std::move(result));
}

Result<std::vector<std::string>> json_parse_string_array(const std::string &json) {
  using ArrayResult = Result<std::vector<std::string>>;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '[') {
    return ArrayResult::failure(ErrorKind::InvalidArguments, "expected a JSON array");
  }
  const auto array_end = json_find_matching_token(json, pos, '[', ']');
  if (array_end == std::string::npos || json_skip_ws(json, array_end + 1) != json.size()) {
    return ArrayResult::failure(ErrorKind::InvalidArguments, "malformed JSON array");
  }

  std::vector<std::string> out;
  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= array_end) {
      break;
    }
    if (json[pos] != '"') {
      return ArrayResult::failure(ErrorKind::InvalidArguments,
                                  "array elements must be strings");
    }
    const auto end = json_find_string_end(json, pos);
    if (end == std::string::npos || end > array_end) {
      return ArrayResult::failure(ErrorKind::InvalidArguments, "unterminated string in array");
    }
    out.push_back(json_unescape(json.substr(pos + 1, end - pos - 1)));
    pos = json_skip_ws(json, end + 1);
    if (pos < array_end && json[pos] == ',') {
      ++pos;
      continue;
    }
    if (pos != array_end) {
      return ArrayResult::failure(ErrorKind::InvalidArguments, "expected ',' or ']' in array");
    }
  }
  return ArrayResult::success(std::move(out));
}

std::string json_object(const JsonFields &fields) {
  std::string out = "{";
  bool first = true;
  for (const auto &[key, value] : fields) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += json_quote(key);
    out += ":";
    out += value;
  }
  out += "}";
  return out;
}

std::string json_string_object(const std::map<std::string, std::string> &values) {
  JsonFields fields;
  fields.reserve(values.size());
  for (const auto &[key, value] : values) {
    fields.emplace_back(key, json_quote(value));
  }
  return json_object(fields);
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += json_quote(values[i]);
  }
  out += "]";
  return out;
}

} // namespace tutorplane::common
