#include "crucible/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace crucible::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    if (escaped) {
      escaped = false;
    } else if (json[i] == '\\') {
      escaped = true;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

/// Index of the bracket closing the one at `open_pos`, skipping string contents.
std::size_t matching_close(const std::string &json, const std::size_t open_pos) {
  const char open_ch = json[open_pos];
  const char close_ch = open_ch == '{' ? '}' : ']';
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
    } else if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t value_end(const std::string &json, const std::size_t pos) {
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = matching_close(json, pos);
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

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
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
    case 'u':
      if (i + 4 < raw.size() && std::isxdigit(static_cast<unsigned char>(raw[i + 1])) != 0 &&
          std::isxdigit(static_cast<unsigned char>(raw[i + 2])) != 0 &&
          std::isxdigit(static_cast<unsigned char>(raw[i + 3])) != 0 &&
          std::isxdigit(static_cast<unsigned char>(raw[i + 4])) != 0) {
        const auto code = std::stoul(raw.substr(i + 1, 4), nullptr, 16);
        if (code < 0x80) {
          out.push_back(static_cast<char>(code));
        }
        i += 4;
      }
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += "\"" + json_escape(values[i]) + "\"";
  }
  out += "]";
  return out;
}

std::string json_get_raw(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  for (auto key_pos = json.find(quoted); key_pos != std::string::npos;
       key_pos = json.find(quoted, key_pos + 1)) {
    const std::size_t colon = skip_ws(json, key_pos + quoted.size());
    if (colon >= json.size() || json[colon] != ':') {
      continue;
    }
    const std::size_t start = skip_ws(json, colon + 1);
    if (start >= json.size()) {
      return "";
    }
    const std::size_t end = value_end(json, start);
    if (end == std::string::npos || end <= start) {
      return "";
    }
    return json.substr(start, end - start);
  }
  return "";
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  if (raw.size() < 2 || raw.front() != '"') {
    return "";
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  if (raw.empty() || raw.front() == '"' || raw.front() == '{' || raw.front() == '[') {
    return "";
  }
  return raw;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  return !raw.empty() && raw.front() == '[' ? raw : "";
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  return !raw.empty() && raw.front() == '{' ? raw : "";
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array = json_get_array(json, field);
  std::vector<std::string> out;
  for (std::size_t pos = 1; pos < array.size();) {
    pos = skip_ws(array, pos);
    if (pos >= array.size() || array[pos] == ']') {
      break;
    }
    if (array[pos] != '"') {
      ++pos;
      continue;
    }
    const auto end = string_end(array, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(json_unescape(array.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return out;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  for (std::size_t pos = 0; pos < array_json.size(); ++pos) {
    if (array_json[pos] == '"') {
      pos = string_end(array_json, pos);
      if (pos == std::string::npos) {
        break;
      }
      continue;
    }
    if (array_json[pos] != '{') {
      continue;
    }
    const auto end = matching_close(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos + 1));
    pos = end;
  }
  return out;
}

} // namespace crucible::common
