#include "crucible/common/toml.hpp"

#include "crucible/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <set>
#include <sstream>

namespace crucible::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> elements;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (ch == '"' && (i == 0 || body[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == ',') {
      elements.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    elements.push_back(trim(current));
  }
  return elements;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (escaped) {
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    } else if (ch == '\\') {
      escaped = true;
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized = trim(it->second);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  if (normalized.empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (end != normalized.c_str() + normalized.size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

std::vector<std::string> TomlDocument::table_names(const std::string &prefix) const {
  const std::string head = prefix + ".";
  std::set<std::string> names;
  for (const auto &[key, _] : values) {
    if (!starts_with(key, head)) {
      continue;
    }
    const std::string rest = key.substr(head.size());
    const auto dot = rest.find('.');
    if (dot != std::string::npos && dot > 0) {
      names.insert(rest.substr(0, dot));
    }
  }
  return {names.begin(), names.end()};
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure(
            ErrorKind::Configuration, "Invalid empty section at line " + std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(
          ErrorKind::Configuration, "Invalid key/value at line " + std::to_string(line_number));
    }

    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(
          ErrorKind::Configuration, "Missing key at line " + std::to_string(line_number));
    }
    document.values[section.empty() ? key : section + "." + key] = trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace crucible::common
