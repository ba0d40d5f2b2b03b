#include "geo_resolver/json.hpp"

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace geo_resolver {
namespace {
const std::string kStringBody = R"(((?:[^"\\]|\\.)*))";

std::string key_pattern(const std::string &key) {
  return "\"" + std::regex_replace(key, std::regex(R"([.^$|()\[\]{}*+?\\])"),
                                   R"(\$&)") +
         "\"\\s*:\\s*";
}

std::size_t skip_space(const std::string &s, std::size_t i) {
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' ||
                          s[i] == '\r'))
    ++i;
  return i;
}

// Index of the quote closing the string that opens at s[open].
std::size_t string_end(const std::string &s, std::size_t open) {
  for (std::size_t i = open + 1; i < s.size(); ++i) {
    if (s[i] == '\\')
      ++i;
    else if (s[i] == '"')
      return i;
  }
  return std::string::npos;
}

// Index of the brace closing the object that opens at s[open]. Braces inside
// string literals do not count.
std::size_t object_end(const std::string &s, std::size_t open) {
  int depth = 0;
  for (std::size_t i = open; i < s.size(); ++i) {
    if (s[i] == '"') {
      i = string_end(s, i);
      if (i == std::string::npos)
        return i;
    } else if (s[i] == '{') {
      ++depth;
    } else if (s[i] == '}' && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}
} // namespace

std::string json_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
  }
  return out;
}

std::string json_unescape(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 >= s.size()) {
      out.push_back(s[i]);
      continue;
    }
    const char c = s[++i];
    switch (c) {
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
      if (i + 4 < s.size()) {
        const std::string hex = s.substr(i + 1, 4);
        char *end = nullptr;
        const auto code = std::strtoul(hex.c_str(), &end, 16);
        if (end == hex.c_str() + hex.size() && code < 0x80)
          out.push_back(static_cast<char>(code));
        i += 4;
      }
      break;
    default:
      out.push_back(c);
    }
  }
  return out;
}

std::string json_quote(const std::string &s) { return "\"" + json_escape(s) + "\""; }

std::string json_string_or_null(const Value &v) {
  return v.has_value() ? json_quote(*v) : "null";
}

std::optional<std::string> json_find_string(const std::string &json,
                                            const std::string &key) {
  std::regex re(key_pattern(key) + "\"" + kStringBody + "\"");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  return json_unescape(m[1].str());
}

std::optional<std::int64_t> json_find_i64(const std::string &json,
                                          const std::string &key) {
  std::regex re(key_pattern(key) + "(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  try {
    return static_cast<std::int64_t>(std::stoll(m[1].str()));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<bool> json_find_bool(const std::string &json,
                                   const std::string &key) {
  std::regex re(key_pattern(key) + "(true|false)");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  return m[1].str() == "true";
}

bool json_is_null(const std::string &json, const std::string &key) {
  std::regex re(key_pattern(key) + "null");
  return std::regex_search(json, re);
}

std::vector<std::pair<std::string, std::string>>
json_object_members(const std::string &json) {
  std::vector<std::pair<std::string, std::string>> out;
  std::size_t i = json.find('{');
  if (i == std::string::npos)
    return out;
  ++i;
  while (true) {
    i = skip_space(json, i);
    if (i < json.size() && json[i] == ',')
      i = skip_space(json, i + 1);
    if (i >= json.size() || json[i] != '"')
      break;
    const auto key_end = string_end(json, i);
    if (key_end == std::string::npos)
      break;
    const std::string key = json_unescape(json.substr(i + 1, key_end - i - 1));
    i = skip_space(json, key_end + 1);
    if (i >= json.size() || json[i] != ':')
      break;
    i = skip_space(json, i + 1);
    if (i >= json.size())
      break;
    if (json[i] == '{') {
      const auto end = object_end(json, i);
      if (end == std::string::npos)
        break;
      out.emplace_back(key, json.substr(i, end - i + 1));
      i = end + 1;
    } else if (json[i] == '"') {
      const auto end = string_end(json, i);
      if (end == std::string::npos)
        break;
      i = end + 1;
    } else {
      while (i < json.size() && json[i] != ',' && json[i] != '}')
        ++i;
    }
  }
  return out;
}

} // namespace geo_resolver
