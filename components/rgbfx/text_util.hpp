#pragma once
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// Private string helpers shared by the option and color parsers.
namespace text_util {

inline std::string lower_copy(const std::string& value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

inline std::string trim_copy(const std::string& value) {
  size_t start = 0;
  size_t end = value.size();
  while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(start, end - start);
}

inline bool parse_float(const std::string& text, float& out) {
  const std::string t = trim_copy(text);
  if (t.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const float value = std::strtof(t.c_str(), &end);
  if (errno != 0 || end == t.c_str() || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

inline bool parse_long(const std::string& text, long& out) {
  const std::string t = trim_copy(text);
  if (t.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const long value = std::strtol(t.c_str(), &end, 10);
  if (errno != 0 || end == t.c_str() || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

// Splits on any of seps; empty tokens are kept so callers can reject them.
inline std::vector<std::string> split_any(const std::string& text, const char* seps) {
  std::vector<std::string> parts;
  std::string current;
  for (char ch : text) {
    if (std::strchr(seps, ch) != nullptr) {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  parts.push_back(current);
  return parts;
}

inline std::string strip_brackets(const std::string& text) {
  const std::string t = trim_copy(text);
  if (t.size() >= 2 && t.front() == '[' && t.back() == ']') {
    return t.substr(1, t.size() - 2);
  }
  return t;
}

}  // namespace text_util
