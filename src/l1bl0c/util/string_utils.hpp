#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace l1bl0c::util {

inline std::string to_lower(std::string_view value) {
  std::string out(value.begin(), value.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

inline std::string_view trim_view(std::string_view value) {
  size_t first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

// first whitespace-delimited token, empty when the input is blank
inline std::string_view first_token(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  size_t end = trimmed.find_first_of(" \t\r\n");
  return end == std::string_view::npos ? trimmed : trimmed.substr(0, end);
}

inline bool all_digits(std::string_view value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

} // namespace l1bl0c::util
