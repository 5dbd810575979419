// Repository: Hush
// Component: String Helpers
// Purpose: Trim / case folding shared by config parsing, detection and
//          model-name handling.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_UTIL_STRINGS_HPP_
#define HUSH_UTIL_STRINGS_HPP_

#include <algorithm>
#include <cctype>
#include <string>

namespace hush::util {

inline std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

inline std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace hush::util

#endif  // HUSH_UTIL_STRINGS_HPP_
