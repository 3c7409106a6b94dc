#pragma once

#include <string_view>

namespace floodgate {

constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

constexpr char toupper(char ch) noexcept { return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - ('a' - 'A')) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Returns true if the comma separated list 'values' contains 'token' (case insensitive, optional whitespace ignored).
constexpr bool ContainsTokenCaseInsensitive(std::string_view values, std::string_view token) noexcept {
  while (!values.empty()) {
    auto commaPos = values.find(',');
    std::string_view item = values.substr(0, commaPos);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
      item.remove_prefix(1);
    }
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
      item.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(item, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    values.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace floodgate
