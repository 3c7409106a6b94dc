#pragma once

#include <string_view>

namespace floodgate {

inline constexpr std::string_view kWhitespace = " \t";

// Remove leading and trailing optional whitespace (space or horizontal tab), as defined by RFC 9110.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  const auto first = sv.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(kWhitespace);
  return sv.substr(first, last - first + 1);
}

}  // namespace floodgate
