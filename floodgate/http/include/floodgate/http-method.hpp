#pragma once

#include <cstdint>
#include <string_view>

#include "floodgate/http-constants.hpp"

namespace floodgate::http {

// Only GET and HEAD are served, every other (valid) method token maps to Other.
enum class Method : uint8_t { GET, HEAD, Other };

// Method tokens are case-sensitive (RFC 9110 9.1).
constexpr Method MethodFromStr(std::string_view str) noexcept {
  if (str == GET) {
    return Method::GET;
  }
  if (str == HEAD) {
    return Method::HEAD;
  }
  return Method::Other;
}

}  // namespace floodgate::http
