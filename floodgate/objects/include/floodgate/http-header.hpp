#pragma once

#include <string>

namespace floodgate::http {

struct Header {
  bool operator==(const Header&) const noexcept = default;

  std::string name;
  std::string value;
};

}  // namespace floodgate::http
