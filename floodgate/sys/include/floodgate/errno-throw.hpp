#pragma once

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>

namespace floodgate {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for {}", address);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmtStr, Args&&... args) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::system_category()),
                          fmt::format(fmt::runtime(fmtStr), std::forward<Args>(args)...));
}

}  // namespace floodgate
