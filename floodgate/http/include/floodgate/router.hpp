#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "floodgate/http-method.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/size-spec.hpp"

namespace floodgate {

// Serve the index page.
struct ServeIndex {
  bool headOnly{false};
};

// Stream spec.byteCount random bytes (head only for HEAD requests).
struct ServeStream {
  SizeSpec spec;
  bool headOnly{false};
};

struct RouteNotFound {};

// Answered with "Allow: GET, HEAD".
struct MethodNotAllowed {};

using RouteDecision = std::variant<ServeIndex, ServeStream, MalformedSize, SizeOutOfRange, RouteNotFound, MethodNotAllowed>;

// Maps (method, path) to what should be answered. Stateless once built, it can be shared between threads.
class Router {
 public:
  Router(std::vector<std::string> indexPaths, uint64_t maxSize);

  // path must not contain the query string.
  [[nodiscard]] RouteDecision route(http::Method method, std::string_view path) const;

  [[nodiscard]] uint64_t maxSize() const noexcept { return _maxSize; }

  // Response status of a decision.
  [[nodiscard]] static http::StatusCode StatusFor(const RouteDecision& decision) noexcept;

 private:
  std::vector<std::string> _indexPaths;
  uint64_t _maxSize;
};

}  // namespace floodgate
