#include "floodgate/router.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "floodgate/http-method.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/size-spec.hpp"

namespace floodgate {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

Router::Router(std::vector<std::string> indexPaths, uint64_t maxSize)
    : _indexPaths(std::move(indexPaths)), _maxSize(maxSize) {}

RouteDecision Router::route(http::Method method, std::string_view path) const {
  if (method == http::Method::Other) {
    return MethodNotAllowed{};
  }
  const bool headOnly = method == http::Method::HEAD;
  if (std::ranges::find(_indexPaths, path) != _indexPaths.end()) {
    return ServeIndex{headOnly};
  }

  // Size tokens are single segment paths starting with a digit. Anything else is simply not ours.
  if (path.size() < 2 || path[0] != '/' || path[1] < '0' || path[1] > '9' ||
      path.find('/', 1) != std::string_view::npos) {
    return RouteNotFound{};
  }
  auto parsed = ParseSizeToken(path.substr(1), _maxSize);
  return std::visit(Overloaded{[headOnly](SizeSpec& spec) -> RouteDecision {
                                 return ServeStream{std::move(spec), headOnly};
                               },
                               [](auto& error) -> RouteDecision { return error; }},
                    parsed);
}

http::StatusCode Router::StatusFor(const RouteDecision& decision) noexcept {
  return std::visit(Overloaded{[](const ServeIndex&) { return http::StatusCodeOK; },
                               [](const ServeStream&) { return http::StatusCodeOK; },
                               [](const MalformedSize&) { return http::StatusCodeBadRequest; },
                               [](const SizeOutOfRange& err) -> http::StatusCode {
                                 return err.exceedsMaximum ? http::StatusCodePayloadTooLarge
                                                           : http::StatusCodeBadRequest;
                               },
                               [](const RouteNotFound&) { return http::StatusCodeNotFound; },
                               [](const MethodNotAllowed&) { return http::StatusCodeMethodNotAllowed; }},
                    decision);
}

}  // namespace floodgate
