#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "floodgate/http-method.hpp"
#include "floodgate/http-status-code.hpp"

namespace floodgate {

// Parsed HTTP/1.x request head. All views point into the buffer given to parse() and stay valid as long as it is not
// modified. Only the head is parsed: floodgate does not consume request bodies.
class HttpRequest {
 public:
  enum class ParseStatus : uint8_t {
    NeedMore,  // head not complete yet
    Ok,        // head parsed, headLength bytes consumed
    Error      // head invalid, errorStatus tells which response to send before closing
  };

  struct ParseResult {
    ParseStatus status;
    http::StatusCode errorStatus;
    std::size_t headLength;
  };

  // Parses the request head at the beginning of buffer.
  ParseResult parse(std::string_view buffer, std::size_t maxHeaderBytes);

  [[nodiscard]] http::Method method() const noexcept { return http::MethodFromStr(_method); }

  [[nodiscard]] std::string_view methodStr() const noexcept { return _method; }

  // Request target as received, query string included.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Target without its query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Query string without the leading '?', empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // "HTTP/1.0" or "HTTP/1.1".
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Value of the first header named name (case-insensitive), trimmed.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Whether the client wants the connection to stay open after the response (HTTP/1.1 default, or HTTP/1.0 with
  // "Connection: keep-alive").
  [[nodiscard]] bool wantsKeepAlive() const noexcept;

  // Whether a request body follows the head (Content-Length > 0 or Transfer-Encoding present).
  [[nodiscard]] bool hasBody() const noexcept;

  [[nodiscard]] std::size_t nbHeaders() const noexcept { return _headers.size(); }

 private:
  void reset() noexcept;

  std::string_view _method;
  std::string_view _target;
  std::string_view _path;
  std::string_view _query;
  std::string_view _version;
  std::vector<std::pair<std::string_view, std::string_view>> _headers;
};

}  // namespace floodgate
