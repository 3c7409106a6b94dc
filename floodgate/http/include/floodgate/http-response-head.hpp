#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "floodgate/http-header.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/timedef.hpp"

namespace floodgate {

// Builder of a serialized HTTP/1.1 response head (status line, headers, empty line).
// The body is never part of it: payloads are streamed separately after the head.
class HttpResponseHead {
 public:
  explicit HttpResponseHead(http::StatusCode status = http::StatusCodeOK) noexcept : _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] uint64_t contentLength() const noexcept { return _contentLength; }

  HttpResponseHead& contentType(std::string_view contentType) {
    _contentType = contentType;
    return *this;
  }

  HttpResponseHead& contentLength(uint64_t contentLength) noexcept {
    _contentLength = contentLength;
    return *this;
  }

  // Emits "Connection: close" instead of "Connection: keep-alive".
  HttpResponseHead& close(bool close = true) noexcept {
    _close = close;
    return *this;
  }

  HttpResponseHead& header(std::string_view name, std::string_view value) {
    _headers.emplace_back(std::string(name), std::string(value));
    return *this;
  }

  // Serializes the head. Date is computed from 'date', globalHeaders are appended after the response specific ones.
  [[nodiscard]] std::string str(SysTimePoint date, std::span<const http::Header> globalHeaders = {}) const;

 private:
  std::string _contentType;
  std::vector<std::pair<std::string, std::string>> _headers;
  uint64_t _contentLength{};
  http::StatusCode _status;
  bool _close{false};
};

// Quoted form of a filename for a Content-Disposition header (backslash and double quote escaped).
std::string QuotedFilename(std::string_view filename);

}  // namespace floodgate
