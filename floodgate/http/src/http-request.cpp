#include "floodgate/http-request.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>

#include "floodgate/http-constants.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/string-equal-ignore-case.hpp"
#include "floodgate/string-trim.hpp"

namespace floodgate {

namespace {

// RFC 9110 5.6.2 tchar
constexpr bool IsTokenChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

constexpr bool IsToken(std::string_view str) noexcept { return !str.empty() && std::ranges::all_of(str, IsTokenChar); }

// Visible characters only: no spaces, no controls.
constexpr bool IsValidTarget(std::string_view target) noexcept {
  return std::ranges::all_of(target, [](char ch) { return ch > ' ' && ch != '\x7f'; });
}

constexpr bool IsValidFieldValue(std::string_view value) noexcept {
  return std::ranges::none_of(value, [](char ch) { return ch == '\0' || ch == '\r' || ch == '\n'; });
}

}  // namespace

void HttpRequest::reset() noexcept {
  _method = {};
  _target = {};
  _path = {};
  _query = {};
  _version = {};
  _headers.clear();
}

HttpRequest::ParseResult HttpRequest::parse(std::string_view buffer, std::size_t maxHeaderBytes) {
  reset();

  // Tolerate empty lines before the request line (RFC 9112 2.2), typically left over by a previous request.
  std::size_t begPos = 0;
  while (buffer.substr(begPos).starts_with(http::CRLF)) {
    begPos += http::CRLF.size();
  }

  const auto endPos = buffer.find(http::DoubleCRLF, begPos);
  if (endPos == std::string_view::npos) {
    if (buffer.size() > maxHeaderBytes) {
      return {ParseStatus::Error, http::StatusCodeRequestHeaderFieldsTooLarge, 0};
    }
    return {ParseStatus::NeedMore, 0, 0};
  }
  const std::size_t headLength = endPos + http::DoubleCRLF.size();
  if (headLength > maxHeaderBytes) {
    return {ParseStatus::Error, http::StatusCodeRequestHeaderFieldsTooLarge, 0};
  }
  static constexpr ParseResult kBadRequest{ParseStatus::Error, http::StatusCodeBadRequest, 0};

  // Request line: method SP request-target SP HTTP-version
  const std::string_view head = buffer.substr(begPos, endPos + http::CRLF.size() - begPos);
  auto lineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, lineEnd);
  const auto firstSp = requestLine.find(' ');
  const auto secondSp = requestLine.find(' ', firstSp + 1);
  if (firstSp == std::string_view::npos || secondSp == std::string_view::npos ||
      requestLine.find(' ', secondSp + 1) != std::string_view::npos) {
    return kBadRequest;
  }
  _method = requestLine.substr(0, firstSp);
  _target = requestLine.substr(firstSp + 1, secondSp - firstSp - 1);
  _version = requestLine.substr(secondSp + 1);
  if (!IsToken(_method) || _target.empty() || !_target.starts_with('/') || !IsValidTarget(_target)) {
    return kBadRequest;
  }
  if (_version != http::HTTP11Sv && _version != http::HTTP10Sv) {
    // Well formed, but a version we do not speak.
    if (_version.size() == http::HTTP11Sv.size() && _version.starts_with("HTTP/") && _version[6] == '.') {
      return {ParseStatus::Error, http::StatusCodeHTTPVersionNotSupported, 0};
    }
    return kBadRequest;
  }
  const auto queryPos = _target.find('?');
  _path = _target.substr(0, queryPos);
  if (queryPos != std::string_view::npos) {
    _query = _target.substr(queryPos + 1);
  }
  // Fragments are never sent by conforming clients, drop them anyway.
  _path = _path.substr(0, _path.find('#'));

  // Header fields: name ":" OWS value OWS
  for (std::size_t linePos = lineEnd + http::CRLF.size(); linePos < head.size();
       linePos = lineEnd + http::CRLF.size()) {
    lineEnd = head.find(http::CRLF, linePos);
    const std::string_view line = head.substr(linePos, lineEnd - linePos);
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return kBadRequest;
    }
    // No whitespace allowed between name and colon, obsolete line folding is rejected as well.
    const std::string_view name = line.substr(0, colonPos);
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    if (!IsToken(name) || !IsValidFieldValue(value)) {
      return kBadRequest;
    }
    _headers.emplace_back(name, value);
  }

  return {ParseStatus::Ok, 0, headLength};
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_headers, [name](const auto& header) {
    return CaseInsensitiveEqual(header.first, name);
  });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool HttpRequest::wantsKeepAlive() const noexcept {
  const auto connection = headerValueOrEmpty(http::Connection);
  if (_version == http::HTTP10Sv) {
    return ContainsTokenCaseInsensitive(connection, http::keepalive);
  }
  return !ContainsTokenCaseInsensitive(connection, http::close);
}

bool HttpRequest::hasBody() const noexcept {
  if (headerValue(http::TransferEncoding)) {
    return true;
  }
  const auto contentLength = headerValueOrEmpty(http::ContentLength);
  return std::ranges::any_of(contentLength, [](char ch) { return ch != '0'; });
}

}  // namespace floodgate
