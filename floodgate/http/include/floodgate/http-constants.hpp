#pragma once

#include <string_view>

#include "floodgate/http-status-code.hpp"

namespace floodgate::http {

// Header field names are case-insensitive (RFC 7230). They are stored here in their canonical form for emission,
// parsing code compares them with CaseInsensitiveEqual.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";

// Header names
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view CacheControl = "Cache-Control";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Forwarded = "Forwarded";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Pragma = "Pragma";
inline constexpr std::string_view Referer = "Referer";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";
inline constexpr std::string_view XForwardedFor = "X-Forwarded-For";
inline constexpr std::string_view XRealIp = "X-Real-IP";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Header values (lowercase tokens, compared case-insensitively)
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";

inline constexpr std::string_view AllowedMethods = "GET, HEAD";

// Speed test clients must never be served a cached payload.
inline constexpr std::string_view NoCacheDirectives = "no-cache, no-store, no-transform, must-revalidate";
inline constexpr std::string_view NoCache = "no-cache";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeTextHtml = "text/html; charset=utf-8";

// Reason phrases (only those we emit)
inline constexpr std::string_view ReasonOK = "OK";                                               // 200
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                              // 400
inline constexpr std::string_view ReasonNotFound = "Not Found";                                  // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";                 // 405
inline constexpr std::string_view ReasonRequestTimeout = "Request Timeout";                      // 408
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";                   // 413
inline constexpr std::string_view ReasonHeadersTooLarge = "Request Header Fields Too Large";     // 431
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";           // 500
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";              // 503
inline constexpr std::string_view ReasonHTTPVersionNotSupported = "HTTP Version Not Supported";  // 505

constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeRequestTimeout:
      return ReasonRequestTimeout;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeRequestHeaderFieldsTooLarge:
      return ReasonHeadersTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    case StatusCodeHTTPVersionNotSupported:
      return ReasonHTTPVersionNotSupported;
    default:
      return {};
  }
}

}  // namespace floodgate::http
