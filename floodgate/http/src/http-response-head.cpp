#include "floodgate/http-response-head.hpp"

#include <span>
#include <string>
#include <string_view>

#include "floodgate/http-constants.hpp"
#include "floodgate/http-header.hpp"
#include "floodgate/timedef.hpp"
#include "floodgate/timestring.hpp"

namespace floodgate {

namespace {

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
}

}  // namespace

std::string HttpResponseHead::str(SysTimePoint date, std::span<const http::Header> globalHeaders) const {
  std::string out;
  out.reserve(256);

  out.append(http::HTTP11Sv).push_back(' ');
  out.append(std::to_string(_status)).push_back(' ');
  out.append(http::ReasonPhraseFor(_status)).append(http::CRLF);

  char dateBuf[kRFC7231DateStrLen];
  AppendHeader(out, http::Date, std::string_view(dateBuf, TimeToStringRFC7231(date, dateBuf)));
  if (!_contentType.empty()) {
    AppendHeader(out, http::ContentType, _contentType);
  }
  AppendHeader(out, http::ContentLength, std::to_string(_contentLength));
  AppendHeader(out, http::Connection, _close ? http::close : http::keepalive);
  for (const auto& [name, value] : _headers) {
    AppendHeader(out, name, value);
  }
  for (const auto& header : globalHeaders) {
    AppendHeader(out, header.name, header.value);
  }
  out.append(http::CRLF);
  return out;
}

std::string QuotedFilename(std::string_view filename) {
  std::string ret;
  ret.reserve(filename.size() + 2U);
  ret.push_back('"');
  for (char ch : filename) {
    if (ch == '"' || ch == '\\') {
      ret.push_back('\\');
    }
    ret.push_back(ch);
  }
  ret.push_back('"');
  return ret;
}

}  // namespace floodgate
