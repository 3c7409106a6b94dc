#include "floodgate/client-address.hpp"

#include <string_view>

#include "floodgate/http-constants.hpp"
#include "floodgate/http-request.hpp"
#include "floodgate/string-equal-ignore-case.hpp"
#include "floodgate/string-trim.hpp"

namespace floodgate {

namespace {

std::string_view FirstListItem(std::string_view values) {
  return TrimOws(values.substr(0, values.find(',')));
}

// Forwarded: for=192.0.2.60;proto=http;by=203.0.113.43, for="[2001:db8:cafe::17]:4711"
std::string_view ForwardedFor(std::string_view forwarded) {
  const std::string_view element = FirstListItem(forwarded);
  for (std::string_view pairs = element; !pairs.empty();) {
    const auto semiPos = pairs.find(';');
    const std::string_view pair = TrimOws(pairs.substr(0, semiPos));
    pairs = semiPos == std::string_view::npos ? std::string_view{} : pairs.substr(semiPos + 1);

    if (!StartsWithCaseInsensitive(pair, "for=")) {
      continue;
    }
    std::string_view node = pair.substr(4);
    if (node.size() >= 2 && node.front() == '"' && node.back() == '"') {
      node = node.substr(1, node.size() - 2);
    }
    if (node.starts_with('[')) {
      // IPv6, possibly with a port after the closing bracket
      const auto closing = node.find(']');
      return closing == std::string_view::npos ? std::string_view{} : node.substr(1, closing - 1);
    }
    // IPv4 or obfuscated identifier, possibly with a port
    return node.substr(0, node.find(':'));
  }
  return {};
}

}  // namespace

std::string_view ResolveClientAddress(const HttpRequest& request, std::string_view peerAddress,
                                      bool trustForwardedHeaders) noexcept {
  if (!trustForwardedHeaders) {
    return peerAddress;
  }
  if (const auto xff = request.headerValue(http::XForwardedFor)) {
    if (const auto client = FirstListItem(*xff); !client.empty()) {
      return client;
    }
  }
  if (const auto realIp = request.headerValue(http::XRealIp)) {
    if (const auto client = TrimOws(*realIp); !client.empty()) {
      return client;
    }
  }
  if (const auto forwarded = request.headerValue(http::Forwarded)) {
    if (const auto client = ForwardedFor(*forwarded); !client.empty()) {
      return client;
    }
  }
  return peerAddress;
}

}  // namespace floodgate
