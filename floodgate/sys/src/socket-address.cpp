#include "floodgate/socket-address.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "floodgate/log.hpp"

namespace floodgate {

namespace {

uint16_t ParsePort(std::string_view portStr) {
  uint16_t port{};
  const auto* end = portStr.data() + portStr.size();
  const auto [ptr, errc] = std::from_chars(portStr.data(), end, port);
  if (portStr.empty() || errc != std::errc{} || ptr != end) {
    throw std::invalid_argument("Invalid port in listen address");
  }
  return port;
}

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

}  // namespace

uint16_t SocketAddress::port() const noexcept {
  if (family() == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
}

std::string SocketAddress::host() const {
  char buf[INET6_ADDRSTRLEN]{};
  const char* res = nullptr;
  if (family() == AF_INET6) {
    res = ::inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_addr, buf, sizeof(buf));
  } else if (family() == AF_INET) {
    res = ::inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(&storage)->sin_addr, buf, sizeof(buf));
  }
  if (res == nullptr) {
    return "unknown";
  }
  return buf;
}

std::string SocketAddress::str() const {
  if (family() == AF_INET6) {
    return "[" + host() + "]:" + std::to_string(port());
  }
  return host() + ":" + std::to_string(port());
}

SocketAddress ResolveListenAddress(std::string_view address) {
  std::string_view hostPart;
  std::string_view portPart;
  if (address.starts_with('[')) {
    const auto closing = address.find(']');
    if (closing == std::string_view::npos || closing + 1 >= address.size() || address[closing + 1] != ':') {
      throw std::invalid_argument("Invalid IPv6 listen address, expected [host]:port");
    }
    hostPart = address.substr(1, closing - 1);
    portPart = address.substr(closing + 2);
  } else {
    const auto colonPos = address.rfind(':');
    if (colonPos == std::string_view::npos) {
      portPart = address;
    } else {
      hostPart = address.substr(0, colonPos);
      portPart = address.substr(colonPos + 1);
    }
  }

  SocketAddress ret;
  const uint16_t port = ParsePort(portPart);
  if (hostPart.empty() || hostPart == "*") {
    auto* in = reinterpret_cast<sockaddr_in*>(&ret.storage);
    in->sin_family = AF_INET;
    in->sin_addr.s_addr = htonl(INADDR_ANY);
    in->sin_port = htons(port);
    ret.len = sizeof(sockaddr_in);
    return ret;
  }

  const std::string host(hostPart);
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo* res = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || res == nullptr) {
    log::error("Unable to resolve listen host '{}': {}", host, ::gai_strerror(rc));
    throw std::system_error(std::make_error_code(std::errc::address_not_available),
                            "Unable to resolve listen host " + host);
  }
  AddrInfoPtr resPtr(res, ::freeaddrinfo);
  std::memcpy(&ret.storage, res->ai_addr, res->ai_addrlen);
  ret.len = static_cast<socklen_t>(res->ai_addrlen);
  if (ret.family() == AF_INET6) {
    reinterpret_cast<sockaddr_in6*>(&ret.storage)->sin6_port = htons(port);
  } else {
    reinterpret_cast<sockaddr_in*>(&ret.storage)->sin_port = htons(port);
  }
  return ret;
}

}  // namespace floodgate
