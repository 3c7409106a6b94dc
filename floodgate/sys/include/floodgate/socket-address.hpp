#pragma once

#include <sys/socket.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace floodgate {

struct SocketAddress {
  [[nodiscard]] int family() const noexcept { return storage.ss_family; }

  [[nodiscard]] const sockaddr* raw() const noexcept { return reinterpret_cast<const sockaddr*>(&storage); }

  [[nodiscard]] uint16_t port() const noexcept;

  // Numeric host only ("192.0.2.1", "2001:db8::1"), without port.
  [[nodiscard]] std::string host() const;

  // "192.0.2.1:80" or "[2001:db8::1]:80"
  [[nodiscard]] std::string str() const;

  sockaddr_storage storage{};
  socklen_t len{0};
};

// Parse a listen address and resolve it to a bindable socket address. Accepted forms:
//   "8080", ":8080"            -> all IPv4 interfaces
//   "127.0.0.1:8080"           -> numeric IPv4
//   "[::]:8080", "[::1]:0"     -> numeric IPv6
//   "localhost:8080"           -> resolved host name (first result)
// Throws std::invalid_argument if the string is malformed, std::system_error if the host cannot be resolved.
SocketAddress ResolveListenAddress(std::string_view address);

}  // namespace floodgate
