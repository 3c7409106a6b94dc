#pragma once

#include <string>

#include "floodgate/tls-config.hpp"

namespace floodgate {

// One address to bind. A TLS listener terminates TLS with its own credentials, a plaintext one serves HTTP directly.
struct ListenerConfig {
  bool operator==(const ListenerConfig&) const noexcept = default;

  // "port", ":port", "host:port" or "[v6]:port". Port 0 picks an ephemeral port.
  std::string address;

  bool isTls{false};

  // Only meaningful when isTls is true.
  TLSConfig tlsConfig;

  // An optional listener that cannot bind is skipped with a warning instead of failing startup.
  bool optional{false};
};

}  // namespace floodgate
