#pragma once

#include <cstdint>

#include "floodgate/base-fd.hpp"
#include "floodgate/socket-address.hpp"

namespace floodgate {

// RAII non-blocking listening socket.
class Socket {
 public:
  Socket() noexcept = default;

  // Create a non-blocking stream socket for the given address family.
  // Throws std::system_error on failure.
  explicit Socket(int family);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to address (SO_REUSEADDR always, SO_REUSEPORT if requested) and start listening.
  // Returns the effective port, which differs from the requested one when binding to port 0.
  // Throws std::system_error on failure.
  uint16_t bindAndListen(const SocketAddress& address, bool reusePort);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace floodgate
