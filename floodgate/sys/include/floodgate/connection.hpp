#pragma once

#include <string>

#include "floodgate/base-fd.hpp"
#include "floodgate/socket.hpp"

namespace floodgate {

// RAII client connection accepted from a non-blocking listening socket.
class Connection {
 public:
  Connection() noexcept = default;

  // Accept one pending connection. The result is falsy if there is none (or on accept error, which is logged).
  explicit Connection(const Socket& socket);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Numeric IP address of the peer.
  [[nodiscard]] const std::string& peerAddress() const noexcept { return _peerAddress; }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
  std::string _peerAddress;
};

}  // namespace floodgate
