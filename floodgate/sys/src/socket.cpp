#include "floodgate/socket.hpp"

#include <sys/socket.h>

#include <cstdint>

#include "floodgate/errno-throw.hpp"
#include "floodgate/log.hpp"
#include "floodgate/socket-address.hpp"

namespace floodgate {

Socket::Socket(int family) : _baseFd(::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

uint16_t Socket::bindAndListen(const SocketAddress& address, bool reusePort) {
  static constexpr int kEnable = 1;
  const int fd = _baseFd.fd();
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed for fd # {}", fd);
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed for fd # {}", fd);
  }
  if (::bind(fd, address.raw(), address.len) != 0) {
    throw_errno("bind failed for {}", address.str());
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    throw_errno("listen failed for {}", address.str());
  }
  SocketAddress bound;
  bound.len = sizeof(bound.storage);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound.storage), &bound.len) != 0) {
    throw_errno("getsockname failed for fd # {}", fd);
  }
  return bound.port();
}

}  // namespace floodgate
