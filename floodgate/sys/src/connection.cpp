#include "floodgate/connection.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include "floodgate/log.hpp"
#include "floodgate/socket-address.hpp"
#include "floodgate/socket.hpp"

namespace floodgate {

Connection::Connection(const Socket& socket) {
  SocketAddress peer;
  peer.len = sizeof(peer.storage);
  const int fd = ::accept4(socket.fd(), reinterpret_cast<sockaddr*>(&peer.storage), &peer.len,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("No more pending connection on socket fd # {}", socket.fd());
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socket.fd(), std::strerror(savedErr));
    }
    return;
  }
  _baseFd = BaseFd(fd);
  _peerAddress = peer.host();
  log::debug("Connection fd # {} opened from {}", fd, _peerAddress);
}

}  // namespace floodgate
