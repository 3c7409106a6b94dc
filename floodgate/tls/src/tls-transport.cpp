#include "floodgate/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

#include "floodgate/log.hpp"
#include "floodgate/transport.hpp"

namespace floodgate {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {
inline bool isRetry(int code) { return code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE; }
}  // namespace

ITransport::TransportResult TlsTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, handshake(TransportHint::ReadReady)};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  if (::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed) == 1) [[likely]] {
    return ret;
  }

  ret.bytesProcessed = 0;

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    // close_notify from the peer.
    return ret;
  }
  if (isRetry(err)) {
    ret.want = (err == SSL_ERROR_WANT_WRITE) ? TransportHint::WriteReady : TransportHint::ReadReady;
    return ret;
  }

  if (err == SSL_ERROR_SYSCALL) {
    if (errno == EAGAIN) {
      ret.want = TransportHint::ReadReady;
      return ret;
    }
    // Peer closed the TCP connection without close_notify: treat like an orderly close,
    // the connection has nothing more to give anyway.
    if (errno == 0 && ::ERR_peek_error() == 0) {
      return ret;
    }
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

ITransport::TransportResult TlsTransport::write(std::string_view data) {
  TransportResult ret{0, handshake(TransportHint::WriteReady)};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  // OpenSSL rejects zero-length writes with 'bad length'.
  if (data.empty() || ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &ret.bytesProcessed) == 1) {
    return ret;
  }

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  ret.bytesProcessed = 0;  // caller retries with the same data
  if (isRetry(err)) {
    ret.want = (err == SSL_ERROR_WANT_WRITE) ? TransportHint::WriteReady : TransportHint::ReadReady;
    return ret;
  }

  if (err == SSL_ERROR_SYSCALL) {
    const auto savedErrno = errno;
    if (savedErrno == EAGAIN) {
      ret.want = TransportHint::WriteReady;
      return ret;
    }
    if (savedErrno == EPIPE || savedErrno == ECONNRESET) {
      log::debug("TLS write: peer went away (errno={})", savedErrno);
      ::ERR_clear_error();
      ret.want = TransportHint::Error;
      return ret;
    }
  }

  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

void TlsTransport::shutdown() noexcept {
  auto* ssl = _ssl.get();
  if (ssl == nullptr || !_handshakeDone) {
    return;
  }
  // At most two immediate calls: the first sends our close_notify, the second (only when the first returned 0)
  // processes the peer's one if it already arrived. WANT_READ / WANT_WRITE are not waited for, the owner closes the
  // socket right after.
  const auto rc = ::SSL_shutdown(ssl);
  if (rc == 0) {
    ::SSL_shutdown(ssl);
  }
  ::ERR_clear_error();
}

void TlsTransport::logErrorIfAny() const noexcept {
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::error("TLS transport OpenSSL error: {} (handshake done={})", std::string_view(errBuf), _handshakeDone);
  }
}

TransportHint TlsTransport::handshake(TransportHint want) {
  if (!_handshakeDone) {
    const int handshakeRet = ::SSL_do_handshake(_ssl.get());
    if (handshakeRet == 1) {
      _handshakeDone = true;
      log::debug("TLS handshake done: {} {}", ::SSL_get_version(_ssl.get()), ::SSL_get_cipher_name(_ssl.get()));
    } else {
      const int err = ::SSL_get_error(_ssl.get(), handshakeRet);
      if (isRetry(err)) {
        return (err == SSL_ERROR_WANT_WRITE) ? TransportHint::WriteReady : TransportHint::ReadReady;
      }
      if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
        return want;
      }
      logErrorIfAny();
      return TransportHint::Error;
    }
  }
  return TransportHint::None;
}

}  // namespace floodgate
