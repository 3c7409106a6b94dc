#include "floodgate/test-tls-client.hpp"

#include <fcntl.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <poll.h>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "floodgate/http-constants.hpp"
#include "floodgate/http-header.hpp"
#include "floodgate/log.hpp"
#include "floodgate/test-util.hpp"
#include "floodgate/tls-raii.hpp"

namespace floodgate::test {

namespace {

constexpr std::chrono::milliseconds kIoTimeout = std::chrono::seconds{10};

}  // namespace

TlsClient::TlsClient(uint16_t port, std::string_view serverName) : _cnx(port) {
  SslCtxPtr localCtx(::SSL_CTX_new(TLS_client_method()), ::SSL_CTX_free);
  if (!localCtx) {
    throw std::runtime_error("Unable to allocate SSL_CTX");
  }
  ::SSL_CTX_set_verify(localCtx.get(), SSL_VERIFY_NONE, nullptr);

  // Non-blocking mode for poll()-based I/O
  const int fd = _cnx.fd();
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  SslPtr localSsl(::SSL_new(localCtx.get()), ::SSL_free);
  if (!localSsl) {
    throw std::runtime_error("Unable to allocate SSL");
  }
  ::SSL_set_fd(localSsl.get(), fd);
  const std::string serverNameStr(serverName);
  ::SSL_set_tlsext_host_name(localSsl.get(), serverNameStr.c_str());

  _ctx = std::move(localCtx);
  _ssl = std::move(localSsl);

  for (;;) {
    const int rc = ::SSL_connect(_ssl.get());
    if (rc == 1) {
      break;
    }
    const int err = ::SSL_get_error(_ssl.get(), rc);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
      if (!waitForSocketReady(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, kIoTimeout)) {
        return;
      }
      continue;
    }
    for (auto errCode = ::ERR_get_error(); errCode != 0; errCode = ::ERR_get_error()) {
      char buf[256];
      ::ERR_error_string_n(errCode, buf, sizeof(buf));
      log::error("Client TLS handshake fatal error: {}", buf);
    }
    return;
  }
  _handshakeOk = true;
  const char* ver = ::SSL_get_version(_ssl.get());
  _version = ver != nullptr ? ver : "";
  const char* cipher = ::SSL_get_cipher_name(_ssl.get());
  log::debug("Client negotiated TLS ver={} cipher={}", _version, cipher != nullptr ? cipher : "?");
}

TlsClient::~TlsClient() {
  if (_handshakeOk && _ssl) {
    ::SSL_shutdown(_ssl.get());
  }
}

bool TlsClient::writeAll(std::string_view data) {
  if (!_handshakeOk) {
    return false;
  }
  while (!data.empty()) {
    const int written = ::SSL_write(_ssl.get(), data.data(), static_cast<int>(data.size()));
    if (written > 0) {
      data.remove_prefix(static_cast<std::size_t>(written));
      continue;
    }
    const int err = ::SSL_get_error(_ssl.get(), written);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
      if (!waitForSocketReady(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, kIoTimeout)) {
        return false;
      }
      continue;
    }
    return false;
  }
  return true;
}

std::string TlsClient::readAll(std::chrono::milliseconds timeout) {
  std::string out;
  if (!_handshakeOk) {
    return out;
  }
  static constexpr std::size_t kChunkSize = 16384;
  for (;;) {
    const auto oldSize = out.size();
    int readRet = 0;
    out.resize_and_overwrite(oldSize + kChunkSize, [this, oldSize, &readRet](char* data, std::size_t) {
      readRet = ::SSL_read(_ssl.get(), data + oldSize, static_cast<int>(kChunkSize));
      return readRet > 0 ? oldSize + static_cast<std::size_t>(readRet) : oldSize;
    });
    if (readRet > 0) {
      continue;
    }
    const int err = ::SSL_get_error(_ssl.get(), readRet);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
      if (!waitForSocketReady(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, timeout)) {
        break;
      }
      continue;
    }
    // SSL_ERROR_ZERO_RETURN (close_notify), or the peer closed the socket.
    break;
  }
  return out;
}

std::string TlsClient::request(std::string_view method, std::string_view target,
                               const std::vector<http::Header>& extraHeaders) {
  if (!writeAll(buildRequest(method, target, http::close, extraHeaders))) {
    return {};
  }
  return readAll();
}

bool TlsClient::waitForSocketReady(short events, std::chrono::milliseconds timeout) {
  pollfd pfd{_cnx.fd(), events, 0};
  const int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  return ret > 0 && (pfd.revents & (events | POLLHUP | POLLERR)) != 0;
}

}  // namespace floodgate::test
