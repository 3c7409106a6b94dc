#pragma once

#include <openssl/ssl.h>

#include <memory>

#include "floodgate/tls-config.hpp"
#include "floodgate/tls-raii.hpp"

namespace floodgate {

// RAII wrapper around a server SSL_CTX configured from a TLSConfig.
// One context is shared by all the event loop threads of a listener: OpenSSL contexts are thread safe once
// configured, and each connection gets its own SSL object from makeSsl().
class TlsContext {
 public:
  // Throws TlsCredentialFailure if the certificate or the key cannot be loaded or do not match,
  // std::runtime_error for other configuration failures.
  explicit TlsContext(const TLSConfig& cfg);

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;
  TlsContext(TlsContext&&) noexcept = default;
  TlsContext& operator=(TlsContext&&) noexcept = default;

  ~TlsContext() = default;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

  // Create a server side SSL object attached to fd, ready for a non-blocking handshake.
  // Returns a null pointer (and logs) on failure.
  [[nodiscard]] SslPtr makeSsl(int fd) const;

 private:
  SslCtxPtr _ctx;
};

}  // namespace floodgate
