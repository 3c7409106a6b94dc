#pragma once

#include <openssl/ssl.h>

#include <cstddef>
#include <string_view>
#include <utility>

#include "floodgate/tls-raii.hpp"
#include "floodgate/transport.hpp"

namespace floodgate {

// TLS transport (OpenSSL). The handshake is driven transparently by the first read / write calls.
class TlsTransport : public ITransport {
 public:
  explicit TlsTransport(SslPtr sslPtr) noexcept : _ssl(std::move(sslPtr)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  [[nodiscard]] bool handshakeDone() const noexcept override { return _handshakeDone; }

  // Perform best-effort bidirectional TLS shutdown (non-blocking). Safe to call multiple times.
  void shutdown() noexcept override;

  [[nodiscard]] SSL* rawSsl() const noexcept { return _ssl.get(); }

  void logErrorIfAny() const noexcept;

 private:
  TransportHint handshake(TransportHint want);

  SslPtr _ssl;
  bool _handshakeDone{false};
};

}  // namespace floodgate
