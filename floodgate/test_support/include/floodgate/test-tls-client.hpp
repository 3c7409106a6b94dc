#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "floodgate/http-header.hpp"
#include "floodgate/test-util.hpp"
#include "floodgate/tls-raii.hpp"

namespace floodgate::test {

// Lightweight RAII TLS client used in tests.
//  * Connects to the loopback port and performs the handshake at construction (poll based, non-blocking socket)
//  * No peer verification: tests use self-signed server certificates
//  * Simple helpers to send a request and read the response
// Not intended for production usage; minimal error handling for brevity.
class TlsClient {
 public:
  explicit TlsClient(uint16_t port, std::string_view serverName = "localhost");

  TlsClient(const TlsClient&) = delete;
  TlsClient(TlsClient&&) noexcept = delete;
  TlsClient& operator=(const TlsClient&) = delete;
  TlsClient& operator=(TlsClient&&) noexcept = delete;

  ~TlsClient();

  [[nodiscard]] bool handshakeOk() const noexcept { return _handshakeOk; }

  // Negotiated protocol version, "TLSv1.3" for instance. Empty if the handshake failed.
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Send arbitrary bytes (only if handshake succeeded).
  bool writeAll(std::string_view data);

  // Read until close (or error / timeout). Returns accumulated data.
  std::string readAll(std::chrono::milliseconds timeout = std::chrono::seconds{5});

  // Convenience: perform a request with "Connection: close" and read the entire response.
  std::string request(std::string_view method, std::string_view target,
                      const std::vector<http::Header>& extraHeaders = {});

 private:
  // Wait for socket to be ready for reading (POLLIN) or writing (POLLOUT).
  // Returns true if ready, false on timeout or error
  bool waitForSocketReady(short events, std::chrono::milliseconds timeout);

  ClientConnection _cnx;
  SslCtxPtr _ctx{nullptr, ::SSL_CTX_free};
  SslPtr _ssl{nullptr, ::SSL_free};
  std::string _version;
  bool _handshakeOk{false};
};

}  // namespace floodgate::test
