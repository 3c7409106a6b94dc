#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace floodgate {

// What the transport needs before a non-blocking operation that made no (or partial) progress can continue.
enum class TransportHint : uint8_t {
  None,        // operation completed, or orderly close for reads
  ReadReady,   // wait for the socket to be readable (EAGAIN on read, SSL_ERROR_WANT_READ)
  WriteReady,  // wait for the socket to be writable (EAGAIN on write, SSL_ERROR_WANT_WRITE)
  Error        // fatal: reset, broken pipe, TLS failure
};

// Byte transport of one connection. The request pipeline only sees this interface, so it behaves the same whether
// the connection is plaintext or TLS terminated.
class ITransport {
 public:
  struct TransportResult {
    std::size_t bytesProcessed;
    TransportHint want;
  };

  virtual ~ITransport() = default;

  // Non-blocking read. bytesProcessed == 0 with want == None means orderly close by the peer.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write. May be partial; when bytesProcessed < data.size() the hint tells what to wait for.
  // After a WriteReady / ReadReady hint, the same remaining bytes must be presented again.
  virtual TransportResult write(std::string_view data) = 0;

  [[nodiscard]] virtual bool handshakeDone() const noexcept { return true; }

  // Best effort protocol level close (TLS close_notify). The socket itself is closed by its owner.
  virtual void shutdown() noexcept {}
};

class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace floodgate
