#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "floodgate/base-fd.hpp"
#include "floodgate/http-header.hpp"
#include "floodgate/http-status-code.hpp"

namespace floodgate::test {
using namespace std::chrono_literals;

// Blocking IPv4 loopback client socket, connected at construction (retried until timeout).
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Throws std::system_error if the socket cannot be created, std::runtime_error if connect keeps failing.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 1000ms);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  // Value of the first header named name (case-insensitive).
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;

  http::StatusCode statusCode{0};
  std::string version;
  std::string reason;
  std::vector<http::Header> headers;
  std::string body;
};

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads one complete response (head, then Content-Length body bytes unless headOnly), or until timeout / close.
std::string recvResponse(int fd, bool headOnly = false, std::chrono::milliseconds totalTimeout = 5000ms);

// Reads until the peer closes the connection or timeout.
std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout = 5000ms);

// Receives and discards bytes until at least nbBytes have been read, the peer closes, or timeout.
// Returns the number of bytes read.
std::size_t recvAtLeast(int fd, std::size_t nbBytes, std::chrono::milliseconds totalTimeout = 5000ms);

// Builds a request head with a Host header and the given Connection header value (omitted if empty).
std::string buildRequest(std::string_view method, std::string_view target, std::string_view connection = "close",
                         const std::vector<http::Header>& extraHeaders = {});

// Parses a raw HTTP/1.1 response. Not resilient to all malformed cases, just for test consumption.
// When several responses are concatenated, only the first one is parsed, its body being limited to Content-Length.
std::optional<ParsedResponse> parseResponse(std::string_view raw, bool headOnly = false);

// Same as parseResponse, but throws std::runtime_error on failure.
ParsedResponse parseResponseOrThrow(std::string_view raw, bool headOnly = false);

// Sends raw on a new connection and returns everything received until the server closes it.
std::string sendAndCollect(uint16_t port, std::string_view raw);

// Sends a single request with "Connection: close" and returns the parsed response. Throws std::runtime_error on
// failure.
ParsedResponse request(uint16_t port, std::string_view method, std::string_view target,
                       const std::vector<http::Header>& extraHeaders = {});

// Splits a raw buffer holding several pipelined responses (to requests with the given head-only flags).
std::vector<ParsedResponse> splitResponses(std::string_view raw, const std::vector<bool>& headOnly);

// Whether raw is exactly one response head, without any byte after it.
bool noBodyAfterHead(std::string_view raw);

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

// Returns true if a TCP connection to the loopback port can be established.
bool AttemptConnect(uint16_t port);

// Polls predicate every millisecond until it returns true or timeout elapses. Returns the last predicate value.
template <class Predicate>
bool WaitFor(Predicate&& predicate, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return predicate();
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

}  // namespace floodgate::test
