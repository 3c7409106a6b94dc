#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "floodgate/http-header.hpp"
#include "floodgate/listener-config.hpp"

namespace floodgate {

struct ServerConfig {
  static constexpr uint64_t kDefaultMaxSize = uint64_t{10} << 30;  // 10 GiB
  static constexpr std::size_t kDefaultChunkSize = std::size_t{16} << 10;
  static constexpr std::size_t kMaxChunkSize = std::size_t{16} << 20;

  // ===========================================
  // Listeners
  // ===========================================
  // Every entry is bound independently. At least one is required.
  std::vector<ListenerConfig> listeners;

  // Number of event loop threads per listener. With more than one, the listeners share their port with SO_REUSEPORT
  // and the kernel balances accepted connections across them.
  uint32_t nbThreadsPerListener{1};

  // ===========================================
  // Payload
  // ===========================================
  // Largest byte count a size token may resolve to. Larger requests are rejected with 413.
  uint64_t maxSize{kDefaultMaxSize};

  // Size of each random chunk produced by the payload generator. Memory per active transfer is bounded by it.
  std::size_t chunkSize{kDefaultChunkSize};

  // Content-Type of payload responses.
  std::string contentType{"application/octet-stream"};

  // ===========================================
  // Index page
  // ===========================================
  // Exact paths answered with the index page.
  std::vector<std::string> indexPaths{"/"};

  // Size tokens listed on the index page, in order.
  std::vector<std::string> indexSizes{"1MB", "10MB", "100MB", "1GB", "10GB"};

  // HTML template file for the index page. Empty selects the built-in template.
  std::string indexTemplateFile;

  // ===========================================
  // Access log
  // ===========================================
  // Empty disables the access log, "-" writes it to standard output, anything else is a file opened in append mode.
  std::string accessLogPath;

  // Take the client address from X-Forwarded-For / X-Real-IP / Forwarded. Only enable behind a trusted proxy.
  bool trustForwardedHeaders{false};

  // ===========================================
  // Connection behavior
  // ===========================================
  bool enableKeepAlive{true};

  uint32_t maxRequestsPerConnection{100};

  // Idle connections (no request in progress) are closed after this duration.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::seconds{5}};

  // Maximum duration to receive a complete request head, from its first byte. 0 disables the check.
  std::chrono::milliseconds headerReadTimeout{std::chrono::seconds{10}};

  // A response that makes no write progress for this long is aborted.
  std::chrono::milliseconds sendTimeout{std::chrono::seconds{20}};

  // Request heads larger than this are answered with 431.
  std::size_t maxHeaderBytes{8192};

  // Bytes written to one connection per writable event before yielding to the other ready connections.
  std::size_t maxPerEventWriteBytes{std::size_t{256} << 10};

  // Event loop poll timeout. Bounds the latency of timeout checks and of stop requests.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{250}};

  // Grace period given to in-flight transfers on shutdown.
  std::chrono::milliseconds drainTimeout{std::chrono::seconds{5}};

  // Headers added to every response.
  std::vector<http::Header> globalHeaders{{"Server", "floodgate"}};

  // Throws std::invalid_argument for inconsistent values.
  void validate() const;

  ServerConfig& withListener(std::string_view address);

  ServerConfig& withTlsListener(std::string_view address, TLSConfig tlsConfig);

  ServerConfig& withListener(ListenerConfig listener);

  ServerConfig& withNbThreadsPerListener(uint32_t nbThreads);

  ServerConfig& withMaxSize(uint64_t bytes);

  ServerConfig& withChunkSize(std::size_t bytes);

  ServerConfig& withContentType(std::string_view contentType);

  ServerConfig& withIndexPaths(std::vector<std::string> paths);

  ServerConfig& withIndexSizes(std::vector<std::string> sizes);

  ServerConfig& withIndexTemplateFile(std::string_view path);

  ServerConfig& withAccessLogPath(std::string_view path);

  ServerConfig& withTrustForwardedHeaders(bool on = true);

  ServerConfig& withKeepAliveMode(bool on = true);

  ServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  ServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withHeaderReadTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withSendTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxPerEventWriteBytes(std::size_t bytes);

  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  ServerConfig& withDrainTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withGlobalHeaders(std::vector<http::Header> headers);

  ServerConfig& withGlobalHeader(http::Header header);

  bool operator==(const ServerConfig&) const noexcept = default;
};

}  // namespace floodgate
