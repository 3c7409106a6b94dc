#include "floodgate/server-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "floodgate/http-header.hpp"
#include "floodgate/listener-config.hpp"
#include "floodgate/log.hpp"
#include "floodgate/string-equal-ignore-case.hpp"
#include "floodgate/tls-config.hpp"

namespace floodgate {

namespace {

// Headers computed by the server for each response.
constexpr std::string_view kReservedHeaders[] = {"Connection", "Content-Length", "Content-Type", "Date",
                                                 "Transfer-Encoding"};

bool IsTokenChar(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

void ValidateGlobalHeader(const http::Header& header) {
  if (header.name.empty() || !std::ranges::all_of(header.name, IsTokenChar)) {
    log::critical("Invalid global header name '{}'", header.name);
    throw std::invalid_argument("header has invalid name");
  }
  if (std::ranges::any_of(kReservedHeaders,
                          [&header](std::string_view reserved) { return CaseInsensitiveEqual(reserved, header.name); })) {
    log::critical("Attempt to set reserved header '{}'", header.name);
    throw std::invalid_argument("attempt to set reserved header");
  }
  if (std::ranges::any_of(header.value, [](char ch) { return ch == '\r' || ch == '\n' || ch == '\0'; })) {
    throw std::invalid_argument("header has invalid value");
  }
}

}  // namespace

void ServerConfig::validate() const {
  if (listeners.empty()) {
    throw std::invalid_argument("at least one listener is required");
  }
  for (const auto& listener : listeners) {
    if (listener.address.empty()) {
      throw std::invalid_argument("listener address must not be empty");
    }
    if (listener.isTls) {
      listener.tlsConfig.validate();
    }
  }
  if (nbThreadsPerListener == 0) {
    throw std::invalid_argument("nbThreadsPerListener must be > 0");
  }
  if (maxSize == 0) {
    throw std::invalid_argument("maxSize must be > 0");
  }
  if (chunkSize == 0 || chunkSize > kMaxChunkSize) {
    throw std::invalid_argument("chunkSize must be in [1, 16 MiB]");
  }
  if (contentType.empty()) {
    throw std::invalid_argument("contentType must not be empty");
  }
  for (const auto& path : indexPaths) {
    if (!path.starts_with('/')) {
      throw std::invalid_argument("index paths must start with '/'");
    }
  }
  if (std::ranges::any_of(indexSizes, [](const std::string& size) { return size.empty(); })) {
    throw std::invalid_argument("index sizes must not be empty");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (headerReadTimeout.count() < 0) {
    throw std::invalid_argument("headerReadTimeout must be non-negative");
  }
  if (sendTimeout.count() <= 0) {
    throw std::invalid_argument("sendTimeout must be > 0");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxPerEventWriteBytes == 0) {
    throw std::invalid_argument("maxPerEventWriteBytes must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (drainTimeout.count() < 0) {
    throw std::invalid_argument("drainTimeout must be non-negative");
  }
  std::ranges::for_each(globalHeaders, ValidateGlobalHeader);
}

ServerConfig& ServerConfig::withListener(std::string_view address) {
  return withListener(ListenerConfig{std::string(address), false, {}, false});
}

ServerConfig& ServerConfig::withTlsListener(std::string_view address, TLSConfig tlsConfig) {
  return withListener(ListenerConfig{std::string(address), true, std::move(tlsConfig), false});
}

ServerConfig& ServerConfig::withListener(ListenerConfig listener) {
  listeners.push_back(std::move(listener));
  return *this;
}

ServerConfig& ServerConfig::withNbThreadsPerListener(uint32_t nbThreads) {
  nbThreadsPerListener = nbThreads;
  return *this;
}

ServerConfig& ServerConfig::withMaxSize(uint64_t bytes) {
  maxSize = bytes;
  return *this;
}

ServerConfig& ServerConfig::withChunkSize(std::size_t bytes) {
  chunkSize = bytes;
  return *this;
}

ServerConfig& ServerConfig::withContentType(std::string_view value) {
  contentType = value;
  return *this;
}

ServerConfig& ServerConfig::withIndexPaths(std::vector<std::string> paths) {
  indexPaths = std::move(paths);
  return *this;
}

ServerConfig& ServerConfig::withIndexSizes(std::vector<std::string> sizes) {
  indexSizes = std::move(sizes);
  return *this;
}

ServerConfig& ServerConfig::withIndexTemplateFile(std::string_view path) {
  indexTemplateFile = path;
  return *this;
}

ServerConfig& ServerConfig::withAccessLogPath(std::string_view path) {
  accessLogPath = path;
  return *this;
}

ServerConfig& ServerConfig::withTrustForwardedHeaders(bool on) {
  trustForwardedHeaders = on;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveMode(bool on) {
  enableKeepAlive = on;
  return *this;
}

ServerConfig& ServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  maxRequestsPerConnection = maxRequests;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  keepAliveTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withHeaderReadTimeout(std::chrono::milliseconds timeout) {
  headerReadTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withSendTimeout(std::chrono::milliseconds timeout) {
  sendTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t value) {
  maxHeaderBytes = value;
  return *this;
}

ServerConfig& ServerConfig::withMaxPerEventWriteBytes(std::size_t bytes) {
  maxPerEventWriteBytes = bytes;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withDrainTimeout(std::chrono::milliseconds timeout) {
  drainTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withGlobalHeaders(std::vector<http::Header> headers) {
  globalHeaders = std::move(headers);
  return *this;
}

ServerConfig& ServerConfig::withGlobalHeader(http::Header header) {
  globalHeaders.push_back(std::move(header));
  return *this;
}

}  // namespace floodgate
