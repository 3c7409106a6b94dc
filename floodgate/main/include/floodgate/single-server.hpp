#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "floodgate/event-loop.hpp"
#include "floodgate/http-request.hpp"
#include "floodgate/http-response-head.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/internal/connection-state.hpp"
#include "floodgate/internal/lifecycle.hpp"
#include "floodgate/listener-config.hpp"
#include "floodgate/router.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/server-resources.hpp"
#include "floodgate/server-stats.hpp"
#include "floodgate/socket.hpp"
#include "floodgate/tls-context.hpp"

namespace floodgate {

// SingleServer
//  - One listening socket served by one single-threaded level-triggered epoll loop, running in the thread calling
//    run() / runUntil().
//  - Not internally synchronized, except for stop(), beginDrain(), stats(), isRunning() and isDraining() which may be
//    called from any thread.
//  - To use several cores, or several listeners, use MultiServer which runs several SingleServer instances, one per
//    thread, sharing their port with SO_REUSEPORT.
//
// Streaming model:
//  - A payload response holds one RandomStream. The next chunk is generated only once the previous one has been
//    fully accepted by the transport, so a slow client paces generation and memory stays bounded by the chunk size.
//  - At most maxPerEventWriteBytes are written per connection and per wakeup. Thanks to level-triggered epoll, a
//    connection that still has data to send is reported writable again at the next poll, which interleaves the
//    concurrent transfers.
class SingleServer {
 public:
  // Standalone server for the first listener of config. Validates config, loads the TLS credentials if needed and
  // builds its own resources.
  // Throws std::invalid_argument for invalid configuration, TlsCredentialFailure for unloadable credentials and
  // ListenerBindFailure if the listener cannot be bound.
  explicit SingleServer(const ServerConfig& config, std::shared_ptr<TransferSink> transferSink = {});

  // Server for one listener, sharing resources and TLS context with other servers.
  // config is expected to be valid. tlsContext must be set for TLS listeners.
  // Throws ListenerBindFailure if the listener cannot be bound.
  SingleServer(const ServerConfig& config, const ListenerConfig& listener,
               std::shared_ptr<const ServerResources> resources, std::shared_ptr<const TlsContext> tlsContext = {},
               bool reusePort = false);

  SingleServer(const SingleServer&) = delete;
  SingleServer(SingleServer&&) = delete;
  SingleServer& operator=(const SingleServer&) = delete;
  SingleServer& operator=(SingleServer&&) = delete;

  ~SingleServer();

  // Run the event loop until stop() is called, or until a drain (beginDrain() or SIGINT / SIGTERM once
  // SignalHandler is enabled) completes. Blocking for the calling thread.
  void run();

  // Like run(), but also exits (aborting in-flight transfers) as soon as predicate returns true. The predicate is
  // checked once per loop iteration, so at least every pollInterval.
  void runUntil(const std::function<bool()>& predicate);

  // Requests the event loop to stop. In-flight transfers are aborted. Safe to call from another thread, non blocking.
  void stop() noexcept;

  // Stop accepting connections, let in-flight responses complete and close connections once their response is sent.
  // When maxWait > 0, transfers still running after it are aborted. Safe to call from another thread.
  void beginDrain(std::chrono::milliseconds maxWait = std::chrono::milliseconds{0}) noexcept;

  // Effective port of the listener (the one chosen by the kernel when the configured port was 0).
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] const std::string& address() const noexcept { return _address; }

  [[nodiscard]] bool isTls() const noexcept { return static_cast<bool>(_tlsContext); }

  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning(); }

  [[nodiscard]] bool isDraining() const noexcept { return _lifecycle.isDraining(); }

  [[nodiscard]] ServerStats stats() const noexcept;

 private:
  using ConnectionMap = std::unordered_map<int, std::unique_ptr<internal::ConnectionState>>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void initListener();
  void prepareRun();

  void eventLoop();
  void sweepConnections();
  void acceptNewConnections();

  void handleReadableClient(int fd);
  void handleWritableClient(int fd);

  // Parses and answers the buffered requests, as long as no response is in flight.
  // Returns false if the connection has been closed.
  bool processRequests(ConnectionMapIt cnxIt);

  void answerRequest(internal::ConnectionState& state, const HttpRequest& request);

  void answerError(internal::ConnectionState& state, const HttpRequest* request, http::StatusCode status,
                   std::string_view body);

  // Serializes head (and body if any) in the output buffer and starts tracking the response.
  void queueResponse(internal::ConnectionState& state, HttpResponseHead& head, std::string_view body,
                     TransferRecord record);

  // Writes as much pending output as allowed, generating payload chunks on the way.
  // Returns false if the connection has been closed.
  bool flushOutbound(ConnectionMapIt cnxIt);

  // Finalizes the response in flight as completed. Returns false if the connection has been closed.
  bool onResponseSent(ConnectionMapIt cnxIt);

  bool updateInterest(internal::ConnectionState& state, EventBmp interest);

  ConnectionMapIt closeConnection(ConnectionMapIt cnxIt, std::string_view abortReason);

  void closeListener() noexcept;
  void closeAllConnections(std::string_view abortReason);

  struct StatsInternal {
    std::atomic<uint64_t> connectionsAccepted{0};
    std::atomic<uint64_t> requestsServed{0};
    std::atomic<uint64_t> transfersStarted{0};
    std::atomic<uint64_t> transfersCompleted{0};
    std::atomic<uint64_t> transfersAborted{0};
    std::atomic<uint64_t> randomBytesGenerated{0};
    std::atomic<uint64_t> bodyBytesWritten{0};
  } _stats;

  ServerConfig _config;
  std::string _address;
  std::shared_ptr<const ServerResources> _resources;
  std::shared_ptr<const TlsContext> _tlsContext;
  std::chrono::milliseconds _handshakeTimeout{};
  Socket _listenSocket;
  EventLoop _eventLoop;
  internal::Lifecycle _lifecycle;
  ConnectionMap _connections;
  HttpRequest _request;
  SteadyTimePoint _lastSweep;
  uint16_t _port{0};
  bool _reusePort{false};
};

}  // namespace floodgate
