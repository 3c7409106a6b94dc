#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "floodgate/server-config.hpp"
#include "floodgate/server-resources.hpp"
#include "floodgate/server-stats.hpp"
#include "floodgate/single-server.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate {

// MultiServer: binds every listener of a ServerConfig and serves each of them with nbThreadsPerListener
// SingleServer instances, each one running its event loop in a dedicated thread.
//
// All the servers share the same resources (router, index page, transfer sink): they are immutable once built, except
// for the sink which serializes its writers.
// When nbThreadsPerListener > 1, the servers of a listener bind the same port with SO_REUSEPORT and the kernel
// balances the accepted connections across them. If the configured port is 0, the ephemeral port picked for the first
// server is reused by the others.
//
// Lifecycle: start() (non blocking) or run() (blocking), then stop() or beginDrain(). A listener whose event loop
// fails does not stop the other ones.
class MultiServer {
 public:
  // A bound listener with its effective port.
  struct BoundListener {
    std::string address;
    uint16_t port{};
    bool isTls{false};
  };

  struct AggregatedStats {
    ServerStats total;
    std::vector<ServerStats> per;
  };

  // Validates config and binds all its listeners.
  // Throws std::invalid_argument for an invalid configuration, TlsCredentialFailure if the credentials of a TLS
  // listener cannot be loaded, ListenerBindFailure if a non optional listener cannot be bound (or if no listener at
  // all could be bound).
  explicit MultiServer(ServerConfig config, std::shared_ptr<TransferSink> transferSink = {});

  MultiServer(const MultiServer&) = delete;
  MultiServer(MultiServer&&) = delete;
  MultiServer& operator=(const MultiServer&) = delete;
  MultiServer& operator=(MultiServer&&) = delete;

  // Stops and joins the server threads if needed.
  ~MultiServer();

  // Starts all the servers and blocks until they have all returned, after stop(), a completed drain, or a termination
  // signal once SignalHandler is enabled. Rethrows the first exception raised by a server thread, if any.
  void run();

  // Starts all the servers in background threads and returns immediately.
  // Throws std::logic_error if already started.
  void start();

  // Aborts in-flight transfers, stops all servers and joins their threads. Blocking, but bounded by the poll interval.
  void stop() noexcept;

  // Asks all the servers to drain (see SingleServer::beginDrain). Non blocking, use run() or wait() to wait for the
  // end of the drain.
  void beginDrain(std::chrono::milliseconds maxWait = std::chrono::milliseconds{0}) noexcept;

  // Blocks until all the server threads launched by start() have returned (after a drain for instance).
  // Rethrows the first exception raised by a server thread, if any.
  void wait();

  [[nodiscard]] bool isRunning() const noexcept;

  [[nodiscard]] bool isDraining() const noexcept;

  // Listeners actually bound (skipped optional ones excluded), in configuration order.
  [[nodiscard]] const std::vector<BoundListener>& listeners() const noexcept { return _listeners; }

  // Effective port of the first bound listener.
  [[nodiscard]] uint16_t port() const noexcept { return _listeners.front().port; }

  [[nodiscard]] std::size_t nbServers() const noexcept { return _servers.size(); }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] AggregatedStats stats() const;

 private:
  void joinAll() noexcept;

  void rethrowIfError();

  ServerConfig _config;
  std::shared_ptr<const ServerResources> _resources;
  std::vector<BoundListener> _listeners;
  std::vector<std::unique_ptr<SingleServer>> _servers;
  std::vector<std::jthread> _threads;
  // One slot per server, written by its thread before it exits, read after join.
  std::vector<std::exception_ptr> _errors;
  std::shared_ptr<std::atomic<bool>> _stopRequested{std::make_shared<std::atomic<bool>>(false)};
};

}  // namespace floodgate
