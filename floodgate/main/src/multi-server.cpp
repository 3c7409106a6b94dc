#include "floodgate/multi-server.hpp"

#include <sys/socket.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "floodgate/listener-config.hpp"
#include "floodgate/log.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/server-resources.hpp"
#include "floodgate/single-server.hpp"
#include "floodgate/socket-address.hpp"
#include "floodgate/startup-errors.hpp"
#include "floodgate/tls-context.hpp"

namespace floodgate {

namespace {

// Same host as address, with an explicit port. Used so that all the servers of a listener bound to port 0 share the
// ephemeral port of the first one.
std::string AddressWithPort(std::string_view address, uint16_t port) {
  const SocketAddress socketAddress = ResolveListenAddress(address);
  if (socketAddress.family() == AF_INET6) {
    return fmt::format("[{}]:{}", socketAddress.host(), port);
  }
  return fmt::format("{}:{}", socketAddress.host(), port);
}

}  // namespace

MultiServer::MultiServer(ServerConfig config, std::shared_ptr<TransferSink> transferSink)
    : _config(std::move(config)) {
  _config.validate();
  _resources = ServerResources::Build(_config, std::move(transferSink));

  const uint32_t nbThreads = _config.nbThreadsPerListener;
  for (const ListenerConfig& listener : _config.listeners) {
    std::shared_ptr<const TlsContext> tlsContext;
    if (listener.isTls) {
      // Credential failures are fatal, even for optional listeners.
      tlsContext = std::make_shared<const TlsContext>(listener.tlsConfig);
    }

    std::unique_ptr<SingleServer> firstServer;
    try {
      firstServer = std::make_unique<SingleServer>(_config, listener, _resources, tlsContext, nbThreads > 1);
    } catch (const ListenerBindFailure& ex) {
      if (!listener.optional) {
        log::critical("Unable to bind {}: {}", listener.address, ex.what());
        throw;
      }
      log::warn("Skipping optional listener {}: {}", listener.address, ex.what());
      continue;
    }

    const uint16_t port = firstServer->port();
    _listeners.push_back(BoundListener{listener.address, port, listener.isTls});
    _servers.push_back(std::move(firstServer));

    if (nbThreads > 1) {
      ListenerConfig sibling = listener;
      sibling.address = AddressWithPort(listener.address, port);
      for (uint32_t threadPos = 1; threadPos < nbThreads; ++threadPos) {
        _servers.push_back(std::make_unique<SingleServer>(_config, sibling, _resources, tlsContext, true));
      }
    }

    log::info("Listening on {} (port {}, {}, {} thread(s))", listener.address, port,
              listener.isTls ? "TLS" : "plaintext", nbThreads);
  }

  if (_servers.empty()) {
    log::critical("No listener could be bound");
    throw ListenerBindFailure(std::make_error_code(std::errc::address_not_available), "all listeners");
  }
  _errors.resize(_servers.size());
}

MultiServer::~MultiServer() { stop(); }

void MultiServer::run() {
  start();
  wait();
}

void MultiServer::start() {
  if (!_threads.empty()) {
    throw std::logic_error("MultiServer already started");
  }
  _stopRequested->store(false, std::memory_order_relaxed);
  std::ranges::fill(_errors, nullptr);

  _threads.reserve(_servers.size());
  for (std::size_t serverPos = 0; serverPos < _servers.size(); ++serverPos) {
    _threads.emplace_back([this, serverPos, stopRequested = _stopRequested] {
      SingleServer& server = *_servers[serverPos];
      try {
        server.runUntil([&stopRequested] { return stopRequested->load(std::memory_order_relaxed); });
      } catch (const std::exception& ex) {
        log::error("Event loop of {} exited with an error: {}", server.address(), ex.what());
        _errors[serverPos] = std::current_exception();
      }
    });
  }
  log::debug("MultiServer started ({} server(s))", _servers.size());
}

void MultiServer::stop() noexcept {
  if (_threads.empty()) {
    return;
  }
  _stopRequested->store(true, std::memory_order_relaxed);
  std::ranges::for_each(_servers, [](const auto& server) { server->stop(); });
  joinAll();
  log::info("MultiServer stopped");
}

void MultiServer::beginDrain(std::chrono::milliseconds maxWait) noexcept {
  std::ranges::for_each(_servers, [maxWait](const auto& server) { server->beginDrain(maxWait); });
}

void MultiServer::wait() {
  joinAll();
  rethrowIfError();
}

bool MultiServer::isRunning() const noexcept {
  return std::ranges::any_of(_servers, [](const auto& server) { return server->isRunning() || server->isDraining(); });
}

bool MultiServer::isDraining() const noexcept {
  return std::ranges::any_of(_servers, [](const auto& server) { return server->isDraining(); });
}

MultiServer::AggregatedStats MultiServer::stats() const {
  AggregatedStats agg;
  agg.per.reserve(_servers.size());
  for (const auto& server : _servers) {
    agg.per.push_back(server->stats());
    agg.total += agg.per.back();
  }
  return agg;
}

void MultiServer::joinAll() noexcept {
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  _threads.clear();
}

void MultiServer::rethrowIfError() {
  const auto errorIt = std::ranges::find_if(_errors, [](const std::exception_ptr& err) { return err != nullptr; });
  if (errorIt != _errors.end()) {
    std::exception_ptr error = std::exchange(*errorIt, nullptr);
    std::ranges::fill(_errors, nullptr);
    std::rethrow_exception(error);
  }
}

}  // namespace floodgate
