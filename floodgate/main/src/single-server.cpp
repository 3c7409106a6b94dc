#include "floodgate/single-server.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include "floodgate/client-address.hpp"
#include "floodgate/connection.hpp"
#include "floodgate/event.hpp"
#include "floodgate/http-constants.hpp"
#include "floodgate/http-method.hpp"
#include "floodgate/http-request.hpp"
#include "floodgate/http-response-head.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/internal/connection-state.hpp"
#include "floodgate/listener-config.hpp"
#include "floodgate/log.hpp"
#include "floodgate/router.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/server-resources.hpp"
#include "floodgate/server-stats.hpp"
#include "floodgate/signal-handler.hpp"
#include "floodgate/size-spec.hpp"
#include "floodgate/socket-address.hpp"
#include "floodgate/socket.hpp"
#include "floodgate/startup-errors.hpp"
#include "floodgate/timedef.hpp"
#include "floodgate/tls-context.hpp"
#include "floodgate/tls-transport.hpp"
#include "floodgate/transfer-record.hpp"
#include "floodgate/transport.hpp"

namespace floodgate {

namespace {

constexpr std::size_t kReadChunkSize = 4096;

constexpr std::string_view kServerShutdown = "server shutdown";

std::string ErrorBody(const RouteDecision& decision, uint64_t maxSize) {
  if (const auto* malformed = std::get_if<MalformedSize>(&decision)) {
    return fmt::format("Malformed size: {}\n", malformed->reason);
  }
  if (const auto* outOfRange = std::get_if<SizeOutOfRange>(&decision)) {
    if (outOfRange->exceedsMaximum) {
      return fmt::format("Requested size exceeds the maximum of {} bytes\n", maxSize);
    }
    return "Requested size must be greater than zero\n";
  }
  if (std::holds_alternative<MethodNotAllowed>(decision)) {
    return fmt::format("Method not allowed, use one of: {}\n", http::AllowedMethods);
  }
  return fmt::format("{}\n", http::ReasonPhraseFor(http::StatusCodeNotFound));
}

}  // namespace

SingleServer::SingleServer(const ServerConfig& config, std::shared_ptr<TransferSink> transferSink) : _config(config) {
  _config.validate();
  const ListenerConfig& listener = _config.listeners.front();
  _address = listener.address;
  _handshakeTimeout = listener.tlsConfig.handshakeTimeout;
  _resources = ServerResources::Build(_config, std::move(transferSink));
  if (listener.isTls) {
    _tlsContext = std::make_shared<const TlsContext>(listener.tlsConfig);
  }
  initListener();
}

SingleServer::SingleServer(const ServerConfig& config, const ListenerConfig& listener,
                           std::shared_ptr<const ServerResources> resources,
                           std::shared_ptr<const TlsContext> tlsContext, bool reusePort)
    : _config(config),
      _address(listener.address),
      _resources(std::move(resources)),
      _tlsContext(std::move(tlsContext)),
      _handshakeTimeout(listener.tlsConfig.handshakeTimeout),
      _reusePort(reusePort) {
  initListener();
}

SingleServer::~SingleServer() = default;

void SingleServer::initListener() {
  try {
    const SocketAddress socketAddress = ResolveListenAddress(_address);
    _listenSocket = Socket(socketAddress.family());
    _port = _listenSocket.bindAndListen(socketAddress, _reusePort);
  } catch (const std::system_error& ex) {
    _listenSocket.close();
    throw ListenerBindFailure(ex.code(), _address);
  }

  _eventLoop = EventLoop(_config.pollInterval);
  _eventLoop.addOrThrow(_listenSocket.fd(), EventIn);
  _eventLoop.addOrThrow(_lifecycle.wakeupFd.fd(), EventIn);

  log::debug("Listening on {} (port {}, {})", _address, _port, isTls() ? "TLS" : "plaintext");
}

void SingleServer::prepareRun() {
  if (_lifecycle.isActive()) {
    throw std::logic_error("Server is already running");
  }
  if (!_listenSocket) {
    initListener();
  }
  _lastSweep = SteadyClock::now();
}

void SingleServer::run() {
  runUntil([] { return false; });
}

void SingleServer::runUntil(const std::function<bool()>& predicate) {
  prepareRun();
  _lifecycle.enterRunning();
  while (_lifecycle.isActive()) {
    eventLoop();
    if (_lifecycle.isActive() && predicate()) {
      _lifecycle.exchangeStopping();
    }
  }
}

void SingleServer::stop() noexcept {
  if (_lifecycle.exchangeStopping() != internal::Lifecycle::State::Idle) {
    log::debug("Stop requested for {}", _address);
  }
}

void SingleServer::beginDrain(std::chrono::milliseconds maxWait) noexcept { _lifecycle.requestDrain(maxWait); }

void SingleServer::eventLoop() {
  if (_lifecycle.applyDrainRequest()) {
    log::info("Draining {} ({} connection(s))", _address, _connections.size());
    closeListener();
    sweepConnections();
  }

  const auto events = _eventLoop.poll();
  if (events.data() == nullptr) [[unlikely]] {
    _lifecycle.exchangeStopping();
  }
  for (const auto event : events) {
    const int fd = event.fd;
    if (fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else if (fd == _lifecycle.wakeupFd.fd()) {
      _lifecycle.wakeupFd.read();
    } else {
      const auto bmp = event.eventBmp;
      if ((bmp & EventOut) != 0) {
        handleWritableClient(fd);
      }
      // EPOLLERR / EPOLLHUP can be delivered without EPOLLIN: the read path observes the error and closes.
      if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
        handleReadableClient(fd);
      }
    }
  }

  // Under load epoll_wait never times out, timeouts are still checked at least every pollInterval.
  const auto now = SteadyClock::now();
  if (events.empty() || now >= _lastSweep + _config.pollInterval) {
    _lastSweep = now;
    sweepConnections();
  }

  if (_lifecycle.isStopping()) {
    closeAllConnections(kServerShutdown);
    closeListener();
    _lifecycle.reset();
    log::debug("Server {} stopped", _address);
  } else if (_lifecycle.isDraining()) {
    if (_connections.empty()) {
      _lifecycle.reset();
      log::info("Server {} drained", _address);
    } else if (_lifecycle.hasDeadline() && now >= _lifecycle.deadline()) {
      log::warn("Drain deadline reached with {} active connection(s) on {}; aborting them", _connections.size(),
                _address);
      closeAllConnections(kServerShutdown);
      _lifecycle.reset();
    }
  } else if (SignalHandler::IsStopRequested()) {
    beginDrain(SignalHandler::GetMaxDrainPeriod());
  }
}

void SingleServer::sweepConnections() {
  const auto now = SteadyClock::now();
  const bool draining = !_lifecycle.isRunning();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    auto& state = *cnxIt->second;

    if (state.responseInFlight()) {
      if (now > state.lastWriteProgress + _config.sendTimeout) {
        log::info("Send timeout for {} on fd # {}", state.tracker->record().path, cnxIt->first);
        cnxIt = closeConnection(cnxIt, "send timeout");
        continue;
      }
      if (draining) {
        state.closeAfterResponse = true;
      }
      ++cnxIt;
      continue;
    }

    if (!state.transport->handshakeDone()) {
      if (draining || (_handshakeTimeout.count() > 0 && now > state.handshakeStart + _handshakeTimeout)) {
        log::debug("Closing fd # {}: TLS handshake not completed", cnxIt->first);
        cnxIt = closeConnection(cnxIt, {});
        continue;
      }
    } else if (state.headerStart != SteadyTimePoint{}) {
      if (_config.headerReadTimeout.count() > 0 && now > state.headerStart + _config.headerReadTimeout) {
        const auto nextIt = std::next(cnxIt);
        state.closeAfterResponse = true;
        state.inBuffer.clear();
        state.headerStart = {};
        answerError(state, nullptr, http::StatusCodeRequestTimeout,
                    fmt::format("{}\n", http::ReasonPhraseFor(http::StatusCodeRequestTimeout)));
        flushOutbound(cnxIt);
        cnxIt = nextIt;
        continue;
      }
    } else if (draining || now > state.lastActivity + _config.keepAliveTimeout) {
      cnxIt = closeConnection(cnxIt, {});
      continue;
    }
    ++cnxIt;
  }
}

void SingleServer::acceptNewConnections() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    auto state = std::make_unique<internal::ConnectionState>();
    if (_tlsContext) {
      auto sslPtr = _tlsContext->makeSsl(cnxFd);
      if (!sslPtr) {
        continue;
      }
      state->transport = std::make_unique<TlsTransport>(std::move(sslPtr));
    } else {
      state->transport = std::make_unique<PlainTransport>(cnxFd);
    }
    if (!_eventLoop.add(cnxFd, EventIn)) {
      continue;
    }
    const auto now = SteadyClock::now();
    state->lastActivity = now;
    state->handshakeStart = now;
    state->connection = std::move(cnx);

    log::debug("Accepted connection fd # {} from {} on {}", cnxFd, state->connection.peerAddress(), _address);
    _connections.insert_or_assign(cnxFd, std::move(state));
    _stats.connectionsAccepted.fetch_add(1, std::memory_order_relaxed);
  }
}

void SingleServer::handleReadableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  auto& state = *cnxIt->second;
  if (state.responseInFlight()) {
    // Error / hang up while streaming, or TLS needing to read to make write progress. Writing tells which one.
    flushOutbound(cnxIt);
    return;
  }

  bool peerClosed = false;
  while (true) {
    const auto oldSize = state.inBuffer.size();
    ITransport::TransportResult result{0, TransportHint::None};
    state.inBuffer.resize_and_overwrite(oldSize + kReadChunkSize,
                                        [&state, &result, oldSize](char* data, [[maybe_unused]] std::size_t newCap) {
                                          result = state.transport->read(data + oldSize, kReadChunkSize);
                                          return oldSize + result.bytesProcessed;
                                        });
    if (result.bytesProcessed != 0) {
      state.lastActivity = SteadyClock::now();
      if (state.headerStart == SteadyTimePoint{}) {
        state.headerStart = state.lastActivity;
      }
      if (state.inBuffer.size() > _config.maxHeaderBytes + kReadChunkSize) {
        // Enough to answer 431, no need to buffer more.
        break;
      }
      continue;
    }
    if (result.want == TransportHint::None) {
      peerClosed = true;
      break;
    }
    if (result.want == TransportHint::Error) {
      closeConnection(cnxIt, "read error");
      return;
    }
    // Would block. Level-triggered: TLS may need to write to progress a read (handshake).
    if (!updateInterest(state, result.want == TransportHint::WriteReady ? (EventIn | EventOut) : EventIn)) {
      closeConnection(cnxIt, {});
      return;
    }
    break;
  }

  if (peerClosed) {
    if (state.inBuffer.empty()) {
      log::debug("Connection fd # {} closed by peer", fd);
      closeConnection(cnxIt, {});
      return;
    }
    // Half closed: answer what was received, then close.
    state.closeAfterResponse = true;
  }

  if (!processRequests(cnxIt)) {
    return;
  }
  if (peerClosed && !cnxIt->second->responseInFlight()) {
    // Incomplete request head that will never be completed.
    closeConnection(cnxIt, {});
  }
}

void SingleServer::handleWritableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  if (!cnxIt->second->responseInFlight()) {
    // TLS wanted to write to progress a read.
    handleReadableClient(fd);
    return;
  }
  if (flushOutbound(cnxIt) && !cnxIt->second->responseInFlight()) {
    processRequests(cnxIt);
  }
}

bool SingleServer::processRequests(ConnectionMapIt cnxIt) {
  auto& state = *cnxIt->second;
  while (!state.responseInFlight() && !state.inBuffer.empty()) {
    const auto result = _request.parse(state.inBuffer, _config.maxHeaderBytes);
    if (result.status == HttpRequest::ParseStatus::NeedMore) {
      break;
    }
    _stats.requestsServed.fetch_add(1, std::memory_order_relaxed);
    if (result.status == HttpRequest::ParseStatus::Error) {
      log::debug("Invalid request on fd # {}, answering {}", cnxIt->first, result.errorStatus);
      state.closeAfterResponse = true;
      answerError(state, &_request, result.errorStatus,
                  fmt::format("{}\n", http::ReasonPhraseFor(result.errorStatus)));
      state.inBuffer.clear();
    } else {
      answerRequest(state, _request);
      state.inBuffer.erase(0, result.headLength);
    }
    state.headerStart = state.inBuffer.empty() ? SteadyTimePoint{} : SteadyClock::now();
    if (!flushOutbound(cnxIt)) {
      return false;
    }
  }
  return true;
}

namespace {

TransferRecord MakeRecord(const internal::ConnectionState& state, const HttpRequest* request,
                          bool trustForwardedHeaders) {
  TransferRecord record;
  record.startTime = SysClock::now();
  if (request == nullptr) {
    record.remoteAddress = state.connection.peerAddress();
    return record;
  }
  record.method = request->methodStr();
  record.path = request->target();
  record.httpVersion = request->version();
  record.remoteAddress = ResolveClientAddress(*request, state.connection.peerAddress(), trustForwardedHeaders);
  record.referer = request->headerValueOrEmpty(http::Referer);
  record.userAgent = request->headerValueOrEmpty(http::UserAgent);
  return record;
}

}  // namespace

void SingleServer::answerRequest(internal::ConnectionState& state, const HttpRequest& request) {
  ++state.nbRequests;
  if (!_config.enableKeepAlive || !request.wantsKeepAlive() || request.hasBody() ||
      state.nbRequests >= _config.maxRequestsPerConnection || !_lifecycle.isRunning()) {
    // Request bodies are never read, the connection cannot be reused after one.
    state.closeAfterResponse = true;
  }

  TransferRecord record = MakeRecord(state, &request, _config.trustForwardedHeaders);
  const RouteDecision decision = _resources->router.route(request.method(), request.path());
  const http::StatusCode status = Router::StatusFor(decision);
  record.status = static_cast<uint16_t>(status);
  HttpResponseHead head(status);

  if (const auto* serveIndex = std::get_if<ServeIndex>(&decision)) {
    const IndexRenderer& indexRenderer = *_resources->indexRenderer;
    const std::string body = indexRenderer.render(record.userAgent);
    record.headOnly = serveIndex->headOnly;
    head.contentType(indexRenderer.contentType()).contentLength(body.size());
    queueResponse(state, head, serveIndex->headOnly ? std::string_view{} : std::string_view(body), std::move(record));
    return;
  }

  if (const auto* serveStream = std::get_if<ServeStream>(&decision)) {
    const uint64_t byteCount = serveStream->spec.byteCount;
    record.requestedBytes = byteCount;
    record.headOnly = serveStream->headOnly;
    head.contentType(_config.contentType)
        .contentLength(byteCount)
        .header(http::ContentDisposition, "attachment; filename=" + QuotedFilename(request.path().substr(1)))
        .header(http::CacheControl, http::NoCacheDirectives)
        .header(http::Pragma, http::NoCache);
    queueResponse(state, head, {}, std::move(record));
    if (!serveStream->headOnly) {
      state.stream.emplace(byteCount, _config.chunkSize);
      state.isStreamTransfer = true;
      _stats.transfersStarted.fetch_add(1, std::memory_order_relaxed);
    }
    return;
  }

  const std::string body = ErrorBody(decision, _resources->router.maxSize());
  record.headOnly = request.method() == http::Method::HEAD;
  head.contentType(http::ContentTypeTextPlain).contentLength(body.size());
  if (std::holds_alternative<MethodNotAllowed>(decision)) {
    head.header(http::Allow, http::AllowedMethods);
  }
  queueResponse(state, head, record.headOnly ? std::string_view{} : std::string_view(body), std::move(record));
}

void SingleServer::answerError(internal::ConnectionState& state, const HttpRequest* request,
                               http::StatusCode status, std::string_view body) {
  TransferRecord record = MakeRecord(state, request, _config.trustForwardedHeaders);
  record.status = static_cast<uint16_t>(status);
  HttpResponseHead head(status);
  head.contentType(http::ContentTypeTextPlain).contentLength(body.size());
  queueResponse(state, head, body, std::move(record));
}

void SingleServer::queueResponse(internal::ConnectionState& state, HttpResponseHead& head, std::string_view body,
                                 TransferRecord record) {
  head.close(state.closeAfterResponse);
  record.contentLength = head.contentLength();

  state.outBuffer = head.str(SysClock::now(), _config.globalHeaders);
  state.headLength = state.outBuffer.size();
  state.outBuffer.append(body);
  state.outOffset = 0;
  state.isStreamTransfer = false;
  state.lastWriteProgress = SteadyClock::now();
  state.tracker.emplace(std::move(record), _resources->transferSink.get());
}

bool SingleServer::flushOutbound(ConnectionMapIt cnxIt) {
  auto& state = *cnxIt->second;
  std::size_t budget = _config.maxPerEventWriteBytes;

  while (true) {
    const bool fromOutBuffer = state.outOffset < state.outBuffer.size();
    std::string_view data;
    if (fromOutBuffer) {
      data = std::string_view(state.outBuffer).substr(state.outOffset);
    } else if (!state.pendingChunk.empty()) {
      data = state.pendingChunk;
    } else if (state.stream && !state.stream->exhausted()) {
      // Previous chunk fully accepted: generate the next one.
      state.pendingChunk = state.stream->next();
      _stats.randomBytesGenerated.fetch_add(state.pendingChunk.size(), std::memory_order_relaxed);
      continue;
    } else {
      return onResponseSent(cnxIt);
    }

    if (budget == 0) {
      // Fairness cap reached for this wakeup. Level-triggered epoll will report the socket writable again.
      break;
    }

    const auto [written, want] = state.transport->write(data.substr(0, budget));
    if (written != 0) {
      budget -= written;
      uint64_t bodyBytes = written;
      if (fromOutBuffer) {
        const auto oldOffset = state.outOffset;
        state.outOffset += written;
        bodyBytes = state.outOffset > state.headLength ? state.outOffset - std::max(oldOffset, state.headLength) : 0;
      } else {
        state.pendingChunk.remove_prefix(written);
      }
      state.tracker->onWritten(bodyBytes);
      _stats.bodyBytesWritten.fetch_add(bodyBytes, std::memory_order_relaxed);
      state.lastWriteProgress = SteadyClock::now();
      state.lastActivity = state.lastWriteProgress;
    }

    if (want == TransportHint::Error) {
      log::debug("Write error on fd # {} after {} body bytes", cnxIt->first, state.tracker->record().bytesWritten);
      closeConnection(cnxIt, "write error");
      return false;
    }
    if (want != TransportHint::None) {
      // Suspended until the client drains its receive window.
      if (!updateInterest(state, want == TransportHint::ReadReady ? EventIn : EventOut)) {
        closeConnection(cnxIt, "event loop error");
        return false;
      }
      return true;
    }
  }

  if (!updateInterest(state, EventOut)) {
    closeConnection(cnxIt, "event loop error");
    return false;
  }
  return true;
}

bool SingleServer::onResponseSent(ConnectionMapIt cnxIt) {
  auto& state = *cnxIt->second;
  if (state.tracker->complete() && state.isStreamTransfer) {
    _stats.transfersCompleted.fetch_add(1, std::memory_order_relaxed);
  }
  state.resetResponse();
  state.isStreamTransfer = false;

  if (state.closeAfterResponse) {
    closeConnection(cnxIt, {});
    return false;
  }
  state.lastActivity = SteadyClock::now();
  if (!updateInterest(state, EventIn)) {
    closeConnection(cnxIt, {});
    return false;
  }
  return true;
}

bool SingleServer::updateInterest(internal::ConnectionState& state, EventBmp interest) {
  if (state.interest == interest) {
    return true;
  }
  if (!_eventLoop.mod(state.connection.fd(), interest)) {
    return false;
  }
  state.interest = interest;
  return true;
}

SingleServer::ConnectionMapIt SingleServer::closeConnection(ConnectionMapIt cnxIt, std::string_view abortReason) {
  auto& state = *cnxIt->second;
  if (state.tracker) {
    if (state.tracker->abort(abortReason.empty() ? std::string_view("connection closed") : abortReason) &&
        state.isStreamTransfer) {
      _stats.transfersAborted.fetch_add(1, std::memory_order_relaxed);
    }
  }
  state.transport->shutdown();
  _eventLoop.del(cnxIt->first);
  log::trace("Closing connection fd # {}", cnxIt->first);
  return _connections.erase(cnxIt);
}

void SingleServer::closeListener() noexcept {
  if (_listenSocket) {
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
  }
}

void SingleServer::closeAllConnections(std::string_view abortReason) {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt, abortReason);
  }
}

ServerStats SingleServer::stats() const noexcept {
  ServerStats statsOut;
  statsOut.connectionsAccepted = _stats.connectionsAccepted.load(std::memory_order_relaxed);
  statsOut.requestsServed = _stats.requestsServed.load(std::memory_order_relaxed);
  statsOut.transfersStarted = _stats.transfersStarted.load(std::memory_order_relaxed);
  statsOut.transfersCompleted = _stats.transfersCompleted.load(std::memory_order_relaxed);
  statsOut.transfersAborted = _stats.transfersAborted.load(std::memory_order_relaxed);
  statsOut.randomBytesGenerated = _stats.randomBytesGenerated.load(std::memory_order_relaxed);
  statsOut.bodyBytesWritten = _stats.bodyBytesWritten.load(std::memory_order_relaxed);
  return statsOut;
}

}  // namespace floodgate
