#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "floodgate/connection.hpp"
#include "floodgate/event.hpp"
#include "floodgate/random-stream.hpp"
#include "floodgate/timedef.hpp"
#include "floodgate/transfer-tracker.hpp"
#include "floodgate/transport.hpp"

namespace floodgate::internal {

// Everything a SingleServer knows about one client connection. Owned by the event loop that accepted it.
// At most one response is in flight per connection: pipelined requests wait in inBuffer until it is fully written.
struct ConnectionState {
  // A response is in flight until its head, its body and its payload stream are fully accepted by the transport.
  [[nodiscard]] bool responseInFlight() const noexcept { return tracker.has_value(); }

  // Clears the per-response state. The tracker must have been finalized (or is aborted by its destructor).
  void resetResponse() noexcept {
    outBuffer.clear();
    outOffset = 0;
    headLength = 0;
    pendingChunk = {};
    stream.reset();
    tracker.reset();
  }

  Connection connection;
  std::unique_ptr<ITransport> transport;

  // Received bytes not consumed yet (partial or pipelined request heads).
  std::string inBuffer;

  // Serialized response head, followed by the whole body for index pages and error responses.
  std::string outBuffer;
  std::size_t outOffset{0};
  // Part of outBuffer which is response head, the rest is body.
  std::size_t headLength{0};

  // Payload generator of the current stream response, absent for HEAD and non stream responses.
  std::optional<RandomStream> stream;
  // Part of the last generated chunk not accepted by the transport yet. Points into stream's chunk buffer.
  std::string_view pendingChunk;

  std::optional<TransferTracker> tracker;

  // Last read or write progress.
  SteadyTimePoint lastActivity;
  // Last write progress of the response in flight.
  SteadyTimePoint lastWriteProgress;
  // First byte of the request head being received, epoch when none.
  SteadyTimePoint headerStart;
  SteadyTimePoint handshakeStart;

  EventBmp interest{EventIn};
  uint32_t nbRequests{0};
  // Whether the response in flight is a random payload (counted in transfer statistics).
  bool isStreamTransfer{false};
  bool closeAfterResponse{false};
};

}  // namespace floodgate::internal
