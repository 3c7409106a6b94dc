#pragma once

#include <cstdint>

namespace floodgate {

// Snapshot of the counters of one server (or the sum over all servers of a MultiServer).
struct ServerStats {
  // Introspection enumeration of the counters, in declaration order.
  template <class F>
  void for_each_field(F&& fun) const {
    fun("connectionsAccepted", connectionsAccepted);
    fun("requestsServed", requestsServed);
    fun("transfersStarted", transfersStarted);
    fun("transfersCompleted", transfersCompleted);
    fun("transfersAborted", transfersAborted);
    fun("randomBytesGenerated", randomBytesGenerated);
    fun("bodyBytesWritten", bodyBytesWritten);
  }

  ServerStats& operator+=(const ServerStats& other) noexcept {
    connectionsAccepted += other.connectionsAccepted;
    requestsServed += other.requestsServed;
    transfersStarted += other.transfersStarted;
    transfersCompleted += other.transfersCompleted;
    transfersAborted += other.transfersAborted;
    randomBytesGenerated += other.randomBytesGenerated;
    bodyBytesWritten += other.bodyBytesWritten;
    return *this;
  }

  uint64_t connectionsAccepted{};
  uint64_t requestsServed{};
  uint64_t transfersStarted{};
  uint64_t transfersCompleted{};
  uint64_t transfersAborted{};
  // Random bytes produced by payload generators. Stays 0 for HEAD requests.
  uint64_t randomBytesGenerated{};
  // Body bytes accepted by the transports, index pages and error bodies included.
  uint64_t bodyBytesWritten{};
};

}  // namespace floodgate
