#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

#include "floodgate/transfer-record.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate {

// Follows the response of one request, counting the body bytes accepted by the transport.
// The record is finalized exactly once, by complete() or abort() (or by the destructor, as an abort), and then handed
// to the sink. Later calls are no-ops.
class TransferTracker {
 public:
  // record.startTime is expected to be set. sink may be null.
  TransferTracker(TransferRecord record, TransferSink* sink) noexcept;

  TransferTracker(const TransferTracker&) = delete;
  TransferTracker(TransferTracker&&) = delete;
  TransferTracker& operator=(const TransferTracker&) = delete;
  TransferTracker& operator=(TransferTracker&&) = delete;

  ~TransferTracker();

  void onWritten(uint64_t nbBytes) noexcept { _record.bytesWritten += nbBytes; }

  // Returns true if this call finalized the record.
  bool complete();

  // Returns true if this call finalized the record.
  bool abort(std::string_view reason);

  [[nodiscard]] bool finalized() const noexcept { return _finalized.load(std::memory_order_acquire); }

  [[nodiscard]] const TransferRecord& record() const noexcept { return _record; }

 private:
  bool finalize(bool completed, std::string_view reason);

  TransferRecord _record;
  TransferSink* _sink;
  std::atomic<bool> _finalized{false};
};

}  // namespace floodgate
