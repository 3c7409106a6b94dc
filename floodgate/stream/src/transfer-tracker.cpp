#include "floodgate/transfer-tracker.hpp"

#include <string_view>
#include <utility>

#include "floodgate/log.hpp"
#include "floodgate/timedef.hpp"
#include "floodgate/transfer-record.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate {

TransferTracker::TransferTracker(TransferRecord record, TransferSink* sink) noexcept
    : _record(std::move(record)), _sink(sink) {}

TransferTracker::~TransferTracker() { abort("connection closed"); }

bool TransferTracker::complete() { return finalize(true, {}); }

bool TransferTracker::abort(std::string_view reason) { return finalize(false, reason); }

bool TransferTracker::finalize(bool completed, std::string_view reason) {
  if (_finalized.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  _record.endTime = SysClock::now();
  _record.completed = completed;
  _record.abortReason = reason;
  if (completed) {
    log::debug("Transfer of {} completed, {} bytes written", _record.path, _record.bytesWritten);
  } else {
    log::debug("Transfer of {} aborted ({}) after {} / {} bytes", _record.path, reason, _record.bytesWritten,
               _record.contentLength);
  }
  if (_sink != nullptr) {
    _sink->consume(_record);
  }
  return true;
}

}  // namespace floodgate
