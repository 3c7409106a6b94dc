#pragma once

#include "floodgate/transfer-record.hpp"

namespace floodgate {

// Receiver of finalized transfer records (typically the access log).
// Called concurrently from all the event loop threads: implementations serialize records themselves.
class TransferSink {
 public:
  virtual ~TransferSink() = default;

  virtual void consume(const TransferRecord& record) = 0;
};

}  // namespace floodgate
