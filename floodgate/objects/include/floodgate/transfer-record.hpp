#pragma once

#include <cstdint>
#include <string>

#include "floodgate/timedef.hpp"

namespace floodgate {

// Outcome of one request, handed to the transfer sink exactly once.
// bytesWritten counts the bytes accepted by the transport. Kernel socket buffers (and TLS records) may still hold part
// of them when the record is finalized, so the elapsed time understates the real transfer duration for the client.
struct TransferRecord {
  [[nodiscard]] SysDuration elapsed() const noexcept { return endTime - startTime; }

  std::string method;
  std::string path;
  std::string httpVersion;
  std::string remoteAddress;
  std::string referer;
  std::string userAgent;
  std::string abortReason;
  SysTimePoint startTime;
  SysTimePoint endTime;
  // Resolved size of the requested payload, 0 when the request did not ask for a payload.
  uint64_t requestedBytes{};
  // Body length announced in the response head (Content-Length).
  uint64_t contentLength{};
  uint64_t bytesWritten{};
  uint16_t status{};
  bool headOnly{false};
  bool completed{false};
};

}  // namespace floodgate
