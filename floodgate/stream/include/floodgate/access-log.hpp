#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

#include <memory>
#include <string>
#include <string_view>

#include "floodgate/transfer-record.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate {

// Access log in Apache combined format, followed by the requested size, the elapsed time and the transfer outcome:
//   127.0.0.1 - - [10/Oct/2000:13:55:36 +0000] "GET /10MB.bin HTTP/1.1" 200 10000000 "-" "curl/8.5.0" 10000000 12ms completed
// Lines go through a dedicated spdlog logger (not the default one), whose multi threaded sinks serialize writers.
class AccessLog : public TransferSink {
 public:
  static constexpr std::string_view kStandardOutput = "-";

  // Appends to the file at path, or writes to standard output if path is "-".
  // Throws std::runtime_error if the file cannot be opened.
  explicit AccessLog(const std::string& path);

  explicit AccessLog(std::shared_ptr<spdlog::sinks::sink> sink);

  void consume(const TransferRecord& record) override;

  void flush() { _logger->flush(); }

  [[nodiscard]] static std::string FormatLine(const TransferRecord& record);

 private:
  std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace floodgate
