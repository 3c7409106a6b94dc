#include "floodgate/access-log.hpp"

#include <spdlog/common.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <chrono>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "floodgate/timestring.hpp"
#include "floodgate/transfer-record.hpp"

namespace floodgate {

namespace {

std::shared_ptr<spdlog::sinks::sink> MakeSink(const std::string& path) {
  if (path == AccessLog::kStandardOutput) {
    return std::make_shared<spdlog::sinks::stdout_sink_mt>();
  }
  try {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
  } catch (const spdlog::spdlog_ex& ex) {
    throw std::runtime_error("Unable to open access log " + path + ": " + ex.what());
  }
}

// Quoted field of the combined log format. Quotes, backslashes and control characters are escaped so that a line can
// always be split back unambiguously. Empty fields are written as "-".
void AppendQuoted(std::string& out, std::string_view value) {
  out.push_back('"');
  if (value.empty()) {
    out.push_back('-');
  }
  for (char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
      out.push_back(ch);
    } else if (static_cast<unsigned char>(ch) < 0x20 || ch == '\x7f') {
      fmt::format_to(std::back_inserter(out), "\\x{:02x}", static_cast<unsigned char>(ch));
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('"');
}

}  // namespace

AccessLog::AccessLog(const std::string& path) : AccessLog(MakeSink(path)) {}

AccessLog::AccessLog(std::shared_ptr<spdlog::sinks::sink> sink)
    : _logger(std::make_shared<spdlog::logger>("access", std::move(sink))) {
  _logger->set_pattern("%v");
  _logger->set_level(spdlog::level::info);
  _logger->flush_on(spdlog::level::info);
}

void AccessLog::consume(const TransferRecord& record) { _logger->info(FormatLine(record)); }

std::string AccessLog::FormatLine(const TransferRecord& record) {
  std::string out;
  out.reserve(256);

  out.append(record.remoteAddress.empty() ? std::string_view("-") : std::string_view(record.remoteAddress));
  out.append(" - - [");
  char dateBuf[kCommonLogDateStrLen];
  out.append(dateBuf, TimeToStringCommonLog(record.startTime, dateBuf));
  out.append("] \"");
  out.append(record.method).push_back(' ');
  for (char ch : record.path) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out.push_back(' ');
  out.append(record.httpVersion).append("\" ");

  if (record.bytesWritten == 0) {
    fmt::format_to(std::back_inserter(out), "{} - ", record.status);
  } else {
    fmt::format_to(std::back_inserter(out), "{} {} ", record.status, record.bytesWritten);
  }
  AppendQuoted(out, record.referer);
  out.push_back(' ');
  AppendQuoted(out, record.userAgent);

  const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(record.elapsed()).count();
  fmt::format_to(std::back_inserter(out), " {} {}ms ", record.requestedBytes, elapsedMs);
  if (record.completed) {
    out.append("completed");
  } else {
    out.append("aborted ");
    AppendQuoted(out, record.abortReason);
  }
  return out;
}

}  // namespace floodgate
