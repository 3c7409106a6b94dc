#include "floodgate/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include "floodgate/errno-throw.hpp"
#include "floodgate/http-constants.hpp"
#include "floodgate/http-header.hpp"
#include "floodgate/log.hpp"
#include "floodgate/string-equal-ignore-case.hpp"

namespace floodgate::test {

namespace {

using Clock = std::chrono::steady_clock;

// Waits until fd is readable, or the deadline. Returns false on timeout or poll error.
bool WaitReadable(int fd, Clock::time_point deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  if (remaining.count() <= 0) {
    return false;
  }
  pollfd pfd{fd, POLLIN, 0};
  const int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
  return ret > 0;
}

// Appends at most kChunkSize received bytes to out. Returns the recv result.
ssize_t RecvInto(int fd, std::string& out) {
  static constexpr std::size_t kChunkSize = std::size_t{64} << 10;
  ssize_t recvBytes = 0;
  const auto oldSize = out.size();
  out.resize_and_overwrite(oldSize + kChunkSize, [fd, oldSize, &recvBytes](char* data, std::size_t) {
    recvBytes = ::recv(fd, data + oldSize, kChunkSize, 0);
    return recvBytes > 0 ? oldSize + static_cast<std::size_t>(recvBytes) : oldSize;
  });
  return recvBytes;
}

std::optional<uint64_t> ParseContentLength(std::string_view value) {
  uint64_t contentLength = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), contentLength);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return contentLength;
}

// Parses the response at the beginning of raw. consumed is set to the number of bytes of raw it spans.
std::optional<ParsedResponse> ParseOne(std::string_view raw, bool headOnly, std::size_t& consumed) {
  const auto headEnd = raw.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view head = raw.substr(0, headEnd + http::CRLF.size());

  ParsedResponse parsed;
  auto lineEnd = head.find(http::CRLF);
  const std::string_view statusLine = head.substr(0, lineEnd);
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4) {
    return std::nullopt;
  }
  parsed.version = statusLine.substr(0, firstSpace);
  int status = 0;
  const auto codeStr = statusLine.substr(firstSpace + 1, 3);
  if (std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), status).ec != std::errc{}) {
    return std::nullopt;
  }
  parsed.statusCode = static_cast<http::StatusCode>(status);
  if (statusLine.size() > firstSpace + 5) {
    parsed.reason = statusLine.substr(firstSpace + 5);
  }

  for (std::size_t linePos = lineEnd + http::CRLF.size(); linePos < head.size();
       linePos = lineEnd + http::CRLF.size()) {
    lineEnd = head.find(http::CRLF, linePos);
    const std::string_view line = head.substr(linePos, lineEnd - linePos);
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      return std::nullopt;
    }
    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    parsed.headers.push_back(http::Header{std::string(line.substr(0, colon)), std::string(value)});
  }

  const std::size_t bodyStart = headEnd + http::DoubleCRLF.size();
  std::string_view body = raw.substr(bodyStart);
  if (headOnly) {
    body = {};
  } else if (const auto contentLengthStr = parsed.header(http::ContentLength)) {
    const auto contentLength = ParseContentLength(*contentLengthStr);
    if (!contentLength) {
      return std::nullopt;
    }
    body = body.substr(0, static_cast<std::size_t>(std::min<uint64_t>(*contentLength, body.size())));
  }
  parsed.body = body;
  consumed = bodyStart + body.size();
  return parsed;
}

// Whether buf holds at least one complete response.
bool IsCompleteResponse(std::string_view buf, bool headOnly) {
  const auto headEnd = buf.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return false;
  }
  if (headOnly) {
    return true;
  }
  std::size_t consumed = 0;
  const auto parsed = ParseOne(buf, false, consumed);
  if (!parsed) {
    return false;
  }
  const auto contentLengthStr = parsed->header(http::ContentLength);
  if (!contentLengthStr) {
    // Delimited by connection close.
    return false;
  }
  const auto contentLength = ParseContentLength(*contentLengthStr);
  return contentLength && parsed->body.size() >= *contentLength;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _baseFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create client socket");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  for (const auto deadline = Clock::now() + timeout;; std::this_thread::sleep_for(1ms)) {
    if (::connect(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
      return;
    }
    log::debug("connect to port {} failed: {}", port, std::strerror(errno));
    if (Clock::now() >= deadline) {
      throw std::runtime_error("Unable to connect to loopback port " + std::to_string(port));
    }
  }
}

std::optional<std::string_view> ParsedResponse::header(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(headers, [name](const http::Header& header) {
    return CaseInsensitiveEqual(header.name, name);
  });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const auto deadline = Clock::now() + totalTimeout;
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent <= 0) {
      if (errno != EAGAIN && errno != EINTR) {
        log::error("sendAll failed with error {}", std::strerror(errno));
        return false;
      }
      if (Clock::now() >= deadline) {
        log::error("sendAll timed out after {} ms", totalTimeout.count());
        return false;
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

std::string recvResponse(int fd, bool headOnly, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = Clock::now() + totalTimeout;
  while (!IsCompleteResponse(out, headOnly) && WaitReadable(fd, deadline)) {
    if (RecvInto(fd, out) <= 0) {
      break;
    }
  }
  return out;
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = Clock::now() + totalTimeout;
  while (WaitReadable(fd, deadline)) {
    if (RecvInto(fd, out) <= 0) {
      break;
    }
  }
  return out;
}

std::size_t recvAtLeast(int fd, std::size_t nbBytes, std::chrono::milliseconds totalTimeout) {
  std::string buf;
  std::size_t total = 0;
  const auto deadline = Clock::now() + totalTimeout;
  while (total < nbBytes && WaitReadable(fd, deadline)) {
    buf.clear();
    const auto recvBytes = RecvInto(fd, buf);
    if (recvBytes <= 0) {
      break;
    }
    total += static_cast<std::size_t>(recvBytes);
  }
  return total;
}

std::string buildRequest(std::string_view method, std::string_view target, std::string_view connection,
                         const std::vector<http::Header>& extraHeaders) {
  std::string req;
  req.append(method).append(" ").append(target).append(" HTTP/1.1").append(http::CRLF);
  req.append(http::Host).append(http::HeaderSep).append("localhost").append(http::CRLF);
  if (!connection.empty()) {
    req.append(http::Connection).append(http::HeaderSep).append(connection).append(http::CRLF);
  }
  for (const auto& header : extraHeaders) {
    req.append(header.name).append(http::HeaderSep).append(header.value).append(http::CRLF);
  }
  req.append(http::CRLF);
  return req;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw, bool headOnly) {
  std::size_t consumed = 0;
  return ParseOne(raw, headOnly, consumed);
}

ParsedResponse parseResponseOrThrow(std::string_view raw, bool headOnly) {
  auto parsed = parseResponse(raw, headOnly);
  if (!parsed) {
    throw std::runtime_error("Unable to parse response: " + std::string(raw.substr(0, 256)));
  }
  return std::move(*parsed);
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  ClientConnection cnx(port);
  if (!sendAll(cnx.fd(), raw)) {
    return {};
  }
  return recvUntilClosed(cnx.fd());
}

ParsedResponse request(uint16_t port, std::string_view method, std::string_view target,
                       const std::vector<http::Header>& extraHeaders) {
  const std::string raw = sendAndCollect(port, buildRequest(method, target, http::close, extraHeaders));
  return parseResponseOrThrow(raw, method == "HEAD");
}

std::vector<ParsedResponse> splitResponses(std::string_view raw, const std::vector<bool>& headOnly) {
  std::vector<ParsedResponse> responses;
  for (const bool isHeadOnly : headOnly) {
    std::size_t consumed = 0;
    auto parsed = ParseOne(raw, isHeadOnly, consumed);
    if (!parsed) {
      break;
    }
    responses.push_back(std::move(*parsed));
    raw.remove_prefix(consumed);
  }
  return responses;
}

bool noBodyAfterHead(std::string_view raw) {
  const auto headEnd = raw.find(http::DoubleCRLF);
  return headEnd != std::string_view::npos && headEnd + http::DoubleCRLF.size() == raw.size();
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  std::string buf;
  while (WaitReadable(fd, deadline)) {
    buf.clear();
    if (RecvInto(fd, buf) <= 0) {
      return true;
    }
  }
  return false;
}

bool AttemptConnect(uint16_t port) {
  BaseFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd) {
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  return ::connect(fd.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

}  // namespace floodgate::test
