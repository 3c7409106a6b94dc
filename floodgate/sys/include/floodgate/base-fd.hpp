#pragma once

namespace floodgate {

// RAII owner of a POSIX file descriptor (socket, epoll instance, eventfd).
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Give up ownership without closing. The object is left in closed state.
  [[nodiscard]] int release() noexcept;

  // Close now instead of waiting for the destructor. Idempotent.
  void close() noexcept;

 private:
  int _fd;
};

}  // namespace floodgate
