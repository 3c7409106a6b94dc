#pragma once

#include "floodgate/base-fd.hpp"

namespace floodgate {

// Non-blocking eventfd used to wake an event loop blocked in epoll_wait from another thread.
class EventFd {
 public:
  // Throws std::system_error on failure.
  EventFd();

  void send() const noexcept;

  // Drain pending wakeups.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace floodgate
