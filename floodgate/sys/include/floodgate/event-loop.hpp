#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "floodgate/base-fd.hpp"
#include "floodgate/event.hpp"

namespace floodgate {

// Thin RAII wrapper over a level-triggered epoll instance.
//  * Level-triggered mode lets a connection that stopped writing because its per-event byte budget was exhausted be
//    reported writable again at the next poll, which is how concurrent transfers are interleaved.
//  * The event buffer starts at kInitialCapacity and doubles each time a poll fills it completely. It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct Event {
    int fd;
    EventBmp eventBmp;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if the epoll instance cannot be created.
  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(int fd, EventBmp events) const;

  // Register fd with given events. Returns false (and logs) on failure.
  [[nodiscard]] bool add(int fd, EventBmp events) const;

  // Modify interest list of fd. Returns false (and logs) on failure.
  [[nodiscard]] bool mod(int fd, EventBmp events) const;

  // Remove fd from monitoring. Failures are logged only.
  void del(int fd) const;

  // Waits for ready events, up to the poll timeout.
  //  - On success: a non-empty span over an internal buffer, valid until the next call.
  //  - On timeout or EINTR: an empty span with non-null data().
  //  - On unrecoverable epoll_wait failure (logged): an empty span with nullptr data().
  [[nodiscard]] std::span<const Event> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  void updatePollTimeout(std::chrono::milliseconds pollTimeout) noexcept {
    _pollTimeoutMs = static_cast<int>(pollTimeout.count());
  }

 private:
  int _pollTimeoutMs{0};
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<Event> _readyEvents;
};

}  // namespace floodgate
