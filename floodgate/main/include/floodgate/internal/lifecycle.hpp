#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "floodgate/event-fd.hpp"
#include "floodgate/timedef.hpp"

namespace floodgate::internal {

// Run state of one event loop.
// State transitions requested from other threads (stop, drain) only touch atomics and wake the loop up, the loop
// thread itself performs the transition and owns the deadline.
struct Lifecycle {
  enum class State : uint8_t { Idle, Running, Draining, Stopping };

  static constexpr int64_t kNoDrainRequest = -1;

  Lifecycle() = default;

  Lifecycle(const Lifecycle&) = delete;
  Lifecycle(Lifecycle&&) = delete;
  Lifecycle& operator=(const Lifecycle&) = delete;
  Lifecycle& operator=(Lifecycle&&) = delete;

  ~Lifecycle() = default;

  void reset() noexcept {
    drainDeadline = {};
    drainDeadlineEnabled = false;
    drainRequestMs.store(kNoDrainRequest, std::memory_order_relaxed);
    state.store(State::Idle, std::memory_order_relaxed);
  }

  void enterRunning() noexcept {
    drainDeadlineEnabled = false;
    state.store(State::Running, std::memory_order_relaxed);
  }

  // Atomically set state to Stopping if the loop is active. Returns the previous state.
  State exchangeStopping() noexcept {
    State expected = state.load(std::memory_order_relaxed);
    while ((expected == State::Running || expected == State::Draining) &&
           !state.compare_exchange_weak(expected, State::Stopping, std::memory_order_relaxed)) {
    }
    if (expected == State::Running || expected == State::Draining) {
      wakeupFd.send();
    }
    return expected;
  }

  // Thread safe. maxWait of 0 drains without deadline. A later request can only shorten the deadline.
  void requestDrain(std::chrono::milliseconds maxWait) noexcept {
    drainRequestMs.store(maxWait.count(), std::memory_order_relaxed);
    wakeupFd.send();
  }

  // Loop thread only: consumes a pending drain request, returns true if there was one.
  bool applyDrainRequest() noexcept {
    const int64_t maxWaitMs = drainRequestMs.exchange(kNoDrainRequest, std::memory_order_relaxed);
    if (maxWaitMs == kNoDrainRequest || isStopping()) {
      return false;
    }
    if (maxWaitMs > 0) {
      const auto deadline = SteadyClock::now() + std::chrono::milliseconds{maxWaitMs};
      if (!drainDeadlineEnabled || deadline < drainDeadline) {
        drainDeadline = deadline;
        drainDeadlineEnabled = true;
      }
    }
    State expected = State::Running;
    state.compare_exchange_strong(expected, State::Draining, std::memory_order_relaxed);
    return true;
  }

  [[nodiscard]] bool isIdle() const noexcept { return state.load(std::memory_order_relaxed) == State::Idle; }
  [[nodiscard]] bool isRunning() const noexcept { return state.load(std::memory_order_relaxed) == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return state.load(std::memory_order_relaxed) == State::Draining; }
  [[nodiscard]] bool isStopping() const noexcept { return state.load(std::memory_order_relaxed) == State::Stopping; }
  [[nodiscard]] bool isActive() const noexcept { return state.load(std::memory_order_relaxed) != State::Idle; }

  [[nodiscard]] bool hasDeadline() const noexcept { return drainDeadlineEnabled; }
  [[nodiscard]] SteadyTimePoint deadline() const noexcept { return drainDeadline; }

  SteadyTimePoint drainDeadline;
  // Wakeup fd (eventfd) used to interrupt epoll_wait promptly when stop() or beginDrain() is invoked from another
  // thread.
  EventFd wakeupFd;
  std::atomic<int64_t> drainRequestMs{kNoDrainRequest};
  std::atomic<State> state{State::Idle};
  bool drainDeadlineEnabled{false};
};

}  // namespace floodgate::internal
