#include "floodgate/event-loop.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>

#include "floodgate/base-fd.hpp"
#include "floodgate/event-fd.hpp"
#include "floodgate/event.hpp"

namespace floodgate {

using namespace std::chrono_literals;

TEST(EventLoop, TimeoutReturnsEmptyNonNullSpan) {
  EventLoop loop(1ms);
  const auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoop, ReportsWakeup) {
  EventLoop loop(100ms);
  EventFd wakeup;
  loop.addOrThrow(wakeup.fd(), EventIn);
  wakeup.send();
  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, wakeup.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);
  wakeup.read();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, LevelTriggeredWritabilityIsReportedAgain) {
  int fds[2];
  ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds));
  BaseFd lhs(fds[0]);
  BaseFd rhs(fds[1]);
  EventLoop loop(10ms);
  ASSERT_TRUE(loop.add(lhs.fd(), EventOut));
  for (int round = 0; round < 3; ++round) {
    const auto events = loop.poll();
    ASSERT_EQ(events.size(), 1U);
    EXPECT_NE(events[0].eventBmp & EventOut, 0U);
  }
  ASSERT_TRUE(loop.mod(lhs.fd(), EventIn));
  EXPECT_TRUE(loop.poll().empty());
  loop.del(lhs.fd());
}

TEST(EventLoop, ModOnUnknownFdFails) {
  EventLoop loop(1ms);
  EventFd wakeup;
  EXPECT_FALSE(loop.mod(wakeup.fd(), EventIn));
}

TEST(EventLoop, GrowsWhenSaturated) {
  EventLoop loop(1ms, 1);
  EventFd first;
  EventFd second;
  loop.addOrThrow(first.fd(), EventIn);
  loop.addOrThrow(second.fd(), EventIn);
  first.send();
  second.send();
  EXPECT_EQ(loop.poll().size(), 1U);
  EXPECT_EQ(loop.capacity(), 2U);
  EXPECT_EQ(loop.poll().size(), 2U);
}

}  // namespace floodgate
