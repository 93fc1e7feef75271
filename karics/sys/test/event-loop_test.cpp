#include "karics/event-loop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <system_error>
#include <vector>

#include "karics/wakeup-fd.hpp"

namespace karics {

using namespace std::chrono_literals;

TEST(EventLoop, WaitTimesOutWithoutEvents) {
  EventLoop loop;
  const auto before = std::chrono::steady_clock::now();
  EXPECT_TRUE(loop.wait(5ms).empty());
  EXPECT_GE(std::chrono::steady_clock::now() - before, 4ms);
}

TEST(EventLoop, ReportsReadableWakeupFd) {
  EventLoop loop;
  WakeupFd wakeupFd;
  loop.watchOrThrow(wakeupFd.fd(), kEventReadable);

  wakeupFd.notify();
  const auto events = loop.wait(50ms);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, wakeupFd.fd());
  EXPECT_NE(events[0].events & kEventReadable, 0U);

  wakeupFd.drain();
  EXPECT_TRUE(loop.wait(0ms).empty());
}

TEST(EventLoop, EdgeTriggeredReportsOnlyNewReadiness) {
  EventLoop loop;
  WakeupFd wakeupFd;
  loop.watchOrThrow(wakeupFd.fd(), kEventReadable | kEventEdgeTriggered);

  wakeupFd.notify();
  EXPECT_EQ(loop.wait(50ms).size(), 1U);
  // Not drained, but no new edge.
  EXPECT_TRUE(loop.wait(0ms).empty());
  wakeupFd.notify();
  EXPECT_EQ(loop.wait(50ms).size(), 1U);
}

TEST(EventLoop, UnwatchedFdIsNotReported) {
  EventLoop loop;
  WakeupFd wakeupFd;
  ASSERT_TRUE(loop.watch(wakeupFd.fd(), kEventReadable));
  loop.unwatch(wakeupFd.fd());
  wakeupFd.notify();
  EXPECT_TRUE(loop.wait(5ms).empty());
}

TEST(EventLoop, WatchTwiceFails) {
  EventLoop loop;
  WakeupFd wakeupFd;
  ASSERT_TRUE(loop.watch(wakeupFd.fd(), kEventReadable));
  EXPECT_FALSE(loop.watch(wakeupFd.fd(), kEventReadable));
  EXPECT_THROW(loop.watchOrThrow(wakeupFd.fd(), kEventReadable), std::system_error);
}

TEST(EventLoop, CapacityGrowsWhenSaturated) {
  EventLoop loop(2);
  EXPECT_EQ(loop.capacity(), 2U);
  std::vector<WakeupFd> wakeupFds(5);
  for (const WakeupFd& wakeupFd : wakeupFds) {
    loop.watchOrThrow(wakeupFd.fd(), kEventReadable);
    wakeupFd.notify();
  }
  std::size_t nbReported = 0;
  for (int iter = 0; iter < 4 && nbReported < wakeupFds.size(); ++iter) {
    nbReported = loop.wait(5ms).size();
  }
  EXPECT_GT(loop.capacity(), 2U);
  EXPECT_EQ(nbReported, wakeupFds.size());
}

TEST(EventLoop, ZeroCapacityIsPromoted) {
  EventLoop loop(0);
  EXPECT_EQ(loop.capacity(), 1U);
}

}  // namespace karics
