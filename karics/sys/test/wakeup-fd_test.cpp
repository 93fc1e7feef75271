#include "karics/wakeup-fd.hpp"

#include <gtest/gtest.h>
#include <poll.h>

#include <thread>

namespace karics {

namespace {

bool IsReadable(const WakeupFd& wakeupFd) {
  pollfd pfd{wakeupFd.fd(), POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace

TEST(WakeupFd, NotificationsCoalesceUntilDrained) {
  WakeupFd wakeupFd;
  ASSERT_GE(wakeupFd.fd(), 0);
  EXPECT_FALSE(IsReadable(wakeupFd));
  wakeupFd.notify();
  wakeupFd.notify();
  EXPECT_TRUE(IsReadable(wakeupFd));
  EXPECT_EQ(wakeupFd.drain(), 2U);
  EXPECT_FALSE(IsReadable(wakeupFd));
}

TEST(WakeupFd, DrainWithoutNotificationDoesNotBlock) {
  WakeupFd wakeupFd;
  EXPECT_EQ(wakeupFd.drain(), 0U);
}

TEST(WakeupFd, NotifyFromAnotherThread) {
  WakeupFd wakeupFd;
  std::thread([&wakeupFd] { wakeupFd.notify(); }).join();
  pollfd pfd{wakeupFd.fd(), POLLIN, 0};
  ASSERT_EQ(::poll(&pfd, 1, 1000), 1);
  EXPECT_EQ(wakeupFd.drain(), 1U);
}

}  // namespace karics
