#include <shotimport/core/deadline_timer.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace nc = shotimport::core;
using namespace std::chrono_literals;

TEST(DeadlineTimer, FiresAtDeadline) {
  nc::DeadlineTimer timer;
  std::atomic<int> fired{0};
  timer.arm(std::chrono::steady_clock::now() + 20ms, [&] { ++fired; });
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(fired.load(), 1);
}

TEST(DeadlineTimer, CancelPreventsExpiry) {
  nc::DeadlineTimer timer;
  std::atomic<int> fired{0};
  timer.arm(std::chrono::steady_clock::now() + 100ms, [&] { ++fired; });
  timer.cancel();
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(fired.load(), 0);
}

TEST(DeadlineTimer, RearmReplacesPendingExpiry) {
  nc::DeadlineTimer timer;
  std::atomic<int> first{0};
  std::atomic<int> second{0};
  timer.arm(std::chrono::steady_clock::now() + 50ms, [&] { ++first; });
  timer.arm(std::chrono::steady_clock::now() + 10ms, [&] { ++second; });
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(first.load(), 0);
  EXPECT_EQ(second.load(), 1);
}

TEST(DeadlineTimer, DisarmFromInsideCallbackDoesNotDeadlock) {
  nc::DeadlineTimer timer;
  std::atomic<bool> done{false};
  timer.arm(std::chrono::steady_clock::now() + 5ms, [&] {
    timer.disarm();
    done = true;
  });
  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(done.load());
}

TEST(DeadlineTimer, DestructorStopsPendingTimer) {
  std::atomic<int> fired{0};
  {
    nc::DeadlineTimer timer;
    timer.arm(std::chrono::steady_clock::now() + 10s, [&] { ++fired; });
  }
  EXPECT_EQ(fired.load(), 0);
}
