#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

using ferry::core::ThreadPool;

TEST(ThreadPoolTest, ReturnsTaskResult) {
  ThreadPool tp(2);
  auto fut = tp.submit([](int a, int b) { return a + b; }, 2, 3);
  EXPECT_EQ(fut.get(), 5);
}

TEST(ThreadPoolTest, NonPositiveSizeUsesHardware) {
  ThreadPool tp(0);
  EXPECT_GE(tp.size(), 1);
}

TEST(ThreadPoolTest, RunsManyTasks) {
  ThreadPool tp(4);
  std::atomic<int> iCount{0};
  std::vector<std::future<void>> vFutures;
  for (int i = 0; i < 100; ++i) {
    vFutures.push_back(tp.submit([&iCount]() { ++iCount; }));
  }
  for (auto& fut : vFutures) {
    fut.get();
  }
  EXPECT_EQ(iCount.load(), 100);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
  ThreadPool tp(1);
  auto fut = tp.submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedTasks) {
  std::atomic<int> iCount{0};
  ThreadPool tp(1);
  for (int i = 0; i < 10; ++i) {
    tp.submit([&iCount]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      ++iCount;
    });
  }
  tp.shutdown();
  EXPECT_EQ(iCount.load(), 10);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
  ThreadPool tp(1);
  tp.shutdown();
  tp.shutdown();
  EXPECT_THROW(tp.submit([]() {}), std::runtime_error);
}
