#include "coordinator/worker_pool.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace {

using coordinator::WorkerPool;

void WaitForQueued(const WorkerPool& pool, size_t queued) {
  for (int i = 0; i < 500 && pool.Queued() != queued; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  ASSERT_EQ(pool.Queued(), queued);
}

// NOLINTNEXTLINE
TEST(WorkerPool, ZeroMeansOnePerCore) {
  WorkerPool pool(0);
  EXPECT_GE(pool.MaxWorkers(), 1u);
}

// NOLINTNEXTLINE
TEST(WorkerPool, SlotsAreReleased) {
  WorkerPool pool(2);
  {
    auto a = pool.Acquire(nullptr);
    auto b = pool.Acquire(nullptr);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(pool.Running(), 2u);
  }
  EXPECT_EQ(pool.Running(), 0u);
}

// NOLINTNEXTLINE
TEST(WorkerPool, WaitersAreAdmittedInOrder) {
  WorkerPool pool(1);
  auto held = pool.Acquire(nullptr);
  std::mutex mutex;
  std::vector<int> order;
  std::vector<std::thread> waiters;
  for (int i = 0; i < 3; i++) {
    waiters.emplace_back([&pool, &mutex, &order, i]() {
      auto slot = pool.Acquire(nullptr);
      std::lock_guard<std::mutex> lck(mutex);
      order.push_back(i);
    });
    // Each waiter queues before the next one starts.
    WaitForQueued(pool, i + 1);
  }
  held.reset();
  for (std::thread& t : waiters) t.join();
  EXPECT_THAT(order, ::testing::ElementsAre(0, 1, 2));
  EXPECT_EQ(pool.Running(), 0u);
}

// NOLINTNEXTLINE
TEST(WorkerPool, NeverExceedsTheCeiling) {
  WorkerPool pool(2);
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&]() {
      auto slot = pool.Acquire(nullptr);
      int now = ++active;
      int prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      --active;
    });
  }
  for (std::thread& t : threads) t.join();
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

// NOLINTNEXTLINE
TEST(WorkerPool, CancelledWhileQueued) {
  WorkerPool pool(1);
  auto held = pool.Acquire(nullptr);
  std::atomic<bool> cancelled{false};
  std::unique_ptr<WorkerPool::Slot> slot;
  std::thread waiter(
      [&pool, &cancelled, &slot]() { slot = pool.Acquire(&cancelled); });
  WaitForQueued(pool, 1);
  cancelled = true;
  waiter.join();
  EXPECT_EQ(slot, nullptr);
  EXPECT_EQ(pool.Queued(), 0u);
  EXPECT_EQ(pool.Running(), 1u);
}

// NOLINTNEXTLINE
TEST(WorkerPool, AlreadyCancelled) {
  WorkerPool pool(1);
  std::atomic<bool> cancelled{true};
  EXPECT_EQ(pool.Acquire(&cancelled), nullptr);
  EXPECT_EQ(pool.Running(), 0u);
}

}  // namespace
