#include "utils/worker_pool.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

TEST(WorkerPoolTest, RunsSubmittedTasks) {
  WorkerPool pool(3);
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 20; ++i)
    futures.push_back(pool.submit([i] { return i * i; }));

  int total = 0;
  for (auto &future : futures)
    total += future.get();
  EXPECT_EQ(total, 2470);
  EXPECT_EQ(pool.size(), 3u);
}

TEST(WorkerPoolTest, PropagatesExceptions) {
  WorkerPool pool(1);
  auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
  std::atomic<int> ran{0};
  WorkerPool pool(2);
  for (int i = 0; i < 50; ++i)
    pool.submit([&ran] { ran++; });
  pool.shutdown();
  EXPECT_EQ(ran.load(), 50);
  EXPECT_THROW(pool.submit([] { return 1; }), std::runtime_error);
}

TEST(WorkerPoolTest, RejectsZeroThreads) {
  EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}
