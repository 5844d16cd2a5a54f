#include "concurrency/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>

namespace pageorg {
TEST(ThreadPoolTest, RejectsZeroThreads) { EXPECT_THROW(ThreadPool(0), std::invalid_argument); }

TEST(ThreadPoolTest, DestructorDrainsQueuedTasks) {
  std::atomic<int> done{0};
  {
    ThreadPool pool(2);
    for (int i = 0; i < 50; ++i) {
      pool.Submit([&done]() { done.fetch_add(1); });
    }
  }
  EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, EnqueueReportsExceptionsThroughFuture) {
  ThreadPool pool(1);
  auto       ok     = pool.Enqueue([]() {});
  auto       failed = pool.Enqueue([]() { throw std::runtime_error("boom"); });
  EXPECT_NO_THROW(ok.get());
  EXPECT_THROW(failed.get(), std::runtime_error);
}

TEST(ThreadPoolTest, WorkerSurvivesThrowingTask) {
  ThreadPool pool(1);
  pool.Submit([]() { throw std::runtime_error("boom"); });
  auto after = pool.Enqueue([]() {});
  EXPECT_NO_THROW(after.get());
  EXPECT_EQ(pool.ThreadCount(), 1u);
}
}  // namespace pageorg
