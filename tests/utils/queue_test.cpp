#include "utils/queue/queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace pageorg {
TEST(ConcurrentBlockingQueueTest, FifoOrder) {
  ConcurrentBlockingQueue<int> queue;
  queue.push(1);
  queue.push(2);
  queue.push(3);
  EXPECT_EQ(queue.size(), 3u);
  EXPECT_EQ(queue.pop(), 1);
  EXPECT_EQ(queue.try_pop().value(), 2);
  EXPECT_EQ(queue.pop(), 3);
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(ConcurrentBlockingQueueTest, PopForTimesOutWhenEmpty) {
  ConcurrentBlockingQueue<int> queue;
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(10)).has_value());
}

TEST(ConcurrentBlockingQueueTest, PopBlocksUntilPush) {
  ConcurrentBlockingQueue<int> queue;
  std::thread                  producer([&queue]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push(42);
  });
  EXPECT_EQ(queue.pop(), 42);
  producer.join();
}
}  // namespace pageorg
