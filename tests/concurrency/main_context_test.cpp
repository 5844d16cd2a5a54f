#include "concurrency/main_context.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace pageorg {
TEST(MainContextTest, RunsPostedClosuresInOrderOnOwner) {
  MainContext      ctx;
  std::vector<int> order;
  ctx.Post([&order]() { order.push_back(1); });
  ctx.Post([&order]() { order.push_back(2); });
  EXPECT_EQ(ctx.QueuedCount(), 2u);
  EXPECT_EQ(ctx.RunPending(), 2u);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
  EXPECT_TRUE(ctx.IsOwnerThread());
}

TEST(MainContextTest, RunUntilWaitsForWorkerPosts) {
  MainContext ctx;
  auto        dispatch = ctx.Dispatcher();
  bool        done     = false;
  std::thread worker([&dispatch, &done]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    dispatch([&done]() { done = true; });
  });
  EXPECT_TRUE(ctx.RunUntil([&done]() { return done; }, std::chrono::seconds(5)));
  worker.join();
}

TEST(MainContextTest, RunUntilTimesOut) {
  MainContext ctx;
  EXPECT_FALSE(ctx.RunUntil([]() { return false; }, std::chrono::milliseconds(50)));
}
}  // namespace pageorg
