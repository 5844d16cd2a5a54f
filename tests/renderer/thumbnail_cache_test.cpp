#include "renderer/thumbnail_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

namespace pageorg {
namespace {
auto MakeThumbnail(int width = 14, int height = 18) -> std::shared_ptr<const ImageBuffer> {
  return std::make_shared<const ImageBuffer>(cv::Mat(height, width, CV_8UC3, cv::Scalar(0)));
}

auto Key(page_index_t page) -> RenderKey { return RenderKey{1, page, ThumbnailSize{}}; }
}  // namespace

TEST(ThumbnailCacheTest, GetCountsHitsAndMisses) {
  ThumbnailCache cache;
  EXPECT_EQ(cache.Get(Key(0)), nullptr);

  auto image = MakeThumbnail();
  cache.Put(Key(0), image);
  EXPECT_EQ(cache.Get(Key(0)), image);

  const auto stats = cache.Stats();
  EXPECT_EQ(stats.hits_, 1u);
  EXPECT_EQ(stats.misses_, 1u);
  EXPECT_EQ(stats.insertions_, 1u);
  EXPECT_EQ(stats.resident_count_, 1u);
  EXPECT_EQ(stats.resident_cost_, image->ByteCost());
}

TEST(ThumbnailCacheTest, HonoursCountBudget) {
  ThumbnailCache cache(3, 1024 * 1024);
  for (page_index_t i = 0; i < 5; ++i) {
    cache.Put(Key(i), MakeThumbnail(), 10);
  }
  const auto stats = cache.Stats();
  EXPECT_EQ(stats.resident_count_, 3u);
  EXPECT_EQ(stats.evictions_, 2u);
  EXPECT_FALSE(cache.Contains(Key(0)));
  EXPECT_FALSE(cache.Contains(Key(1)));
  EXPECT_TRUE(cache.Contains(Key(4)));
}

TEST(ThumbnailCacheTest, HonoursCostBudgetByRecency) {
  ThumbnailCache cache(100, 100);
  cache.Put(Key(0), MakeThumbnail(), 40);
  cache.Put(Key(1), MakeThumbnail(), 40);
  ASSERT_NE(cache.Get(Key(0)), nullptr);

  cache.Put(Key(2), MakeThumbnail(), 40);
  EXPECT_TRUE(cache.Contains(Key(0)));
  EXPECT_FALSE(cache.Contains(Key(1)));
  EXPECT_TRUE(cache.Contains(Key(2)));
  EXPECT_LE(cache.Stats().resident_cost_, 100u);
}

TEST(ThumbnailCacheTest, AcceptsEntryLargerThanBudget) {
  ThumbnailCache cache(100, 100);
  cache.Put(Key(0), MakeThumbnail(), 40);
  cache.Put(Key(1), MakeThumbnail(), 1000);
  EXPECT_TRUE(cache.Contains(Key(1)));
  EXPECT_FALSE(cache.Contains(Key(0)));
  EXPECT_EQ(cache.Stats().resident_count_, 1u);
}

TEST(ThumbnailCacheTest, ClearDropsEverything) {
  ThumbnailCache cache;
  cache.Put(Key(0), MakeThumbnail());
  cache.Put(Key(1), MakeThumbnail());
  cache.Clear();
  EXPECT_FALSE(cache.Contains(Key(0)));
  EXPECT_EQ(cache.Stats().resident_count_, 0u);
  EXPECT_EQ(cache.Stats().resident_cost_, 0u);
}

TEST(ThumbnailCacheTest, EraseKeepsNewerImageUnderSameKey) {
  ThumbnailCache cache;
  auto           stale = MakeThumbnail();
  auto           fresh = MakeThumbnail();
  cache.Put(Key(0), stale);
  cache.Put(Key(0), fresh);

  EXPECT_FALSE(cache.Erase(Key(0), stale));
  EXPECT_EQ(cache.Get(Key(0)), fresh);

  EXPECT_TRUE(cache.Erase(Key(0), fresh));
  EXPECT_FALSE(cache.Contains(Key(0)));
  EXPECT_EQ(cache.Stats().resident_cost_, 0u);
  EXPECT_FALSE(cache.Erase(Key(1), fresh));
}

TEST(ThumbnailCacheTest, RejectsInvalidInput) {
  EXPECT_THROW(ThumbnailCache(0, 100), std::invalid_argument);
  EXPECT_THROW(ThumbnailCache(100, 0), std::invalid_argument);
  ThumbnailCache cache;
  EXPECT_THROW(cache.Put(Key(0), nullptr, 1), std::invalid_argument);
}

TEST(ThumbnailCacheTest, ConcurrentAccessKeepsCostConsistent) {
  ThumbnailCache           cache(50, 50 * 100);
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&cache, t]() {
      for (page_index_t i = 0; i < 200; ++i) {
        const auto key = Key(static_cast<page_index_t>(t * 1000) + i);
        cache.Put(key, MakeThumbnail(), 100);
        cache.Get(Key(i));
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  const auto stats = cache.Stats();
  EXPECT_LE(stats.resident_count_, 50u);
  EXPECT_EQ(stats.resident_cost_, stats.resident_count_ * 100u);
  EXPECT_EQ(stats.insertions_, 800u);
}
}  // namespace pageorg
