//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "renderer/thumbnail_cache.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace pageorg {
ThumbnailCache::ThumbnailCache() : cache_(default_count_limit_, default_cost_limit_) {}

ThumbnailCache::ThumbnailCache(size_t count_limit, size_t cost_limit)
    : cache_(count_limit, cost_limit) {
  if (count_limit == 0 || cost_limit == 0) {
    throw std::invalid_argument("[ERROR] ThumbnailCache: budgets must be positive");
  }
}

auto ThumbnailCache::Get(const RenderKey& key) -> std::shared_ptr<const ImageBuffer> {
  std::lock_guard<std::mutex> lock(cache_lock_);
  auto                        image = cache_.AccessElement(key);
  if (!image.has_value()) {
    ++misses_;
    return nullptr;
  }
  ++hits_;
  return image.value();
}

void ThumbnailCache::Put(const RenderKey& key, std::shared_ptr<const ImageBuffer> image,
                         size_t cost) {
  if (!image) {
    throw std::invalid_argument("[ERROR] ThumbnailCache: cannot cache a null thumbnail");
  }
  // Evicted images are released after the lock is dropped
  std::vector<std::shared_ptr<const ImageBuffer>> evicted;
  {
    std::lock_guard<std::mutex> lock(cache_lock_);
    evicted = cache_.RecordAccess(key, std::move(image), cost);
    ++insertions_;
  }
  if (!evicted.empty()) {
    spdlog::debug("[ThumbnailCache] Evicted {} thumbnail(s)", evicted.size());
  }
}

void ThumbnailCache::Put(const RenderKey& key, std::shared_ptr<const ImageBuffer> image) {
  if (!image) {
    throw std::invalid_argument("[ERROR] ThumbnailCache: cannot cache a null thumbnail");
  }
  const auto cost = image->ByteCost();
  Put(key, std::move(image), cost);
}

auto ThumbnailCache::Erase(const RenderKey& key, const std::shared_ptr<const ImageBuffer>& image)
    -> bool {
  std::shared_ptr<const ImageBuffer> dropped;
  {
    std::lock_guard<std::mutex> lock(cache_lock_);
    auto                        current = cache_.PeekElement(key);
    if (!current.has_value() || current.value() != image) {
      return false;
    }
    dropped = std::move(current.value());
    cache_.RemoveRecord(key);
  }
  return true;
}

auto ThumbnailCache::Contains(const RenderKey& key) const -> bool {
  std::lock_guard<std::mutex> lock(cache_lock_);
  return cache_.Contains(key);
}

void ThumbnailCache::Clear() {
  std::lock_guard<std::mutex> lock(cache_lock_);
  cache_.Flush();
}

auto ThumbnailCache::Stats() const -> ThumbnailCacheStats {
  std::lock_guard<std::mutex> lock(cache_lock_);
  ThumbnailCacheStats         stats;
  stats.hits_           = hits_;
  stats.misses_         = misses_;
  stats.insertions_     = insertions_;
  stats.evictions_      = cache_.EvictCount();
  stats.resident_count_ = cache_.Size();
  stats.resident_cost_  = cache_.TotalCost();
  return stats;
}
};  // namespace pageorg
