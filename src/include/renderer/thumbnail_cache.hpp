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

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "image/image_buffer.hpp"
#include "renderer/render_key.hpp"
#include "utils/cache/lru_cache.hpp"

namespace pageorg {
struct ThumbnailCacheStats {
  uint64_t hits_           = 0;
  uint64_t misses_         = 0;
  uint64_t insertions_     = 0;
  uint64_t evictions_      = 0;
  size_t   resident_count_ = 0;
  size_t   resident_cost_  = 0;
};

/**
 * @brief Render key -> thumbnail, bounded by entry count and total byte cost.
 *
 * Shared by every in-flight render task, all access is serialized by one lock.
 */
class ThumbnailCache {
 private:
  mutable std::mutex                                       cache_lock_;
  LRUCache<RenderKey, std::shared_ptr<const ImageBuffer>> cache_;

  uint64_t                                                 hits_       = 0;
  uint64_t                                                 misses_     = 0;
  uint64_t                                                 insertions_ = 0;

 public:
  static constexpr size_t default_count_limit_ = 100;
  static constexpr size_t default_cost_limit_  = 50 * 1024 * 1024;

  ThumbnailCache();
  ThumbnailCache(size_t count_limit, size_t cost_limit);

  /**
   * @brief Look up a thumbnail and mark it most recently used
   *
   * @return nullptr when absent
   */
  auto Get(const RenderKey& key) -> std::shared_ptr<const ImageBuffer>;

  /**
   * @brief Insert or replace. Evicts least recently used entries until both budgets hold; an
   * image larger than the whole cost budget is still accepted.
   */
  void Put(const RenderKey& key, std::shared_ptr<const ImageBuffer> image, size_t cost);
  void Put(const RenderKey& key, std::shared_ptr<const ImageBuffer> image);

  /**
   * @brief Drop key only while it still maps to image, a newer insert under the same key is kept
   *
   * @return true if an entry was removed
   */
  auto Erase(const RenderKey& key, const std::shared_ptr<const ImageBuffer>& image) -> bool;

  auto Contains(const RenderKey& key) const -> bool;
  void Clear();

  auto Stats() const -> ThumbnailCacheStats;
};
};  // namespace pageorg
