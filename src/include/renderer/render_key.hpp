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

#include <xxhash.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "renderer/render_backend.hpp"
#include "type/type.hpp"

namespace pageorg {
/**
 * @brief Cache key of a thumbnail: which page of which source, rendered at which size. Holds no
 * position, so reordering never invalidates a thumbnail.
 */
struct RenderKey {
  source_id_t  source_id_  = 0;
  page_index_t page_index_ = 0;
  uint32_t     width_      = 0;
  uint32_t     height_     = 0;

  RenderKey()              = default;
  RenderKey(source_id_t source_id, page_index_t page_index, const ThumbnailSize& size)
      : source_id_(source_id), page_index_(page_index), width_(size.width_), height_(size.height_) {}

  auto Hash() const noexcept -> render_hash_t {
    const std::array<uint32_t, 4> packed{source_id_, page_index_, width_, height_};
    return XXH3_64bits(packed.data(), sizeof(packed));
  }

  bool operator==(const RenderKey& other) const = default;
};
};  // namespace pageorg

namespace std {
template <>
struct hash<pageorg::RenderKey> {
  std::size_t operator()(const pageorg::RenderKey& key) const noexcept {
    return static_cast<std::size_t>(key.Hash());
  }
};
};  // namespace std
