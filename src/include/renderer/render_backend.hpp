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

#include <cstdint>

#include "document/source_document.hpp"
#include "image/image_buffer.hpp"

namespace pageorg {
// Target box of a thumbnail render, in pixels at scale 1
struct ThumbnailSize {
  uint32_t width_  = 140;
  uint32_t height_ = 180;

  bool     operator==(const ThumbnailSize& other) const = default;
};

struct FitResult {
  float scale_  = 1.0f;
  int   width_  = 0;
  int   height_ = 0;
};

/**
 * @brief Scale a page box to fit inside the target box, keeping its aspect ratio
 */
auto FitPageToBox(const PageSize& page, const ThumbnailSize& box) -> FitResult;

/**
 * @brief Produces a raster thumbnail of one page. Called from render workers, may take tens of
 * milliseconds. Throws on failure.
 */
class RenderBackend {
 public:
  virtual ~RenderBackend() = default;
  virtual auto Render(const PageHandle& page, const ThumbnailSize& target) -> ImageBuffer = 0;
};
};  // namespace pageorg
