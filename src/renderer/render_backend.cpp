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

#include "renderer/render_backend.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pageorg {
auto FitPageToBox(const PageSize& page, const ThumbnailSize& box) -> FitResult {
  if (!(page.width_ > 0.0f) || !(page.height_ > 0.0f)) {
    throw std::invalid_argument("[ERROR] FitPageToBox: page box must have a positive size");
  }
  if (box.width_ == 0 || box.height_ == 0) {
    throw std::invalid_argument("[ERROR] FitPageToBox: target box must have a positive size");
  }
  FitResult result;
  result.scale_  = std::min(static_cast<float>(box.width_) / page.width_,
                            static_cast<float>(box.height_) / page.height_);
  result.width_  = std::clamp(static_cast<int>(std::lround(page.width_ * result.scale_)), 1,
                              static_cast<int>(box.width_));
  result.height_ = std::clamp(static_cast<int>(std::lround(page.height_ * result.scale_)), 1,
                              static_cast<int>(box.height_));
  return result;
}
};  // namespace pageorg
