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
#include <opencv2/core.hpp>

namespace pageorg {
/**
 * @brief CPU raster of a rendered thumbnail. Immutable once published, shared between the cache
 * and every page entry showing it.
 */
class ImageBuffer {
 private:
  cv::Mat cpu_data_;

 public:
  bool cpu_data_valid_ = false;

  ImageBuffer()        = default;
  explicit ImageBuffer(const cv::Mat& data);
  explicit ImageBuffer(cv::Mat&& data);
  ImageBuffer(ImageBuffer&& other) noexcept;

  ImageBuffer& operator=(ImageBuffer&& other) noexcept;

  auto         GetCPUData() const -> const cv::Mat&;

  auto         Width() const -> int { return cpu_data_.cols; }
  auto         Height() const -> int { return cpu_data_.rows; }

  /**
   * @brief Resident size in bytes, used as the cache cost
   */
  auto         ByteCost() const -> size_t;
};
};  // namespace pageorg
