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

#include "image/image_buffer.hpp"

#include <stdexcept>
#include <utility>

namespace pageorg {
ImageBuffer::ImageBuffer(const cv::Mat& data) : cpu_data_valid_(!data.empty()) {
  data.copyTo(cpu_data_);
}

ImageBuffer::ImageBuffer(cv::Mat&& data)
    : cpu_data_(std::move(data)), cpu_data_valid_(!cpu_data_.empty()) {}

ImageBuffer::ImageBuffer(ImageBuffer&& other) noexcept
    : cpu_data_(std::move(other.cpu_data_)), cpu_data_valid_(other.cpu_data_valid_) {
  other.cpu_data_valid_ = false;
}

ImageBuffer& ImageBuffer::operator=(ImageBuffer&& other) noexcept {
  if (this != &other) {
    cpu_data_             = std::move(other.cpu_data_);
    cpu_data_valid_       = other.cpu_data_valid_;
    other.cpu_data_valid_ = false;
  }
  return *this;
}

auto ImageBuffer::GetCPUData() const -> const cv::Mat& {
  if (!cpu_data_valid_) {
    throw std::runtime_error("Image Buffer: No valid image data to be returned");
  }
  return cpu_data_;
}

auto ImageBuffer::ByteCost() const -> size_t {
  if (!cpu_data_valid_) {
    return 0;
  }
  return cpu_data_.total() * cpu_data_.elemSize();
}
};  // namespace pageorg
