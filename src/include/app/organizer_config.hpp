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
#include <nlohmann/json.hpp>
#include <string>

#include "renderer/render_backend.hpp"
#include "renderer/thumbnail_cache.hpp"
#include "renderer/thumbnail_pipeline.hpp"
#include "type/type.hpp"

namespace pageorg {
/**
 * @brief Tunables of one organizer session. Every key of the JSON form is optional and falls back
 * to the defaults below; an out of range value raises OrganizerError(INVALID_CONFIG).
 */
struct OrganizerConfig {
  uint32_t    thumbnail_width_   = ThumbnailSize{}.width_;
  uint32_t    thumbnail_height_  = ThumbnailSize{}.height_;
  size_t      batch_size_        = PipelineOptions::default_batch_size_;
  size_t      cache_count_limit_ = ThumbnailCache::default_count_limit_;
  size_t      cache_cost_limit_  = ThumbnailCache::default_cost_limit_;
  size_t      import_threads_    = 4;
  std::string log_level_         = "info";

  auto        ThumbnailBox() const -> ThumbnailSize;
  auto        Pipeline() const -> PipelineOptions;

  void        Validate() const;
  // Set the level of the default spdlog logger
  void        ApplyLogLevel() const;

  auto        ToJSON() const -> nlohmann::json;
  static auto FromJSON(const nlohmann::json& j) -> OrganizerConfig;
  static auto LoadFromFile(const file_path_t& path) -> OrganizerConfig;
  void        SaveToFile(const file_path_t& path) const;
};
};  // namespace pageorg
