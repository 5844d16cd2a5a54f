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

#include "app/organizer_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>

#include "type/error.hpp"

namespace pageorg {
namespace {
auto IsKnownLevel(const std::string& name) -> bool {
  // from_str maps unknown names to off
  return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

template <typename T>
void ReadUnsigned(const nlohmann::json& j, const char* key, T& out) {
  if (!j.contains(key)) {
    return;
  }
  const auto& value = j.at(key);
  if (!value.is_number_unsigned()) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Config key '{}' must be a non-negative integer", key));
  }
  const auto raw = value.get<uint64_t>();
  if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Config key '{}' is out of range", key));
  }
  out = static_cast<T>(raw);
}

void RequirePositive(size_t value, const char* key) {
  if (value == 0) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Config key '{}' must be greater than zero", key));
  }
}
}  // namespace

auto OrganizerConfig::ThumbnailBox() const -> ThumbnailSize {
  return ThumbnailSize{thumbnail_width_, thumbnail_height_};
}

auto OrganizerConfig::Pipeline() const -> PipelineOptions {
  PipelineOptions options;
  options.batch_size_  = batch_size_;
  options.target_size_ = ThumbnailBox();
  return options;
}

void OrganizerConfig::Validate() const {
  RequirePositive(thumbnail_width_, "thumbnail_width");
  RequirePositive(thumbnail_height_, "thumbnail_height");
  RequirePositive(batch_size_, "batch_size");
  RequirePositive(cache_count_limit_, "cache_count_limit");
  RequirePositive(cache_cost_limit_, "cache_cost_limit");
  RequirePositive(import_threads_, "import_threads");
  if (!IsKnownLevel(log_level_)) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Unknown log level '{}'", log_level_));
  }
}

void OrganizerConfig::ApplyLogLevel() const {
  if (!IsKnownLevel(log_level_)) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Unknown log level '{}'", log_level_));
  }
  spdlog::set_level(spdlog::level::from_str(log_level_));
}

auto OrganizerConfig::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["thumbnail_width"]   = thumbnail_width_;
  j["thumbnail_height"]  = thumbnail_height_;
  j["batch_size"]        = batch_size_;
  j["cache_count_limit"] = cache_count_limit_;
  j["cache_cost_limit"]  = cache_cost_limit_;
  j["import_threads"]    = import_threads_;
  j["log_level"]         = log_level_;
  return j;
}

auto OrganizerConfig::FromJSON(const nlohmann::json& j) -> OrganizerConfig {
  if (!j.is_object()) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         "Configuration must be a JSON object");
  }
  OrganizerConfig config;
  ReadUnsigned(j, "thumbnail_width", config.thumbnail_width_);
  ReadUnsigned(j, "thumbnail_height", config.thumbnail_height_);
  ReadUnsigned(j, "batch_size", config.batch_size_);
  ReadUnsigned(j, "cache_count_limit", config.cache_count_limit_);
  ReadUnsigned(j, "cache_cost_limit", config.cache_cost_limit_);
  ReadUnsigned(j, "import_threads", config.import_threads_);
  if (j.contains("log_level")) {
    if (!j.at("log_level").is_string()) {
      throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                           "Config key 'log_level' must be a string");
    }
    config.log_level_ = j.at("log_level").get<std::string>();
  }
  config.Validate();
  return config;
}

auto OrganizerConfig::LoadFromFile(const file_path_t& path) -> OrganizerConfig {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Cannot open config file {}", path.string()));
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Malformed config file {}: {}", path.string(), e.what()));
  }
  return FromJSON(j);
}

void OrganizerConfig::SaveToFile(const file_path_t& path) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw OrganizerError(OrganizerErrorCode::INVALID_CONFIG,
                         fmt::format("Cannot write config file {}", path.string()));
  }
  out << ToJSON().dump(2);
}
};  // namespace pageorg
