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

#include "document/source_registry.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace pageorg {
auto SourceRegistry::Register(std::shared_ptr<SourceDocument> document) -> source_id_t {
  if (!document) {
    throw std::invalid_argument("[ERROR] SourceRegistry: cannot register a null document");
  }
  const auto source_id = id_generator_.GenerateID();
  spdlog::debug("[SourceRegistry] Registered source {} ({}, {} pages)", source_id,
                document->Label(), document->PageCount());
  sources_.emplace(source_id, std::move(document));
  return source_id;
}

auto SourceRegistry::Lookup(source_id_t source_id) const -> std::shared_ptr<SourceDocument> {
  auto it = sources_.find(source_id);
  if (it == sources_.end()) {
    return nullptr;
  }
  return it->second;
}

auto SourceRegistry::Release(source_id_t source_id) -> bool {
  if (sources_.erase(source_id) == 0) {
    return false;
  }
  spdlog::debug("[SourceRegistry] Released source {}", source_id);
  return true;
}
};  // namespace pageorg
