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
#include <memory>
#include <unordered_map>

#include "document/source_document.hpp"
#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace pageorg {
/**
 * @brief source_id -> opened document. Owned by the page collection and only touched from the
 * coordinating context.
 */
class SourceRegistry {
 private:
  IncrID::IDGenerator<source_id_t>                                  id_generator_{0};
  std::unordered_map<source_id_t, std::shared_ptr<SourceDocument>> sources_{};

 public:
  SourceRegistry() = default;

  auto Register(std::shared_ptr<SourceDocument> document) -> source_id_t;
  auto Lookup(source_id_t source_id) const -> std::shared_ptr<SourceDocument>;
  auto Contains(source_id_t source_id) const -> bool { return sources_.contains(source_id); }

  /**
   * @brief Drop the registry's reference once no entry uses the source anymore
   *
   * @return true if the source was registered
   */
  auto Release(source_id_t source_id) -> bool;

  auto Size() const -> size_t { return sources_.size(); }
  void Clear() { sources_.clear(); }
};
};  // namespace pageorg
