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

#include <atomic>
#include <memory>

#include "document/source_document.hpp"
#include "renderer/render_key.hpp"
#include "type/type.hpp"

namespace pageorg {
/**
 * @brief Advisory cancellation flag of one render task. Observed before the render, after the
 * render and once more before the result is published.
 */
class CancellationToken {
 private:
  std::atomic<bool> cancelled_{false};

 public:
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  auto IsCancelled() const noexcept -> bool { return cancelled_.load(std::memory_order_acquire); }
};

struct RenderRequest {
  page_id_t   page_id_   = 0;
  source_id_t source_id_ = 0;
  PageHandle  page_{};
};

struct RenderTask {
  RenderRequest                      request_{};
  RenderKey                          key_{};
  std::shared_ptr<CancellationToken> token_ = nullptr;
};
};  // namespace pageorg
