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
#include <functional>
#include <memory>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "image/image_buffer.hpp"
#include "renderer/render_backend.hpp"
#include "renderer/render_task.hpp"
#include "renderer/thumbnail_cache.hpp"
#include "type/type.hpp"

namespace pageorg {
struct PipelineOptions {
  static constexpr size_t default_batch_size_ = 5;

  size_t                  batch_size_         = default_batch_size_;
  ThumbnailSize           target_size_{};
};

// Invoked on the coordinating context with a finished thumbnail
using ThumbnailPublisher = std::function<void(page_id_t, std::shared_ptr<const ImageBuffer>)>;

/**
 * @brief Batched, cancellable thumbnail generation.
 *
 * Requests are split into batches of batch_size_. Renders of one batch run concurrently on the
 * render pool, the next batch starts once every task of the current one has settled. Batches of
 * successive Schedule calls queue behind each other, so at most batch_size_ renders are ever in
 * flight.
 *
 * Schedule, Cancel, CancelAll and the pending registry belong to the coordinating context:
 * results travel back through the dispatcher and are published there.
 */
class ThumbnailPipeline {
 public:
  ThumbnailPipeline(std::shared_ptr<RenderBackend> backend, std::shared_ptr<ThumbnailCache> cache,
                    PipelineOptions options, CallbackDispatcher dispatcher,
                    ThumbnailPublisher publisher);
  ~ThumbnailPipeline();

  ThumbnailPipeline(const ThumbnailPipeline&)            = delete;
  ThumbnailPipeline& operator=(const ThumbnailPipeline&) = delete;

  /**
   * @brief Queue thumbnails for the given pages. Cached thumbnails are published right away,
   * a page with a pending task gets its old task cancelled and replaced.
   */
  void Schedule(const std::vector<RenderRequest>& requests);

  /**
   * @return true if a task was pending for the page
   */
  auto Cancel(page_id_t page_id) -> bool;
  void CancelAll();

  auto IsPending(page_id_t page_id) const -> bool;
  auto PendingCount() const -> size_t;

  auto KeyFor(const RenderRequest& request) const -> RenderKey;
  auto Options() const -> const PipelineOptions&;

 private:
  struct State;
  std::shared_ptr<State>      state_;

  std::unique_ptr<ThreadPool> render_pool_;
  // Single worker running batches in order, torn down before the render pool it submits to
  std::unique_ptr<ThreadPool> batch_runner_;

  static void                 RunBatches(const std::shared_ptr<State>& st, ThreadPool& pool,
                                         const std::vector<RenderTask>& tasks);
  static void                 RunRenderTask(const std::shared_ptr<State>& st, const RenderTask& task);
  static void                 PostSettle(const std::shared_ptr<State>& st, const RenderTask& task,
                                         std::shared_ptr<const ImageBuffer> image);
};
};  // namespace pageorg
