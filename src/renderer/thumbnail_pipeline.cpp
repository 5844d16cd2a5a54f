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

#include "renderer/thumbnail_pipeline.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "type/error.hpp"

namespace pageorg {
struct ThumbnailPipeline::State {
  std::shared_ptr<RenderBackend>                                      backend_ = nullptr;
  std::shared_ptr<ThumbnailCache>                                     cache_   = nullptr;
  PipelineOptions                                                     options_{};
  CallbackDispatcher                                                  dispatcher_{};
  ThumbnailPublisher                                                  publisher_{};

  // Coordinating context only
  std::unordered_map<page_id_t, std::shared_ptr<CancellationToken>> pending_{};

  /**
   * @brief Runs on the coordinating context once a task settled. A null image means the task
   * failed or was cancelled.
   */
  void Settle(page_id_t page_id, const std::shared_ptr<CancellationToken>& token,
              std::shared_ptr<const ImageBuffer> image) {
    auto       it      = pending_.find(page_id);
    const bool current = it != pending_.end() && it->second == token;
    if (current) {
      pending_.erase(it);
    }
    if (!image) {
      return;
    }
    if (!current || token->IsCancelled()) {
      spdlog::debug("[ThumbnailPipeline] Dropped result for cancelled page {}", page_id);
      return;
    }
    if (publisher_) {
      publisher_(page_id, std::move(image));
    }
  }
};

ThumbnailPipeline::ThumbnailPipeline(std::shared_ptr<RenderBackend>  backend,
                                     std::shared_ptr<ThumbnailCache> cache, PipelineOptions options,
                                     CallbackDispatcher dispatcher, ThumbnailPublisher publisher)
    : state_(std::make_shared<State>()) {
  if (!backend || !cache) {
    throw std::invalid_argument("[ERROR] ThumbnailPipeline: backend and cache are required");
  }
  if (!dispatcher) {
    throw std::invalid_argument("[ERROR] ThumbnailPipeline: a dispatcher is required");
  }
  if (options.batch_size_ == 0) {
    throw std::invalid_argument("[ERROR] ThumbnailPipeline: batch size must be positive");
  }
  state_->backend_    = std::move(backend);
  state_->cache_      = std::move(cache);
  state_->options_    = options;
  state_->dispatcher_ = std::move(dispatcher);
  state_->publisher_  = std::move(publisher);

  render_pool_        = std::make_unique<ThreadPool>(options.batch_size_, "render");
  batch_runner_       = std::make_unique<ThreadPool>(1, "batch");
}

ThumbnailPipeline::~ThumbnailPipeline() {
  CancelAll();
  batch_runner_.reset();
  render_pool_.reset();
}

auto ThumbnailPipeline::KeyFor(const RenderRequest& request) const -> RenderKey {
  return RenderKey{request.source_id_, request.page_.page_index_, state_->options_.target_size_};
}

auto ThumbnailPipeline::Options() const -> const PipelineOptions& { return state_->options_; }

void ThumbnailPipeline::Schedule(const std::vector<RenderRequest>& requests) {
  auto&                   st = *state_;
  std::vector<RenderTask> tasks;
  tasks.reserve(requests.size());

  for (const auto& request : requests) {
    // A newer request supersedes whatever is still running for this page
    Cancel(request.page_id_);

    RenderTask task;
    task.request_ = request;
    task.key_     = KeyFor(request);

    if (auto cached = st.cache_->Get(task.key_)) {
      spdlog::debug("[ThumbnailPipeline] Cache hit for page {}", request.page_id_);
      if (st.publisher_) {
        st.publisher_(request.page_id_, std::move(cached));
      }
      continue;
    }

    task.token_ = std::make_shared<CancellationToken>();
    st.pending_[request.page_id_] = task.token_;
    tasks.push_back(std::move(task));
  }

  if (tasks.empty()) {
    return;
  }

  spdlog::debug("[ThumbnailPipeline] Scheduled {} render(s) in batches of {}", tasks.size(),
                st.options_.batch_size_);
  auto  st_ptr = state_;
  auto* pool   = render_pool_.get();
  batch_runner_->Submit(
      [st_ptr, pool, tasks = std::move(tasks)]() { RunBatches(st_ptr, *pool, tasks); });
}

auto ThumbnailPipeline::Cancel(page_id_t page_id) -> bool {
  auto it = state_->pending_.find(page_id);
  if (it == state_->pending_.end()) {
    return false;
  }
  it->second->Cancel();
  state_->pending_.erase(it);
  spdlog::debug("[ThumbnailPipeline] Cancelled render of page {}", page_id);
  return true;
}

void ThumbnailPipeline::CancelAll() {
  for (auto& [page_id, token] : state_->pending_) {
    token->Cancel();
  }
  state_->pending_.clear();
}

auto ThumbnailPipeline::IsPending(page_id_t page_id) const -> bool {
  return state_->pending_.contains(page_id);
}

auto ThumbnailPipeline::PendingCount() const -> size_t { return state_->pending_.size(); }

void ThumbnailPipeline::RunBatches(const std::shared_ptr<State>& st, ThreadPool& pool,
                                   const std::vector<RenderTask>& tasks) {
  const size_t batch_size = st->options_.batch_size_;
  for (size_t begin = 0; begin < tasks.size(); begin += batch_size) {
    const size_t                   end = std::min(begin + batch_size, tasks.size());
    std::vector<std::future<void>> settled;
    settled.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      settled.push_back(pool.Enqueue([st, &task = tasks[i]]() { RunRenderTask(st, task); }));
    }
    // The next batch waits until every task of this one finished or was cancelled
    for (auto& done : settled) {
      try {
        done.get();
      } catch (const std::exception& e) {
        spdlog::error("[ThumbnailPipeline] Render task failed unexpectedly: {}", e.what());
      }
    }
  }
}

void ThumbnailPipeline::RunRenderTask(const std::shared_ptr<State>& st, const RenderTask& task) {
  const auto page_id = task.request_.page_id_;
  if (task.token_->IsCancelled()) {
    PostSettle(st, task, nullptr);
    return;
  }

  // An earlier batch may have rendered the same page meanwhile
  if (auto cached = st->cache_->Get(task.key_)) {
    PostSettle(st, task, std::move(cached));
    return;
  }

  std::shared_ptr<const ImageBuffer> image;
  try {
    auto rendered = st->backend_->Render(task.request_.page_, st->options_.target_size_);
    if (!rendered.cpu_data_valid_) {
      throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE, "backend returned an empty raster");
    }
    image = std::make_shared<const ImageBuffer>(std::move(rendered));
  } catch (const std::exception& e) {
    spdlog::warn("[ThumbnailPipeline] RenderFailure for page {}: {}", page_id, e.what());
    PostSettle(st, task, nullptr);
    return;
  }

  // Checked after the insert: a cancel that races a cache clear still removes this entry
  st->cache_->Put(task.key_, image, image->ByteCost());
  if (task.token_->IsCancelled()) {
    st->cache_->Erase(task.key_, image);
    spdlog::debug("[ThumbnailPipeline] Discarded render of cancelled page {}", page_id);
    PostSettle(st, task, nullptr);
    return;
  }

  PostSettle(st, task, std::move(image));
}

void ThumbnailPipeline::PostSettle(const std::shared_ptr<State>& st, const RenderTask& task,
                                   std::shared_ptr<const ImageBuffer> image) {
  std::weak_ptr<State> weak_state = st;
  st->dispatcher_([weak_state, page_id = task.request_.page_id_, token = task.token_,
                   image = std::move(image)]() mutable {
    auto state = weak_state.lock();
    if (!state) {
      return;
    }
    state->Settle(page_id, token, std::move(image));
  });
}
};  // namespace pageorg
