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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "document/source_document.hpp"
#include "document/source_registry.hpp"
#include "image/image_buffer.hpp"
#include "renderer/render_backend.hpp"
#include "renderer/thumbnail_cache.hpp"
#include "renderer/thumbnail_pipeline.hpp"
#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace pageorg {
struct PageEntry {
  page_id_t                          id_            = 0;
  source_id_t                        source_id_     = 0;
  std::string                        source_label_{};
  page_index_t                       origin_index_  = 0;
  // 1-based position in the current order
  uint32_t                           display_index_ = 0;
  PageHandle                         page_handle_{};
  std::shared_ptr<const ImageBuffer> thumbnail_     = nullptr;

  auto HasThumbnail() const -> bool { return thumbnail_ != nullptr; }
};

enum class ChangeKind : uint8_t { ENTRIES, SELECTION, THUMBNAIL, CLEARED };

using ChangeCallback = std::function<void(ChangeKind)>;

/**
 * @brief The ordered pages of the output document, the selection, and the thumbnail pipeline
 * feeding them.
 *
 * Single-writer: every method, and every thumbnail publication, runs on the coordinating
 * context the dispatcher posts to. Every mutation leaves display indices at exactly 1..N.
 */
class PageCollection {
 public:
  PageCollection(std::shared_ptr<RenderBackend> backend, std::shared_ptr<ThumbnailCache> cache,
                 PipelineOptions options, CallbackDispatcher dispatcher);
  ~PageCollection() = default;

  PageCollection(const PageCollection&)            = delete;
  PageCollection& operator=(const PageCollection&) = delete;

  /**
   * @brief Append one entry per page of the document, in page order, and schedule thumbnails
   * for exactly those entries. A document without pages is a no-op.
   *
   * @return ids of the appended entries
   */
  auto AddSource(std::shared_ptr<SourceDocument> document) -> std::vector<page_id_t>;

  /**
   * @brief Remove a set of entries, cancelling their pending renders. Ids not in the collection
   * are ignored.
   *
   * Throws OrganizerError(INVALID_SELECTION) without touching anything if ids is empty or
   * covers every remaining entry.
   *
   * @return number of entries removed
   */
  auto Delete(const std::unordered_set<page_id_t>& ids) -> size_t;
  auto DeleteSelected() -> size_t;

  /**
   * @brief Take the entry out of its slot and reinsert it at the index the target occupied
   * before the removal. No-op if either id is unknown.
   */
  auto Move(page_id_t from, page_id_t to) -> bool;

  /**
   * @brief Remove one entry. Unlike Delete this may empty the collection.
   */
  auto RemoveOne(page_id_t id) -> bool;

  void Reverse();

  auto Select(page_id_t id) -> bool;
  auto Deselect(page_id_t id) -> bool;
  auto Toggle(page_id_t id) -> bool;
  void SelectAll();
  void ClearSelection();

  /**
   * @brief Cancel every render and drop entries, selection, sources and cached thumbnails
   */
  void Clear();

  auto Entries() const -> const std::vector<PageEntry>& { return entries_; }
  auto Find(page_id_t id) const -> const PageEntry*;
  auto IndexOf(page_id_t id) const -> std::optional<size_t>;
  auto Contains(page_id_t id) const -> bool { return index_by_id_.contains(id); }
  auto Size() const -> size_t { return entries_.size(); }
  auto HasPages() const -> bool { return !entries_.empty(); }

  auto Selection() const -> const std::unordered_set<page_id_t>& { return selection_; }
  auto IsSelected(page_id_t id) const -> bool { return selection_.contains(id); }
  auto SelectionCount() const -> size_t { return selection_.size(); }

  // Distinct sources with at least one page in the collection
  auto DocumentCount() const -> size_t { return registry_.Size(); }
  auto Registry() const -> const SourceRegistry& { return registry_; }

  auto OrderedPageHandles() const -> std::vector<PageHandle>;

  auto Pipeline() -> ThumbnailPipeline& { return *pipeline_; }
  auto Pipeline() const -> const ThumbnailPipeline& { return *pipeline_; }

  void SetChangeCallback(ChangeCallback callback) { on_change_ = std::move(callback); }

 private:
  std::vector<PageEntry>                 entries_{};
  std::unordered_map<page_id_t, size_t>  index_by_id_{};
  std::unordered_set<page_id_t>          selection_{};
  SourceRegistry                         registry_{};
  IncrID::IDGenerator<page_id_t>         id_generator_{0};
  std::shared_ptr<ThumbnailCache>        cache_ = nullptr;
  ChangeCallback                         on_change_{};

  // Last member: destroyed first, so no render result outlives the entries
  std::unique_ptr<ThumbnailPipeline>     pipeline_;

  void RecomputeDisplayIndices();
  void ReleaseUnusedSources(const std::unordered_set<source_id_t>& candidates);
  void PublishThumbnail(page_id_t id, std::shared_ptr<const ImageBuffer> thumbnail);
  void Notify(ChangeKind kind);
};
};  // namespace pageorg
