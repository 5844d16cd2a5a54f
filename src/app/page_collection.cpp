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

#include "app/page_collection.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "type/error.hpp"

namespace pageorg {
namespace {
constexpr const char* kInvalidSelectionMessage = "Cannot delete all pages or no pages selected.";
}  // namespace

PageCollection::PageCollection(std::shared_ptr<RenderBackend>  backend,
                               std::shared_ptr<ThumbnailCache> cache, PipelineOptions options,
                               CallbackDispatcher dispatcher)
    : cache_(cache) {
  pipeline_ = std::make_unique<ThumbnailPipeline>(
      std::move(backend), std::move(cache), options, std::move(dispatcher),
      [this](page_id_t id, std::shared_ptr<const ImageBuffer> thumbnail) {
        PublishThumbnail(id, std::move(thumbnail));
      });
}

auto PageCollection::AddSource(std::shared_ptr<SourceDocument> document)
    -> std::vector<page_id_t> {
  if (!document) {
    throw std::invalid_argument("[ERROR] PageCollection: cannot add a null document");
  }
  const auto page_count = document->PageCount();
  if (page_count == 0) {
    spdlog::info("[PageCollection] Source {} has no pages, nothing added", document->Label());
    return {};
  }

  const auto                 source_id = registry_.Register(document);
  const auto&                label     = document->Label();

  std::vector<page_id_t>     added;
  std::vector<RenderRequest> requests;
  added.reserve(page_count);
  requests.reserve(page_count);
  entries_.reserve(entries_.size() + page_count);

  for (page_index_t i = 0; i < page_count; ++i) {
    PageEntry entry;
    entry.id_            = id_generator_.GenerateID();
    entry.source_id_     = source_id;
    entry.source_label_  = label;
    entry.origin_index_  = i;
    entry.display_index_ = static_cast<uint32_t>(entries_.size() + 1);
    entry.page_handle_   = PageHandle{document, i};

    index_by_id_[entry.id_] = entries_.size();
    added.push_back(entry.id_);
    requests.push_back(RenderRequest{entry.id_, source_id, entry.page_handle_});
    entries_.push_back(std::move(entry));
  }

  spdlog::info("[PageCollection] Added {} page(s) from {}", page_count, label);
  Notify(ChangeKind::ENTRIES);

  pipeline_->Schedule(requests);
  return added;
}

auto PageCollection::Delete(const std::unordered_set<page_id_t>& ids) -> size_t {
  const auto present = static_cast<size_t>(
      std::count_if(ids.begin(), ids.end(), [this](page_id_t id) { return Contains(id); }));
  if (ids.empty() || present >= entries_.size()) {
    spdlog::warn("[PageCollection] Rejected delete of {} page(s) out of {}", ids.size(),
                 entries_.size());
    throw OrganizerError(OrganizerErrorCode::INVALID_SELECTION, kInvalidSelectionMessage);
  }
  if (present == 0) {
    return 0;
  }

  std::unordered_set<source_id_t> touched_sources;
  for (const auto id : ids) {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      continue;
    }
    pipeline_->Cancel(id);
    touched_sources.insert(entries_[it->second].source_id_);
    selection_.erase(id);
  }

  std::erase_if(entries_, [&ids](const PageEntry& entry) { return ids.contains(entry.id_); });
  RecomputeDisplayIndices();
  ReleaseUnusedSources(touched_sources);

  spdlog::info("[PageCollection] Deleted {} page(s), {} remaining", present, entries_.size());
  Notify(ChangeKind::ENTRIES);
  return present;
}

auto PageCollection::DeleteSelected() -> size_t {
  // Copy: Delete edits the selection while walking the id set
  const auto selected = selection_;
  return Delete(selected);
}

auto PageCollection::Move(page_id_t from, page_id_t to) -> bool {
  const auto from_index = IndexOf(from);
  const auto to_index   = IndexOf(to);
  if (!from_index.has_value() || !to_index.has_value()) {
    return false;
  }
  if (from_index.value() == to_index.value()) {
    return true;
  }

  PageEntry moved = std::move(entries_[from_index.value()]);
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(from_index.value()));
  entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(to_index.value()),
                  std::move(moved));
  RecomputeDisplayIndices();
  Notify(ChangeKind::ENTRIES);
  return true;
}

auto PageCollection::RemoveOne(page_id_t id) -> bool {
  const auto index = IndexOf(id);
  if (!index.has_value()) {
    return false;
  }
  pipeline_->Cancel(id);
  const auto source_id = entries_[index.value()].source_id_;
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index.value()));
  selection_.erase(id);
  RecomputeDisplayIndices();
  ReleaseUnusedSources({source_id});
  Notify(ChangeKind::ENTRIES);
  return true;
}

void PageCollection::Reverse() {
  std::reverse(entries_.begin(), entries_.end());
  RecomputeDisplayIndices();
  Notify(ChangeKind::ENTRIES);
}

auto PageCollection::Select(page_id_t id) -> bool {
  if (!Contains(id)) {
    return false;
  }
  if (selection_.insert(id).second) {
    Notify(ChangeKind::SELECTION);
  }
  return true;
}

auto PageCollection::Deselect(page_id_t id) -> bool {
  if (selection_.erase(id) == 0) {
    return false;
  }
  Notify(ChangeKind::SELECTION);
  return true;
}

auto PageCollection::Toggle(page_id_t id) -> bool {
  if (!Contains(id)) {
    return false;
  }
  if (selection_.erase(id) == 0) {
    selection_.insert(id);
  }
  Notify(ChangeKind::SELECTION);
  return true;
}

void PageCollection::SelectAll() {
  for (const auto& entry : entries_) {
    selection_.insert(entry.id_);
  }
  Notify(ChangeKind::SELECTION);
}

void PageCollection::ClearSelection() {
  if (selection_.empty()) {
    return;
  }
  selection_.clear();
  Notify(ChangeKind::SELECTION);
}

void PageCollection::Clear() {
  pipeline_->CancelAll();
  entries_.clear();
  index_by_id_.clear();
  selection_.clear();
  registry_.Clear();
  cache_->Clear();
  spdlog::info("[PageCollection] Cleared");
  Notify(ChangeKind::CLEARED);
}

auto PageCollection::Find(page_id_t id) const -> const PageEntry* {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

auto PageCollection::IndexOf(page_id_t id) const -> std::optional<size_t> {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto PageCollection::OrderedPageHandles() const -> std::vector<PageHandle> {
  std::vector<PageHandle> handles;
  handles.reserve(entries_.size());
  for (const auto& entry : entries_) {
    handles.push_back(entry.page_handle_);
  }
  return handles;
}

void PageCollection::RecomputeDisplayIndices() {
  index_by_id_.clear();
  for (size_t i = 0; i < entries_.size(); ++i) {
    entries_[i].display_index_ = static_cast<uint32_t>(i + 1);
    index_by_id_[entries_[i].id_] = i;
  }
}

void PageCollection::ReleaseUnusedSources(const std::unordered_set<source_id_t>& candidates) {
  for (const auto source_id : candidates) {
    const bool still_used = std::any_of(entries_.begin(), entries_.end(),
                                        [source_id](const PageEntry& entry) {
                                          return entry.source_id_ == source_id;
                                        });
    if (!still_used) {
      registry_.Release(source_id);
    }
  }
}

void PageCollection::PublishThumbnail(page_id_t id, std::shared_ptr<const ImageBuffer> thumbnail) {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) {
    // Removed while its render was in flight
    spdlog::debug("[PageCollection] Dropped thumbnail of removed page {}", id);
    return;
  }
  entries_[it->second].thumbnail_ = std::move(thumbnail);
  Notify(ChangeKind::THUMBNAIL);
}

void PageCollection::Notify(ChangeKind kind) {
  if (on_change_) {
    on_change_(kind);
  }
}
};  // namespace pageorg
