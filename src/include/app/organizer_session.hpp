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
#include <vector>

#include "app/export_service.hpp"
#include "app/import_service.hpp"
#include "app/organizer_config.hpp"
#include "app/page_collection.hpp"
#include "document/source_document.hpp"
#include "renderer/render_backend.hpp"
#include "renderer/thumbnail_cache.hpp"
#include "type/type.hpp"

namespace pageorg {
struct SessionStatus {
  bool        success_ = false;
  std::string message_;
};

/**
 * @brief Everything one organizer window needs, built from a single config: the page
 * collection with its thumbnail pipeline, and the import and export services.
 *
 * Commands and callbacks run on the coordinating context. Errors never leave the session; they
 * end up in last_status().
 */
class OrganizerSession {
 public:
  using ImportFinished = std::function<void(const ImportResult&)>;
  using ExportFinished = std::function<void(const ExportResult&)>;

  OrganizerSession(const OrganizerConfig& config, std::shared_ptr<DocumentOpener> opener,
                   std::shared_ptr<RenderBackend> backend, std::shared_ptr<ExportSink> sink,
                   CallbackDispatcher dispatcher);
  ~OrganizerSession();

  OrganizerSession(const OrganizerSession&)            = delete;
  OrganizerSession& operator=(const OrganizerSession&) = delete;

  /**
   * @brief Open the files in the background and append their pages in the given order. An empty
   * list does nothing.
   */
  auto AddDocuments(const std::vector<file_path_t>& paths, ImportFinished on_finished = {})
      -> std::shared_ptr<ImportJob>;

  auto DeleteSelected() -> size_t;
  auto RemovePage(page_id_t id) -> bool;
  auto MovePage(page_id_t from, page_id_t to) -> bool;
  void Reverse();

  auto Select(page_id_t id) -> bool;
  auto Deselect(page_id_t id) -> bool;
  auto Toggle(page_id_t id) -> bool;
  void SelectAll();
  void ClearSelection();
  void ClearAll();

  // Write the pages in display order on the export worker
  void Export(const file_path_t& destination, ExportFinished on_finished = {});

  auto is_busy() const -> bool { return busy_count_ > 0; }
  auto last_status() const -> const std::optional<SessionStatus>& { return last_status_; }
  void DismissStatus() { last_status_.reset(); }

  auto Collection() -> PageCollection& { return *collection_; }
  auto Collection() const -> const PageCollection& { return *collection_; }
  auto Cache() const -> const ThumbnailCache& { return *cache_; }
  auto Config() const -> const OrganizerConfig& { return config_; }

 private:
  OrganizerConfig                    config_;
  CallbackDispatcher                 dispatcher_;
  std::shared_ptr<ThumbnailCache>    cache_;
  std::unique_ptr<PageCollection>    collection_;
  std::unique_ptr<ImportServiceImpl> import_service_;
  std::unique_ptr<ExportService>     export_service_;

  uint32_t                           busy_count_ = 0;
  std::optional<SessionStatus>       last_status_;

  // Expires with the session; posted callbacks check it before touching members
  std::shared_ptr<bool>              alive_ = std::make_shared<bool>(true);

  void                               Report(bool success, std::string message);
};
};  // namespace pageorg
