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

#include "app/organizer_session.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "type/error.hpp"

namespace pageorg {
OrganizerSession::OrganizerSession(const OrganizerConfig&          config,
                                   std::shared_ptr<DocumentOpener> opener,
                                   std::shared_ptr<RenderBackend>  backend,
                                   std::shared_ptr<ExportSink> sink, CallbackDispatcher dispatcher)
    : config_(config), dispatcher_(std::move(dispatcher)) {
  config_.Validate();
  config_.ApplyLogLevel();

  cache_      = std::make_shared<ThumbnailCache>(config_.cache_count_limit_,
                                                 config_.cache_cost_limit_);
  collection_ = std::make_unique<PageCollection>(std::move(backend), cache_, config_.Pipeline(),
                                                 dispatcher_);
  import_service_ = std::make_unique<ImportServiceImpl>(std::move(opener), dispatcher_,
                                                        config_.import_threads_);
  export_service_ = std::make_unique<ExportService>(std::move(sink), dispatcher_);
}

OrganizerSession::~OrganizerSession() {
  alive_.reset();
  // Join the workers before the collection they report into goes away
  export_service_.reset();
  import_service_.reset();
  collection_.reset();
}

auto OrganizerSession::AddDocuments(const std::vector<file_path_t>& paths,
                                    ImportFinished                  on_finished)
    -> std::shared_ptr<ImportJob> {
  if (paths.empty()) {
    return nullptr;
  }
  ++busy_count_;
  std::weak_ptr<bool> alive = alive_;
  return import_service_->ImportDocuments(
      paths, [this, alive, on_finished = std::move(on_finished)](
                 std::vector<std::shared_ptr<SourceDocument>> documents, ImportResult result) {
        if (alive.expired()) {
          return;
        }
        --busy_count_;
        for (auto& document : documents) {
          result.pages_added_ += static_cast<uint32_t>(collection_->AddSource(std::move(document)).size());
        }
        if (result.failed_ == 0) {
          Report(true, fmt::format("Added {} document(s)", result.imported_));
        } else {
          Report(false, fmt::format("Added {} document(s), {} failed: {}", result.imported_,
                                    result.failed_, result.errors_.front().message_));
        }
        if (on_finished) {
          on_finished(result);
        }
      });
}

auto OrganizerSession::DeleteSelected() -> size_t {
  try {
    const auto deleted = collection_->DeleteSelected();
    Report(true, fmt::format("Successfully deleted {} page(s)!", deleted));
    return deleted;
  } catch (const OrganizerError& e) {
    Report(false, e.what());
    return 0;
  }
}

auto OrganizerSession::RemovePage(page_id_t id) -> bool { return collection_->RemoveOne(id); }

auto OrganizerSession::MovePage(page_id_t from, page_id_t to) -> bool {
  return collection_->Move(from, to);
}

void OrganizerSession::Reverse() { collection_->Reverse(); }

auto OrganizerSession::Select(page_id_t id) -> bool { return collection_->Select(id); }

auto OrganizerSession::Deselect(page_id_t id) -> bool { return collection_->Deselect(id); }

auto OrganizerSession::Toggle(page_id_t id) -> bool { return collection_->Toggle(id); }

void OrganizerSession::SelectAll() { collection_->SelectAll(); }

void OrganizerSession::ClearSelection() { collection_->ClearSelection(); }

void OrganizerSession::ClearAll() { collection_->Clear(); }

void OrganizerSession::Export(const file_path_t& destination, ExportFinished on_finished) {
  ++busy_count_;
  std::weak_ptr<bool> alive = alive_;
  export_service_->ExportAsync(
      collection_->OrderedPageHandles(), destination,
      [this, alive, on_finished = std::move(on_finished)](const ExportResult& result) {
        if (alive.expired()) {
          return;
        }
        --busy_count_;
        Report(result.success_, result.message_);
        if (on_finished) {
          on_finished(result);
        }
      });
}

void OrganizerSession::Report(bool success, std::string message) {
  if (!success) {
    spdlog::warn("[OrganizerSession] {}", message);
  }
  last_status_ = SessionStatus{success, std::move(message)};
}
};  // namespace pageorg
