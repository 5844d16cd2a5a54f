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

#include "app/import_service.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace pageorg {
namespace {
struct ImportBatch {
  std::vector<file_path_t>                     paths_;
  std::vector<std::shared_ptr<SourceDocument>> opened_;
  std::vector<std::optional<ImportError>>      errors_;
  std::atomic<size_t>                          remaining_;
  ImportProgress                               progress_;

  explicit ImportBatch(std::vector<file_path_t> paths)
      : paths_(std::move(paths)),
        opened_(paths_.size()),
        errors_(paths_.size()),
        remaining_(paths_.size()) {
    progress_.total_ = static_cast<uint32_t>(paths_.size());
  }
};

void FinishImport(const std::shared_ptr<ImportBatch>& batch, const std::shared_ptr<ImportJob>& job,
                  const CallbackDispatcher& dispatcher) {
  dispatcher([batch, job]() {
    ImportResult                                 result;
    std::vector<std::shared_ptr<SourceDocument>> documents;
    result.requested_ = static_cast<uint32_t>(batch->paths_.size());
    for (size_t i = 0; i < batch->paths_.size(); ++i) {
      if (batch->opened_[i]) {
        documents.push_back(std::move(batch->opened_[i]));
        ++result.imported_;
      } else if (batch->errors_[i].has_value()) {
        result.errors_.push_back(std::move(batch->errors_[i].value()));
        ++result.failed_;
      }
    }
    spdlog::info("[ImportService] Opened {} of {} source(s)", result.imported_,
                 result.requested_);
    if (job->on_finished_) {
      job->on_finished_(std::move(documents), std::move(result));
    }
  });
}
}  // namespace

ImportServiceImpl::ImportServiceImpl(std::shared_ptr<DocumentOpener> opener,
                                     CallbackDispatcher dispatcher, size_t thread_count)
    : opener_(std::move(opener)), dispatcher_(std::move(dispatcher)), thread_pool_(thread_count, "import") {
  if (!opener_ || !dispatcher_) {
    throw std::invalid_argument("[ERROR] ImportService: opener and dispatcher are required");
  }
}

auto ImportServiceImpl::ImportDocuments(const std::vector<file_path_t>& paths,
                                        ImportJob::FinishedCallback     on_finished)
    -> std::shared_ptr<ImportJob> {
  auto job          = std::make_shared<ImportJob>();
  job->on_finished_ = std::move(on_finished);
  return ImportDocuments(paths, std::move(job));
}

auto ImportServiceImpl::ImportDocuments(const std::vector<file_path_t>& paths,
                                        std::shared_ptr<ImportJob>      job)
    -> std::shared_ptr<ImportJob> {
  if (!job) {
    job = std::make_shared<ImportJob>();
  }
  auto batch = std::make_shared<ImportBatch>(paths);

  if (paths.empty()) {
    // Immediately finish
    FinishImport(batch, job, dispatcher_);
    return job;
  }

  for (size_t i = 0; i < paths.size(); ++i) {
    thread_pool_.Submit([batch, job, i, opener = opener_, dispatcher = dispatcher_]() {
      const auto& path = batch->paths_[i];
      if (job->IsCancelled()) {
        batch->errors_[i] =
            ImportError{OrganizerErrorCode::SOURCE_OPEN_FAILURE, path, "Import cancelled"};
        batch->progress_.failed_.fetch_add(1);
      } else {
        try {
          batch->opened_[i] = opener->Open(path);
          batch->progress_.opened_.fetch_add(1);
        } catch (const OrganizerError& e) {
          spdlog::warn("[ImportService] {}: {}", ErrorCodeName(e.Code()), e.what());
          batch->errors_[i] = ImportError{e.Code(), path, e.what()};
          batch->progress_.failed_.fetch_add(1);
        } catch (const std::exception& e) {
          spdlog::warn("[ImportService] SourceOpenFailure: {}", e.what());
          batch->errors_[i] =
              ImportError{OrganizerErrorCode::SOURCE_OPEN_FAILURE, path, e.what()};
          batch->progress_.failed_.fetch_add(1);
        }
      }

      if (job->on_progress_) {
        job->on_progress_(batch->progress_);
      }
      // The last task to settle publishes the whole batch
      if (batch->remaining_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        FinishImport(batch, job, dispatcher);
      }
    });
  }
  return job;
}
};  // namespace pageorg
