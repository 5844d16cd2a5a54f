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
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "document/source_document.hpp"
#include "type/error.hpp"
#include "type/type.hpp"

namespace pageorg {
struct ImportProgress {
  uint32_t              total_  = 0;
  std::atomic<uint32_t> opened_ = 0;
  std::atomic<uint32_t> failed_ = 0;
};

struct ImportError {
  OrganizerErrorCode code_ = OrganizerErrorCode::UNKNOWN;
  file_path_t        path_{};
  std::string        message_{};
};

struct ImportResult {
  uint32_t                 requested_   = 0;
  uint32_t                 imported_    = 0;
  uint32_t                 failed_      = 0;
  // Filled in by whoever appends the opened documents to a collection
  uint32_t                 pages_added_ = 0;
  std::vector<ImportError> errors_{};
};

class ImportJob {
 public:
  // Runs on import worker threads
  using ProgressCallback = std::function<void(const ImportProgress&)>;
  // Opened documents in the order of the requested paths, failures left out
  using FinishedCallback =
      std::function<void(std::vector<std::shared_ptr<SourceDocument>>, ImportResult)>;

  // Cancellation token observed before each open
  std::atomic<bool> canceled_{false};

  ProgressCallback  on_progress_{};
  FinishedCallback  on_finished_{};

  void Cancel() { canceled_.store(true); }
  auto IsCancelled() const -> bool { return canceled_.load(); }
};

class ImportService {
 public:
  virtual ~ImportService() = default;

  virtual auto ImportDocuments(const std::vector<file_path_t>& paths,
                               ImportJob::FinishedCallback     on_finished)
      -> std::shared_ptr<ImportJob>                                              = 0;

  virtual auto ImportDocuments(const std::vector<file_path_t>& paths,
                               std::shared_ptr<ImportJob> job) -> std::shared_ptr<ImportJob> = 0;
};

/**
 * @brief Opens source files on a worker pool. A failing path never stops the others; the
 * finished callback runs exactly once, on the dispatcher, after every path was attempted.
 */
class ImportServiceImpl final : public ImportService {
 public:
  static constexpr size_t default_thread_count_ = 4;

  ImportServiceImpl(std::shared_ptr<DocumentOpener> opener, CallbackDispatcher dispatcher,
                    size_t thread_count = default_thread_count_);
  ~ImportServiceImpl() override = default;

  ImportServiceImpl(const ImportServiceImpl&)            = delete;
  ImportServiceImpl& operator=(const ImportServiceImpl&) = delete;

  auto ImportDocuments(const std::vector<file_path_t>& paths,
                       ImportJob::FinishedCallback on_finished) -> std::shared_ptr<ImportJob> override;

  auto ImportDocuments(const std::vector<file_path_t>& paths, std::shared_ptr<ImportJob> job)
      -> std::shared_ptr<ImportJob> override;

 private:
  std::shared_ptr<DocumentOpener> opener_;
  CallbackDispatcher              dispatcher_;
  ThreadPool                      thread_pool_;
};
};  // namespace pageorg
