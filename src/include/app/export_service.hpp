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

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "document/source_document.hpp"
#include "type/type.hpp"

namespace pageorg {
struct ExportResult {
  bool        success_ = false;
  std::string message_;
};

/**
 * @brief Writes pages, in the given order, into one output document.
 *
 * Implementations throw OrganizerError(EXPORT_FAILURE) and leave no partial promise about the
 * destination file.
 */
class ExportSink {
 public:
  virtual ~ExportSink() = default;

  virtual void Write(const std::vector<PageHandle>& pages, const file_path_t& destination) = 0;
};

class ExportService {
 public:
  using FinishedCallback = std::function<void(const ExportResult&)>;

  ExportService() = delete;
  ExportService(std::shared_ptr<ExportSink> sink, CallbackDispatcher dispatcher);

  ExportService(const ExportService&)            = delete;
  ExportService& operator=(const ExportService&) = delete;

  /**
   * @brief Export synchronously. Never retries; a failure is reported in the result.
   */
  auto Export(const std::vector<PageHandle>& pages, const file_path_t& destination)
      -> ExportResult;

  // Same as Export on the export worker, result delivered through the dispatcher
  void ExportAsync(std::vector<PageHandle> pages, file_path_t destination,
                   FinishedCallback callback);

 private:
  std::shared_ptr<ExportSink> sink_;
  CallbackDispatcher          dispatcher_;

  // One export at a time
  ThreadPool                  export_thread_pool_{1, "export"};
};
};  // namespace pageorg
