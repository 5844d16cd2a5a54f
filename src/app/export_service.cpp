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

#include "app/export_service.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

#include "type/error.hpp"

namespace pageorg {
ExportService::ExportService(std::shared_ptr<ExportSink> sink, CallbackDispatcher dispatcher)
    : sink_(std::move(sink)), dispatcher_(std::move(dispatcher)) {
  if (!sink_ || !dispatcher_) {
    throw std::invalid_argument("[ERROR] ExportService: sink and dispatcher are required");
  }
}

auto ExportService::Export(const std::vector<PageHandle>& pages, const file_path_t& destination)
    -> ExportResult {
  ExportResult result;
  if (pages.empty()) {
    result.message_ = "No pages to export";
    spdlog::error("[ExportService] {}: {}", ErrorCodeName(OrganizerErrorCode::EXPORT_FAILURE),
                  result.message_);
    return result;
  }
  try {
    sink_->Write(pages, destination);
    result.success_ = true;
    result.message_ = "PDF exported successfully!";
    spdlog::info("[ExportService] Exported {} page(s) to {}", pages.size(), destination.string());
  } catch (const std::exception& e) {
    result.message_ = e.what();
    spdlog::error("[ExportService] {}: {}", ErrorCodeName(OrganizerErrorCode::EXPORT_FAILURE),
                  result.message_);
  }
  return result;
}

void ExportService::ExportAsync(std::vector<PageHandle> pages, file_path_t destination,
                                FinishedCallback callback) {
  export_thread_pool_.Submit([this, pages = std::move(pages),
                              destination = std::move(destination),
                              callback    = std::move(callback)]() {
    auto result = Export(pages, destination);
    dispatcher_([callback, result = std::move(result)]() {
      if (callback) {
        callback(result);
      }
    });
  });
}
};  // namespace pageorg
