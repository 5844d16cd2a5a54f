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

#include <vector>

#include "app/export_service.hpp"
#include "document/source_document.hpp"
#include "type/type.hpp"

namespace pageorg {
/**
 * @brief Builds a new PDF from pages of the source files, in order.
 *
 * Sources are reopened from their paths inside the export context and grafted through one
 * graft map per source, so objects shared between pages of a source are copied once. The
 * result is saved with stream, image and font compression.
 */
class MuPdfExportSink final : public ExportSink {
 public:
  void Write(const std::vector<PageHandle>& pages, const file_path_t& destination) override;
};
};  // namespace pageorg
