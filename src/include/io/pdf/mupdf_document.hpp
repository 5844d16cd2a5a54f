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

#include <memory>
#include <mutex>
#include <string>

#include "document/source_document.hpp"
#include "image/image_buffer.hpp"
#include "renderer/render_backend.hpp"
#include "type/type.hpp"

struct fz_context;
struct fz_document;

namespace pageorg {
/**
 * @brief A document opened by MuPDF. Owns its own fz_context; every MuPDF call on it is
 * serialised by one mutex, distinct documents render in parallel.
 */
class MuPdfDocument final : public SourceDocument {
 public:
  // Throws OrganizerError(SOURCE_OPEN_FAILURE)
  static auto Open(const file_path_t& path) -> std::shared_ptr<MuPdfDocument>;

  ~MuPdfDocument() override;

  MuPdfDocument(const MuPdfDocument&)            = delete;
  MuPdfDocument& operator=(const MuPdfDocument&) = delete;

  auto PageCount() const -> page_index_t override { return page_count_; }
  auto PageBounds(page_index_t index) const -> PageSize override;
  auto Label() const -> const std::string& override { return label_; }
  auto Path() const -> const file_path_t& override { return path_; }

  /**
   * @brief Rasterise one page on white, scaled to fit the box with its aspect ratio kept.
   * Throws OrganizerError(RENDER_FAILURE).
   */
  auto RenderPage(page_index_t index, const ThumbnailSize& box) const -> ImageBuffer;

 private:
  MuPdfDocument(fz_context* ctx, fz_document* doc, file_path_t path, page_index_t page_count);

  fz_context*        ctx_;
  fz_document*       doc_;
  file_path_t        path_;
  std::string        label_;
  page_index_t       page_count_;

  mutable std::mutex mtx_;
};

class MuPdfDocumentOpener final : public DocumentOpener {
 public:
  auto Open(const file_path_t& path) -> std::shared_ptr<SourceDocument> override;
};
};  // namespace pageorg
