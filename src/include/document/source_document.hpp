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
#include <string>

#include "type/type.hpp"

namespace pageorg {
// Page box in PDF points
struct PageSize {
  float width_  = 0.0f;
  float height_ = 0.0f;
};

/**
 * @brief An opened multi-page document contributing pages to the collection.
 *
 * Implementations must tolerate concurrent calls from render workers.
 */
class SourceDocument {
 public:
  virtual ~SourceDocument()                                       = default;

  virtual auto PageCount() const -> page_index_t                  = 0;
  virtual auto PageBounds(page_index_t index) const -> PageSize   = 0;
  // Display name, the file name without its extension
  virtual auto Label() const -> const std::string&                = 0;
  virtual auto Path() const -> const file_path_t&                 = 0;
};

/**
 * @brief Reference to one page of a source document. Shared by the page entry, in-flight render
 * tasks and the export sink; keeps the document alive while any of them still holds it.
 */
struct PageHandle {
  std::shared_ptr<SourceDocument> document_   = nullptr;
  page_index_t                    page_index_ = 0;

  auto IsValid() const -> bool { return document_ && page_index_ < document_->PageCount(); }
};

/**
 * @brief Turns a user supplied file into an opened document. Throws OrganizerError with
 * SOURCE_OPEN_FAILURE if the file is not a readable document.
 */
class DocumentOpener {
 public:
  virtual ~DocumentOpener()                                                      = default;
  virtual auto Open(const file_path_t& path) -> std::shared_ptr<SourceDocument> = 0;
};

auto LabelFromPath(const file_path_t& path) -> std::string;
};  // namespace pageorg
