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

#include "io/pdf/mupdf_render_backend.hpp"

#include "io/pdf/mupdf_document.hpp"
#include "type/error.hpp"

namespace pageorg {
auto MuPdfRenderBackend::Render(const PageHandle& page, const ThumbnailSize& target)
    -> ImageBuffer {
  const auto* document = dynamic_cast<const MuPdfDocument*>(page.document_.get());
  if (!document) {
    throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE,
                         "MuPdfRenderBackend: page does not belong to a MuPDF document");
  }
  return document->RenderPage(page.page_index_, target);
}
};  // namespace pageorg
