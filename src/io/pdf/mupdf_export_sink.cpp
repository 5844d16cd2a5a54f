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

#include "io/pdf/mupdf_export_sink.hpp"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
#include <spdlog/spdlog.h>

#include <map>
#include <string>

#include "type/error.hpp"

namespace pageorg {
namespace {
struct GraftSource {
  pdf_document*  document_ = nullptr;
  pdf_graft_map* map_      = nullptr;
};

/**
 * @brief Export context and everything opened in it. Dropped in reverse order of creation.
 */
class ExportContext {
 public:
  ExportContext() : ctx_(fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT)) {
    if (!ctx_) {
      throw OrganizerError(OrganizerErrorCode::EXPORT_FAILURE,
                           "Cannot create MuPDF context for export");
    }
  }

  ~ExportContext() {
    for (auto& [path, source] : sources_) {
      pdf_drop_graft_map(ctx_, source.map_);
      pdf_drop_document(ctx_, source.document_);
    }
    pdf_drop_document(ctx_, output_);
    fz_drop_context(ctx_);
  }

  ExportContext(const ExportContext&)            = delete;
  ExportContext& operator=(const ExportContext&) = delete;

  fz_context*                        ctx_;
  pdf_document*                      output_ = nullptr;
  std::map<std::string, GraftSource> sources_;
};
}  // namespace

void MuPdfExportSink::Write(const std::vector<PageHandle>& pages, const file_path_t& destination) {
  if (pages.empty()) {
    throw OrganizerError(OrganizerErrorCode::EXPORT_FAILURE, "No pages to export");
  }
  for (const auto& page : pages) {
    if (!page.IsValid()) {
      throw OrganizerError(OrganizerErrorCode::EXPORT_FAILURE,
                           "Cannot export a page whose source is no longer available");
    }
  }

  ExportContext export_ctx;
  fz_context*   ctx = export_ctx.ctx_;
  std::string   error;

  fz_try(ctx) {
    fz_register_document_handlers(ctx);
    export_ctx.output_ = pdf_create_document(ctx);
  }
  fz_catch(ctx) { error = fz_caught_message(ctx); }
  if (!error.empty()) {
    throw OrganizerError(OrganizerErrorCode::EXPORT_FAILURE,
                         "Failed to create output PDF: " + error);
  }

  for (const auto& page : pages) {
    const std::string source_path = page.document_->Path().string();
    auto&             source      = export_ctx.sources_[source_path];
    const int         page_number = static_cast<int>(page.page_index_);

    fz_try(ctx) {
      if (!source.document_) {
        source.document_ = pdf_open_document(ctx, source_path.c_str());
        source.map_      = pdf_new_graft_map(ctx, export_ctx.output_);
      }
      pdf_graft_mapped_page(ctx, source.map_, -1, source.document_, page_number);
    }
    fz_catch(ctx) { error = fz_caught_message(ctx); }
    if (!error.empty()) {
      throw OrganizerError(OrganizerErrorCode::EXPORT_FAILURE,
                           "Failed to copy page " + std::to_string(page_number + 1) + " of " +
                               page.document_->Label() + ": " + error);
    }
  }

  const std::string  destination_utf8 = destination.string();
  pdf_write_options  opts             = pdf_default_write_options;
  opts.do_compress                    = 1;
  opts.do_compress_images             = 1;
  opts.do_compress_fonts              = 1;
  opts.do_garbage                     = 1;

  fz_try(ctx) { pdf_save_document(ctx, export_ctx.output_, destination_utf8.c_str(), &opts); }
  fz_catch(ctx) { error = fz_caught_message(ctx); }
  if (!error.empty()) {
    throw OrganizerError(OrganizerErrorCode::EXPORT_FAILURE,
                         "Failed to save " + destination_utf8 + ": " + error);
  }

  spdlog::debug("[MuPdfExportSink] Wrote {} page(s) from {} source(s) to {}", pages.size(),
                export_ctx.sources_.size(), destination_utf8);
}
};  // namespace pageorg
