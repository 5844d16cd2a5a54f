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

#include "io/pdf/mupdf_document.hpp"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <spdlog/spdlog.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <memory>
#include <utility>

#include "type/error.hpp"

namespace pageorg {
namespace {
struct PixmapDeleter {
  fz_context* ctx_;
  void        operator()(fz_pixmap* pix) const { fz_drop_pixmap(ctx_, pix); }
};
}  // namespace

MuPdfDocument::MuPdfDocument(fz_context* ctx, fz_document* doc, file_path_t path,
                             page_index_t page_count)
    : ctx_(ctx),
      doc_(doc),
      path_(std::move(path)),
      label_(LabelFromPath(path_)),
      page_count_(page_count) {}

MuPdfDocument::~MuPdfDocument() {
  fz_drop_document(ctx_, doc_);
  fz_drop_context(ctx_);
}

auto MuPdfDocument::Open(const file_path_t& path) -> std::shared_ptr<MuPdfDocument> {
  fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
  if (!ctx) {
    throw OrganizerError(OrganizerErrorCode::SOURCE_OPEN_FAILURE,
                         "Cannot create MuPDF context for " + path.string());
  }

  const std::string path_utf8 = path.string();
  fz_document*      doc       = nullptr;
  int               pages     = 0;
  std::string       error;
  fz_var(doc);
  fz_var(pages);

  fz_try(ctx) {
    fz_register_document_handlers(ctx);
    doc = fz_open_document(ctx, path_utf8.c_str());
    // Export grafts pages with the pdf layer, so only unlocked PDFs are accepted
    if (!pdf_document_from_fz_document(ctx, doc)) {
      fz_throw(ctx, FZ_ERROR_GENERIC, "not a PDF document");
    }
    if (fz_needs_password(ctx, doc)) {
      fz_throw(ctx, FZ_ERROR_GENERIC, "document is password protected");
    }
    pages = fz_count_pages(ctx, doc);
  }
  fz_catch(ctx) { error = fz_caught_message(ctx); }

  if (!error.empty() || pages <= 0) {
    if (doc) {
      fz_drop_document(ctx, doc);
    }
    fz_drop_context(ctx);
    if (error.empty()) {
      error = "document has no readable pages";
    }
    throw OrganizerError(OrganizerErrorCode::SOURCE_OPEN_FAILURE,
                         "Cannot open " + path_utf8 + ": " + error);
  }

  spdlog::debug("[MuPdfDocument] Opened {} with {} page(s)", path_utf8, pages);
  return std::shared_ptr<MuPdfDocument>(
      new MuPdfDocument(ctx, doc, path, static_cast<page_index_t>(pages)));
}

auto MuPdfDocument::PageBounds(page_index_t index) const -> PageSize {
  if (index >= page_count_) {
    throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE,
                         "Page " + std::to_string(index) + " out of range in " + label_);
  }
  std::lock_guard<std::mutex> lock(mtx_);
  fz_rect                     bounds = fz_empty_rect;
  fz_page*                    page   = nullptr;
  std::string                 error;
  fz_var(page);
  fz_var(bounds);

  fz_try(ctx_) {
    page   = fz_load_page(ctx_, doc_, static_cast<int>(index));
    bounds = fz_bound_page(ctx_, page);
  }
  fz_always(ctx_) { fz_drop_page(ctx_, page); }
  fz_catch(ctx_) { error = fz_caught_message(ctx_); }

  if (!error.empty()) {
    throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE, error);
  }
  return PageSize{bounds.x1 - bounds.x0, bounds.y1 - bounds.y0};
}

auto MuPdfDocument::RenderPage(page_index_t index, const ThumbnailSize& box) const
    -> ImageBuffer {
  const auto fit = FitPageToBox(PageBounds(index), box);

  std::lock_guard<std::mutex> lock(mtx_);
  fz_page*                    page = nullptr;
  fz_pixmap*                  pix  = nullptr;
  fz_device*                  dev  = nullptr;
  std::string                 error;
  fz_var(page);
  fz_var(pix);
  fz_var(dev);

  fz_try(ctx_) {
    page                 = fz_load_page(ctx_, doc_, static_cast<int>(index));
    const fz_matrix ctm  = fz_scale(fit.scale_, fit.scale_);
    const fz_irect  bbox = fz_round_rect(fz_transform_rect(fz_bound_page(ctx_, page), ctm));
    pix = fz_new_pixmap_with_bbox(ctx_, fz_device_bgr(ctx_), bbox, nullptr, 0);
    fz_clear_pixmap_with_value(ctx_, pix, 255);
    dev = fz_new_draw_device(ctx_, fz_identity, pix);
    fz_run_page(ctx_, page, dev, ctm, nullptr);
    fz_close_device(ctx_, dev);
  }
  fz_always(ctx_) {
    fz_drop_device(ctx_, dev);
    fz_drop_page(ctx_, page);
  }
  fz_catch(ctx_) { error = fz_caught_message(ctx_); }

  std::unique_ptr<fz_pixmap, PixmapDeleter> pixmap(pix, PixmapDeleter{ctx_});
  if (!error.empty()) {
    throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE,
                         "Cannot render page " + std::to_string(index) + " of " + label_ + ": " +
                             error);
  }

  // Samples are BGR without alpha, rows may be padded
  cv::Mat raster = cv::Mat(fz_pixmap_height(ctx_, pixmap.get()), fz_pixmap_width(ctx_, pixmap.get()),
                           CV_8UC3, fz_pixmap_samples(ctx_, pixmap.get()),
                           static_cast<size_t>(fz_pixmap_stride(ctx_, pixmap.get())))
                       .clone();
  if (raster.empty()) {
    throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE,
                         "Empty raster for page " + std::to_string(index) + " of " + label_);
  }
  // Pixel rounding of the transformed box may be off by one
  if (raster.cols != fit.width_ || raster.rows != fit.height_) {
    cv::resize(raster, raster, cv::Size(fit.width_, fit.height_), 0, 0, cv::INTER_AREA);
  }
  return ImageBuffer(std::move(raster));
}

auto MuPdfDocumentOpener::Open(const file_path_t& path) -> std::shared_ptr<SourceDocument> {
  return MuPdfDocument::Open(path);
}
};  // namespace pageorg
