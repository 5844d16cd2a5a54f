#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <opencv2/core.hpp>
#include <set>
#include <string>

#include "document/source_document.hpp"
#include "image/image_buffer.hpp"
#include "renderer/render_backend.hpp"
#include "type/error.hpp"
#include "type/type.hpp"

namespace pageorg {
// In-memory document with uniform page boxes
class FakeDocument final : public SourceDocument {
 public:
  FakeDocument(std::string label, page_index_t pages, PageSize size = {612.0f, 792.0f})
      : label_(std::move(label)), path_("/fake/" + label_ + ".pdf"), pages_(pages), size_(size) {}

  auto PageCount() const -> page_index_t override { return pages_; }
  auto PageBounds(page_index_t) const -> PageSize override { return size_; }
  auto Label() const -> const std::string& override { return label_; }
  auto Path() const -> const file_path_t& override { return path_; }

 private:
  std::string  label_;
  file_path_t  path_;
  page_index_t pages_;
  PageSize     size_;
};

inline auto MakeDocument(const std::string& label, page_index_t pages)
    -> std::shared_ptr<SourceDocument> {
  return std::make_shared<FakeDocument>(label, pages);
}

/**
 * @brief Counts invocations and the peak number of renders running at once. While blocked,
 * every render parks until Release().
 */
class InstrumentedBackend final : public RenderBackend {
 public:
  auto Render(const PageHandle& page, const ThumbnailSize& target) -> ImageBuffer override {
    const int running = active_.fetch_add(1) + 1;
    int       peak    = peak_.load();
    while (peak < running && !peak_.compare_exchange_weak(peak, running)) {
    }
    calls_.fetch_add(1);
    {
      std::unique_lock<std::mutex> lock(mtx_);
      ++started_;
      started_cv_.notify_all();
      gate_cv_.wait(lock, [this] { return !blocked_; });
    }
    active_.fetch_sub(1);

    if (failing_pages_.contains(page.page_index_)) {
      throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE,
                           "corrupt page " + std::to_string(page.page_index_));
    }
    const auto fit = FitPageToBox(page.document_->PageBounds(page.page_index_), target);
    return ImageBuffer(cv::Mat(fit.height_, fit.width_, CV_8UC3, cv::Scalar(255, 255, 255)));
  }

  void Block() {
    std::lock_guard<std::mutex> lock(mtx_);
    blocked_ = true;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      blocked_ = false;
    }
    gate_cv_.notify_all();
  }

  auto WaitForStarted(int count, std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mtx_);
    return started_cv_.wait_for(lock, timeout, [this, count] { return started_ >= count; });
  }

  auto Started() -> int {
    std::lock_guard<std::mutex> lock(mtx_);
    return started_;
  }

  // Set before any render is scheduled
  void FailPage(page_index_t index) { failing_pages_.insert(index); }

  auto Calls() const -> int { return calls_.load(); }
  auto Peak() const -> int { return peak_.load(); }

 private:
  std::atomic<int>        calls_{0};
  std::atomic<int>        active_{0};
  std::atomic<int>        peak_{0};

  std::mutex              mtx_;
  std::condition_variable gate_cv_;
  std::condition_variable started_cv_;
  bool                    blocked_ = false;
  int                     started_ = 0;

  std::set<page_index_t>  failing_pages_;
};

// Every render fails
class FailingBackend final : public RenderBackend {
 public:
  auto Render(const PageHandle&, const ThumbnailSize&) -> ImageBuffer override {
    calls_.fetch_add(1);
    throw OrganizerError(OrganizerErrorCode::RENDER_FAILURE, "backend unavailable");
  }

  auto Calls() const -> int { return calls_.load(); }

 private:
  std::atomic<int> calls_{0};
};
}  // namespace pageorg
