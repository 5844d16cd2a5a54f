/*
 * @file        pageorg/src/include/concurrency/thread_pool.hpp
 * @brief       A thread pool for parallel tasks
 * @author      ChatGPT
 * @date        2025-03-19
 * @license     MIT
 *
 * @copyright   Copyright (c) 2025 ChatGPT
 */

// Copyright (c) 2025 ChatGPT
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace pageorg {
/**
 * @brief Fixed-size worker pool. Queued tasks still run during destruction, the destructor
 * returns once every worker has drained the queue and joined.
 */
class ThreadPool {
 public:
  ThreadPool(size_t thread_count, std::string name = "pool");
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void Submit(std::function<void()> task);

  /**
   * @brief Submit a task and get a future for its completion. Exceptions thrown by the task are
   * stored in the future instead of reaching the worker loop.
   */
  template <typename F>
  auto Enqueue(F&& fn) -> std::future<void> {
    auto packaged = std::make_shared<std::packaged_task<void()>>(std::forward<F>(fn));
    auto future   = packaged->get_future();
    Submit([packaged]() { (*packaged)(); });
    return future;
  }

  auto ThreadCount() const -> size_t { return workers.size(); }

 private:
  std::queue<std::function<void()>> tasks;
  std::mutex                        mtx;
  std::condition_variable           condition;
  std::vector<std::thread>          workers;
  std::string                       name_;

  bool                              stop;

  void                              WorkerThread();
};
};  // namespace pageorg
