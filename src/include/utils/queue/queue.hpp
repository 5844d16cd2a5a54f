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

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace pageorg {
/**
 * @brief A thread-safe unbounded FIFO. Any thread may push, consumers either block or poll.
 */
template <typename T>
class ConcurrentBlockingQueue {
 private:
  std::queue<T>           queue_;
  mutable std::mutex      mtx_;
  std::condition_variable consumer_cv_;

 public:
  ConcurrentBlockingQueue() = default;

  void push(T new_request) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      queue_.push(std::move(new_request));
    }
    consumer_cv_.notify_all();
  }

  /**
   * @brief Block until an element is available and return it
   */
  T pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    consumer_cv_.wait(lock, [this] { return !queue_.empty(); });

    T handled_request = std::move(queue_.front());
    queue_.pop();
    return handled_request;
  }

  auto try_pop() -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T handled_request = std::move(queue_.front());
    queue_.pop();
    return handled_request;
  }

  template <typename Rep, typename Period>
  auto pop_for(const std::chrono::duration<Rep, Period>& timeout) -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!consumer_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T handled_request = std::move(queue_.front());
    queue_.pop();
    return handled_request;
  }

  auto size() const -> size_t {
    std::unique_lock<std::mutex> lock(mtx_);
    return queue_.size();
  }

  auto empty() const -> bool { return size() == 0; }
};
};  // namespace pageorg
