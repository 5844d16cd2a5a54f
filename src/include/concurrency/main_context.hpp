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
#include <cstddef>
#include <functional>
#include <thread>

#include "type/type.hpp"
#include "utils/queue/queue.hpp"

namespace pageorg {
/**
 * @brief Mailbox of the coordinating context.
 *
 * Worker threads post closures, the owning thread runs them. Everything that mutates the page
 * collection, the selection or the pending render registry runs through here, so those
 * structures are only ever touched by one thread.
 */
class MainContext {
 public:
  MainContext();

  MainContext(const MainContext&)            = delete;
  MainContext& operator=(const MainContext&) = delete;

  void Post(std::function<void()> fn);

  /**
   * @brief Run every closure queued at the time of the call and those they post in turn.
   *
   * @return number of closures executed
   */
  auto RunPending() -> size_t;

  /**
   * @brief Keep running closures until the predicate holds or the timeout expires.
   *
   * @return true if the predicate was satisfied
   */
  auto RunUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout) -> bool;

  /**
   * @brief Dispatcher handing closures to this context, for components taking a
   * CallbackDispatcher.
   */
  auto Dispatcher() -> CallbackDispatcher;

  auto IsOwnerThread() const -> bool { return std::this_thread::get_id() == owner_; }

  auto QueuedCount() const -> size_t { return mailbox_.size(); }

 private:
  ConcurrentBlockingQueue<std::function<void()>> mailbox_;
  std::thread::id                                owner_;
};
};  // namespace pageorg
