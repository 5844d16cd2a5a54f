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

#include "concurrency/main_context.hpp"

#include <chrono>
#include <utility>

namespace pageorg {
MainContext::MainContext() : owner_(std::this_thread::get_id()) {}

void MainContext::Post(std::function<void()> fn) {
  if (!fn) {
    return;
  }
  mailbox_.push(std::move(fn));
}

auto MainContext::RunPending() -> size_t {
  size_t executed = 0;
  while (auto fn = mailbox_.try_pop()) {
    (*fn)();
    ++executed;
  }
  return executed;
}

auto MainContext::RunUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout)
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  RunPending();
  while (!done()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (slice > std::chrono::milliseconds(20)) {
      slice = std::chrono::milliseconds(20);
    }
    if (auto fn = mailbox_.pop_for(slice)) {
      (*fn)();
    }
    RunPending();
  }
  return true;
}

auto MainContext::Dispatcher() -> CallbackDispatcher {
  return [this](std::function<void()> fn) { Post(std::move(fn)); };
}
};  // namespace pageorg
