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

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pageorg {
template <typename K>
concept Hashable = std::copy_constructible<K> && std::equality_comparable<K> && requires(K key) {
  { std::hash<K>{}(key) } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Least-recently-used container bounded by both an entry count and a total cost.
 *
 * Not synchronized, callers serialize access. The most recently inserted or accessed entry is
 * never evicted by its own insertion: an entry whose cost alone exceeds the cost budget is kept
 * and everything else is evicted instead.
 */
template <Hashable K, typename V>
class LRUCache {
  struct Record {
    K      key_;
    V      value_;
    size_t cost_;
  };
  using ListIterator = typename std::list<Record>::iterator;

 private:
  std::unordered_map<K, ListIterator> cache_map_;
  // Front is the most recently used record
  std::list<Record>                   cache_list_;
  size_t                              count_limit_;
  size_t                              cost_limit_;
  size_t                              total_cost_  = 0;

  uint64_t                            evict_count_ = 0;

  auto                                OverBudget() const -> bool {
    return cache_list_.size() > count_limit_ || total_cost_ > cost_limit_;
  }

 public:
  static constexpr size_t default_capacity_ = 256;

  explicit LRUCache() : count_limit_(default_capacity_), cost_limit_(std::numeric_limits<size_t>::max()) {}
  explicit LRUCache(size_t count_limit,
                    size_t cost_limit = std::numeric_limits<size_t>::max())
      : count_limit_(count_limit), cost_limit_(cost_limit) {}

  auto Contains(const K& key) const -> bool { return cache_map_.contains(key); }

  // Lookup without touching recency
  auto PeekElement(const K& key) const -> std::optional<V> {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return std::nullopt;
    }
    return it->second->value_;
  }

  auto AccessElement(const K& key) -> std::optional<V> {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return std::nullopt;
    }
    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
    return it->second->value_;
  }

  /**
   * @brief Insert or replace the value of key and mark it most recently used.
   *
   * @return values evicted to bring the container back under both budgets
   */
  auto RecordAccess(const K& key, V val, size_t cost = 1) -> std::vector<V> {
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
      total_cost_                  -= it->second->cost_;
      it->second->value_            = std::move(val);
      it->second->cost_             = cost;
      total_cost_                  += cost;
    } else {
      cache_list_.push_front(Record{key, std::move(val), cost});
      cache_map_[key]  = cache_list_.begin();
      total_cost_     += cost;
    }

    std::vector<V> evicted;
    while (OverBudget() && cache_list_.size() > 1) {
      auto evicted_val = Evict();
      if (!evicted_val.has_value()) {
        break;
      }
      evicted.push_back(std::move(evicted_val.value()));
    }
    return evicted;
  }

  void RemoveRecord(const K& key) {
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      total_cost_ -= it->second->cost_;
      cache_list_.erase(it->second);
      cache_map_.erase(it);
    }
  }

  auto Evict() -> std::optional<V> {
    if (cache_list_.empty()) {
      return std::nullopt;
    }
    auto last = std::prev(cache_list_.end());
    cache_map_.erase(last->key_);
    total_cost_ -= last->cost_;
    V evicted    = std::move(last->value_);
    cache_list_.pop_back();
    ++evict_count_;
    return evicted;
  }

  void Resize(size_t count_limit, size_t cost_limit) {
    count_limit_ = count_limit;
    cost_limit_  = cost_limit;
    while (OverBudget() && !cache_list_.empty()) {
      Evict();
    }
  }

  void Flush() {
    cache_map_.clear();
    cache_list_.clear();
    total_cost_ = 0;
  }

  auto Size() const -> size_t { return cache_list_.size(); }
  auto TotalCost() const -> size_t { return total_cost_; }
  auto CountLimit() const -> size_t { return count_limit_; }
  auto CostLimit() const -> size_t { return cost_limit_; }
  auto EvictCount() const -> uint64_t { return evict_count_; }
};
};  // namespace pageorg
