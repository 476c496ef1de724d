/*
 * Copyright 2024 The Edge Images Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "edge_images/kernel/cache/lru_cache.h"

#include <cstddef>

#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

LRUCache::LRUCache(size_t max_size)
    : max_bytes_in_cache_(max_size),
      current_bytes_in_cache_(0),
      is_healthy_(true) {
  ClearStats();
}

LRUCache::~LRUCache() {
  Clear();
}

void LRUCache::Get(const GoogleString& key, Callback* callback) {
  if (!is_healthy_) {
    ValidateAndReportResult(key, kNotFound, callback);
    return;
  }
  KeyState key_state = kNotFound;
  Map::iterator p = map_.find(key);
  if (p != map_.end()) {
    // Freshen the entry by moving it to the front of the list.
    ListNode cell = p->second;
    lru_ordered_list_.splice(lru_ordered_list_.begin(), lru_ordered_list_,
                             cell);
    callback->set_value(cell->second);
    key_state = kAvailable;
    ++num_hits_;
  } else {
    ++num_misses_;
  }
  ValidateAndReportResult(key, key_state, callback);
}

void LRUCache::Put(const GoogleString& key, const GoogleString& new_value) {
  if (!is_healthy_) {
    return;
  }
  Map::iterator p = map_.find(key);
  if (p != map_.end()) {
    ListNode cell = p->second;
    if (cell->second == new_value) {
      // Same value: just freshen.
      lru_ordered_list_.splice(lru_ordered_list_.begin(), lru_ordered_list_,
                               cell);
      ++num_identical_reinserts_;
      return;
    }
    RemoveNode(cell);
  }

  KeyValuePair pair(key, new_value);
  if (EvictIfNecessary(EntrySize(pair))) {
    lru_ordered_list_.push_front(pair);
    map_[key] = lru_ordered_list_.begin();
    current_bytes_in_cache_ += EntrySize(pair);
    ++num_inserts_;
  }
}

void LRUCache::Delete(const GoogleString& key) {
  if (!is_healthy_) {
    return;
  }
  Map::iterator p = map_.find(key);
  if (p != map_.end()) {
    RemoveNode(p->second);
    ++num_deletes_;
  }
}

void LRUCache::DeleteWithPrefixForTesting(StringPiece prefix) {
  ListNode node = lru_ordered_list_.begin();
  while (node != lru_ordered_list_.end()) {
    ListNode next = node;
    ++next;
    if (HasPrefixString(node->first, prefix)) {
      RemoveNode(node);
      ++num_deletes_;
    }
    node = next;
  }
}

bool LRUCache::EvictIfNecessary(size_t bytes_needed) {
  if (bytes_needed > max_bytes_in_cache_) {
    return false;
  }
  while (bytes_needed + current_bytes_in_cache_ > max_bytes_in_cache_) {
    ListNode tail = lru_ordered_list_.end();
    --tail;
    RemoveNode(tail);
    ++num_evictions_;
  }
  return true;
}

void LRUCache::RemoveNode(ListNode node) {
  current_bytes_in_cache_ -= EntrySize(*node);
  map_.erase(node->first);
  lru_ordered_list_.erase(node);
}

bool LRUCache::SanityCheck() const {
  if (map_.size() != lru_ordered_list_.size()) {
    return false;
  }
  size_t count = 0;
  size_t bytes_used = 0;
  for (EntryList::const_iterator cell = lru_ordered_list_.begin(),
           e = lru_ordered_list_.end(); cell != e; ++cell) {
    Map::const_iterator p = map_.find(cell->first);
    if (p == map_.end() || &*p->second != &*cell) {
      return false;
    }
    ++count;
    bytes_used += EntrySize(*cell);
  }
  return (count == map_.size()) &&
      (bytes_used == current_bytes_in_cache_) &&
      (current_bytes_in_cache_ <= max_bytes_in_cache_);
}

void LRUCache::Clear() {
  current_bytes_in_cache_ = 0;
  lru_ordered_list_.clear();
  map_.clear();
}

void LRUCache::ClearStats() {
  num_evictions_ = 0;
  num_hits_ = 0;
  num_misses_ = 0;
  num_inserts_ = 0;
  num_identical_reinserts_ = 0;
  num_deletes_ = 0;
}

}  // namespace edge_images
