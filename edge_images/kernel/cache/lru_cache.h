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

#ifndef EDGE_IMAGES_KERNEL_CACHE_LRU_CACHE_H_
#define EDGE_IMAGES_KERNEL_CACHE_LRU_CACHE_H_

#include <cstddef>
#include <list>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// Simple C++ implementation of an in-memory least-recently used (LRU)
// cache.  This implementation is not thread-safe, and must be
// combined with a mutex to make it so.
//
// The purpose of this implementation is as a default implementation,
// or a local shadow for memcached.
//
// The size bound covers both keys and values.
class LRUCache : public CacheInterface {
 public:
  explicit LRUCache(size_t max_size);
  virtual ~LRUCache();

  virtual void Get(const GoogleString& key, Callback* callback);

  // Puts an object into the cache, evicting the least-recently used
  // entries until it fits.  Values larger than the whole cache are
  // dropped.
  virtual void Put(const GoogleString& key, const GoogleString& new_value);
  virtual void Delete(const GoogleString& key);

  // Deletes every key with the given prefix.
  void DeleteWithPrefixForTesting(StringPiece prefix);

  // Total size in bytes of keys and values stored.
  size_t size_bytes() const { return current_bytes_in_cache_; }

  // Maximum capacity.
  size_t max_bytes_in_cache() const { return max_bytes_in_cache_; }

  // Number of elements stored
  size_t num_elements() const { return map_.size(); }

  size_t num_evictions() const { return num_evictions_; }
  size_t num_hits() const { return num_hits_; }
  size_t num_misses() const { return num_misses_; }
  size_t num_inserts() const { return num_inserts_; }
  size_t num_identical_reinserts() const { return num_identical_reinserts_; }
  size_t num_deletes() const { return num_deletes_; }

  // Sanity check the cache data structures.
  bool SanityCheck() const;

  // Clear the entire cache.  Used primarily for testing.  Note that this
  // will not clear the stats, however it will update current_bytes_in_cache_.
  void Clear();

  // Clear the stats -- note that this will not clear the content.
  void ClearStats();

  static GoogleString FormatName() { return "LRUCache"; }
  virtual GoogleString Name() const { return FormatName(); }

  virtual bool IsBlocking() const { return true; }
  virtual bool IsHealthy() const { return is_healthy_; }
  virtual void ShutDown() { set_is_healthy(false); }

  void set_is_healthy(bool x) { is_healthy_ = x; }

 private:
  typedef std::pair<GoogleString, GoogleString> KeyValuePair;
  typedef std::list<KeyValuePair> EntryList;
  // STL guarantees lifetime of list itererators as long as the node is in
  // the list.
  typedef EntryList::iterator ListNode;
  typedef absl::flat_hash_map<GoogleString, ListNode> Map;

  static size_t EntrySize(const KeyValuePair& pair) {
    return pair.first.size() + pair.second.size();
  }

  // Makes room for bytes_needed, returning false if that can never fit.
  bool EvictIfNecessary(size_t bytes_needed);
  void RemoveNode(ListNode node);

  size_t max_bytes_in_cache_;
  size_t current_bytes_in_cache_;
  size_t num_evictions_;
  size_t num_hits_;
  size_t num_misses_;
  size_t num_inserts_;
  size_t num_identical_reinserts_;
  size_t num_deletes_;
  bool is_healthy_;
  EntryList lru_ordered_list_;  // Most recently used at the front.
  Map map_;

  DISALLOW_COPY_AND_ASSIGN(LRUCache);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_CACHE_LRU_CACHE_H_
