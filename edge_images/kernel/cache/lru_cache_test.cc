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

// Unit-test the lru cache

#include "edge_images/kernel/cache/lru_cache.h"

#include <cstddef>

#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/cache/cache_test_base.h"

namespace {
const size_t kMaxSize = 100;
}

namespace edge_images {

class LRUCacheTest : public CacheTestBase {
 protected:
  LRUCacheTest()
      : cache_(kMaxSize) {
  }

  virtual CacheInterface* Cache() { return &cache_; }
  virtual void PostOpCleanup() { EXPECT_TRUE(cache_.SanityCheck()); }

  LRUCache cache_;

 private:
  DISALLOW_COPY_AND_ASSIGN(LRUCacheTest);
};

// Simple flow of putting in an item, getting it, deleting it.
TEST_F(LRUCacheTest, PutGetDelete) {
  EXPECT_EQ(static_cast<size_t>(0), cache_.size_bytes());
  EXPECT_EQ(static_cast<size_t>(0), cache_.num_elements());
  CheckPut("Name", "Value");
  CheckGet("Name", "Value");
  EXPECT_EQ(static_cast<size_t>(9), cache_.size_bytes());  // "Name" + "Value"
  EXPECT_EQ(static_cast<size_t>(1), cache_.num_elements());
  CheckNotFound("Another Name");

  CheckPut("Name", "NewValue");
  CheckGet("Name", "NewValue");
  EXPECT_EQ(static_cast<size_t>(12),
            cache_.size_bytes());  // "Name" + "NewValue"
  EXPECT_EQ(static_cast<size_t>(1), cache_.num_elements());

  CheckDelete("Name");
  CheckNotFound("Name");
  EXPECT_EQ(static_cast<size_t>(0), cache_.size_bytes());
  EXPECT_EQ(static_cast<size_t>(0), cache_.num_elements());
  EXPECT_EQ(static_cast<size_t>(1), cache_.num_deletes());
}

TEST_F(LRUCacheTest, DeleteWithPrefix) {
  CheckPut("N1", "Value1");
  CheckPut("N2", "Value2");
  CheckPut("M3", "Value3");
  CheckPut("M4", "Value4");

  // 4*(strlen("N1") + strlen("Value1")) = 4*(2 + 6) = 32
  EXPECT_EQ(static_cast<size_t>(32), cache_.size_bytes());
  EXPECT_EQ(static_cast<size_t>(4), cache_.num_elements());

  cache_.DeleteWithPrefixForTesting("N");
  EXPECT_EQ(static_cast<size_t>(16), cache_.size_bytes());
  EXPECT_EQ(static_cast<size_t>(2), cache_.num_elements());
  CheckNotFound("N1");
  CheckNotFound("N2");
  CheckGet("M3", "Value3");
  CheckGet("M4", "Value4");
}

// The cache does not account for STL overhead; it just counts key/value
// size.  Exploit that to understand when objects fall off the end.
TEST_F(LRUCacheTest, LeastRecentlyUsed) {
  const int key_plus_value_size = 10;  // strlen("name7") + strlen("valu7")
  const size_t num_elements = kMaxSize / key_plus_value_size;
  for (int i = 0; i < 10; ++i) {
    CheckPut(StrCat("name", IntegerToString(i)),
             StrCat("valu", IntegerToString(i)));
  }
  EXPECT_EQ(kMaxSize, cache_.size_bytes());
  EXPECT_EQ(num_elements, cache_.num_elements());

  for (int i = 0; i < 10; ++i) {
    CheckGet(StrCat("name", IntegerToString(i)),
             StrCat("valu", IntegerToString(i)));
  }

  // Inserting a new 10-byte entry loses name0.  Get-ing name1 makes it the
  // most recently used.
  CheckPut("nameA", "valuA");
  CheckGet("nameA", "valuA");
  CheckNotFound("name0");
  CheckGet("name1", "valu1");

  // nameB evicts name2 but keeps name1.
  CheckPut("nameB", "valuB");
  CheckGet("nameB", "valuB");
  CheckGet("name1", "valu1");
  CheckNotFound("name2");

  // Something 1 byte too big costs two entries: name3 and name4.
  CheckPut("nameC", "valueC");
  CheckGet("nameC", "valueC");
  CheckNotFound("name3");
  CheckNotFound("name4");
  CheckGet("name5", "valu5");
  EXPECT_EQ(static_cast<size_t>(4), cache_.num_evictions());
}

TEST_F(LRUCacheTest, IdenticalReinsert) {
  CheckPut("key", "value");
  CheckPut("key", "value");
  EXPECT_EQ(static_cast<size_t>(1), cache_.num_inserts());
  EXPECT_EQ(static_cast<size_t>(1), cache_.num_identical_reinserts());
}

TEST_F(LRUCacheTest, TooBigToFit) {
  GoogleString big(kMaxSize, 'x');
  CheckPut("big", big);
  CheckNotFound("big");
  EXPECT_EQ(static_cast<size_t>(0), cache_.num_elements());
}

TEST_F(LRUCacheTest, InvalidValueRejected) {
  CheckPut("nameA", "valueA");
  set_invalid_value("valueA");
  CheckNotFound("nameA");
}

TEST_F(LRUCacheTest, UnhealthyCacheDropsEverything) {
  CheckPut("nameA", "valueA");
  cache_.set_is_healthy(false);
  EXPECT_FALSE(cache_.IsHealthy());
  CheckNotFound("nameA");
  CheckPut("nameB", "valueB");
  cache_.set_is_healthy(true);
  CheckGet("nameA", "valueA");
  CheckNotFound("nameB");
}

}  // namespace edge_images
