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

#include "edge_images/rewriter/public/transform_cache.h"

#include <cstring>

#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/md5_hasher.h"
#include "edge_images/kernel/base/mock_message_handler.h"
#include "edge_images/kernel/base/mock_timer.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/timer.h"
#include "edge_images/kernel/cache/lru_cache.h"

namespace edge_images {

namespace {

const int64 kTtlMs = 10 * Timer::kMinuteMs;
const int64 kNegativeTtlMs = Timer::kMinuteMs;
const char kUrl[] = "https://site.test/a.jpg";
const char kOtherUrl[] = "https://site.test/b.jpg";

// Counts its invocations and returns a value derived from the count.
class CountingCompute : public TransformCache::ComputeFunction {
 public:
  explicit CountingCompute(bool succeed) : succeed_(succeed), calls_(0) {}
  virtual ~CountingCompute() {}

  virtual bool Compute(GoogleString* value) {
    ++calls_;
    *value = StrCat("https://edge.test/", calls_);
    return succeed_;
  }

  int calls() const { return calls_; }

 private:
  bool succeed_;
  int calls_;

  DISALLOW_COPY_AND_ASSIGN(CountingCompute);
};

class TransformCacheTest : public testing::Test {
 protected:
  TransformCacheTest()
      : lru_cache_(100000),
        timer_(MockTimer::kApr_5_2010_ms),
        cache_(&lru_cache_, &hasher_, &timer_, &handler_, kTtlMs),
        key_(kUrl, "width=300", "content"),
        compute_(true) {
    cache_.set_negative_ttl_ms(kNegativeTtlMs);
  }

  GoogleString Lookup(const TransformCache::KeyParts& key,
                      CountingCompute* compute) {
    GoogleString value;
    EXPECT_TRUE(cache_.GetOrCompute(key, compute, &value));
    return value;
  }

  LRUCache lru_cache_;
  MD5Hasher hasher_;
  MockTimer timer_;
  MockMessageHandler handler_;
  TransformCache cache_;
  TransformCache::KeyParts key_;
  CountingCompute compute_;

 private:
  DISALLOW_COPY_AND_ASSIGN(TransformCacheTest);
};

TEST_F(TransformCacheTest, ComputesOnce) {
  EXPECT_EQ("https://edge.test/1", Lookup(key_, &compute_));
  EXPECT_EQ("https://edge.test/1", Lookup(key_, &compute_));
  EXPECT_EQ(1, compute_.calls());
  EXPECT_EQ(1, cache_.misses());
  EXPECT_EQ(1, cache_.hits());
  EXPECT_EQ(static_cast<size_t>(1), lru_cache_.num_elements());
}

TEST_F(TransformCacheTest, KeyPartsAllCount) {
  Lookup(key_, &compute_);
  Lookup(TransformCache::KeyParts(kUrl, "width=600", "content"), &compute_);
  Lookup(TransformCache::KeyParts(kUrl, "width=300", "avatar"), &compute_);
  Lookup(TransformCache::KeyParts(kOtherUrl, "width=300", "content"),
         &compute_);
  EXPECT_EQ(4, compute_.calls());
}

TEST_F(TransformCacheTest, KeyShape) {
  GoogleString key = cache_.CacheKey(key_);
  EXPECT_TRUE(HasPrefixString(key, "edge_images/"));
  EXPECT_EQ(strlen("edge_images/") + MD5Hasher::kDefaultHashSize,
            key.size());
  EXPECT_EQ(key, cache_.CacheKey(key_));
}

TEST_F(TransformCacheTest, NegativeResultsAreCached) {
  CountingCompute failing(false);
  GoogleString value("unchanged");
  EXPECT_FALSE(cache_.GetOrCompute(key_, &failing, &value));
  EXPECT_FALSE(cache_.GetOrCompute(key_, &failing, &value));
  EXPECT_EQ(1, failing.calls());
  EXPECT_EQ("unchanged", value);

  // Negative entries live for the shorter TTL.
  timer_.AdvanceMs(kNegativeTtlMs + 1);
  EXPECT_FALSE(cache_.GetOrCompute(key_, &failing, &value));
  EXPECT_EQ(2, failing.calls());
}

TEST_F(TransformCacheTest, ExpiredEntriesAreRecomputed) {
  Lookup(key_, &compute_);
  timer_.AdvanceMs(kTtlMs - 1);
  Lookup(key_, &compute_);
  EXPECT_EQ(1, compute_.calls());
  timer_.AdvanceMs(1);
  EXPECT_EQ("https://edge.test/2", Lookup(key_, &compute_));
  EXPECT_EQ(2, compute_.calls());
}

TEST_F(TransformCacheTest, InvalidateUrl) {
  TransformCache::KeyParts other(kOtherUrl, "width=300", "content");
  Lookup(key_, &compute_);
  Lookup(other, &compute_);
  timer_.AdvanceMs(1);
  cache_.InvalidateUrl(kUrl);
  timer_.AdvanceMs(1);

  EXPECT_EQ("https://edge.test/3", Lookup(key_, &compute_));
  EXPECT_EQ("https://edge.test/2", Lookup(other, &compute_));
  EXPECT_EQ("https://edge.test/3", Lookup(key_, &compute_));
  EXPECT_EQ(3, compute_.calls());
}

TEST_F(TransformCacheTest, FlushGroup) {
  TransformCache::KeyParts other(kOtherUrl, "width=300", "content");
  Lookup(key_, &compute_);
  Lookup(other, &compute_);
  timer_.AdvanceMs(1);
  cache_.FlushGroup();
  timer_.AdvanceMs(1);
  Lookup(key_, &compute_);
  Lookup(other, &compute_);
  EXPECT_EQ(4, compute_.calls());
  Lookup(other, &compute_);
  EXPECT_EQ(4, compute_.calls());
}

TEST_F(TransformCacheTest, PurgesAreSharedThroughTheBackend) {
  // A second cache over the same backend, as another engine would build.
  TransformCache peer(&lru_cache_, &hasher_, &timer_, &handler_, kTtlMs);
  TransformCache::KeyParts other(kOtherUrl, "width=300", "content");
  Lookup(key_, &compute_);
  Lookup(other, &compute_);
  timer_.AdvanceMs(1);
  peer.InvalidateUrl(kUrl);
  timer_.AdvanceMs(1);

  EXPECT_EQ("https://edge.test/3", Lookup(key_, &compute_));
  EXPECT_EQ("https://edge.test/2", Lookup(other, &compute_));
  EXPECT_EQ(3, compute_.calls());

  timer_.AdvanceMs(1);
  peer.FlushGroup();
  timer_.AdvanceMs(1);
  Lookup(key_, &compute_);
  Lookup(other, &compute_);
  EXPECT_EQ(5, compute_.calls());
  EXPECT_EQ(0, handler_.MessagesOfType(kWarning));
}

TEST_F(TransformCacheTest, PurgeCoversSameMillisecondWrites) {
  Lookup(key_, &compute_);
  cache_.InvalidateUrl(kUrl);
  Lookup(key_, &compute_);
  EXPECT_EQ(2, compute_.calls());
}

TEST_F(TransformCacheTest, PurgeRecordsLiveInTheBackend) {
  cache_.InvalidateUrl(kUrl);
  cache_.FlushGroup();
  CacheInterface::SynchronousCallback url_purge;
  lru_cache_.Get(cache_.PurgeKey(kUrl), &url_purge);
  EXPECT_EQ(CacheInterface::kAvailable, url_purge.state());
  CacheInterface::SynchronousCallback group_purge;
  lru_cache_.Get(TransformCache::kGroupPurgeKey, &group_purge);
  EXPECT_EQ(CacheInterface::kAvailable, group_purge.state());
  EXPECT_NE(cache_.PurgeKey(kUrl), cache_.PurgeKey(kOtherUrl));
}

TEST_F(TransformCacheTest, UnreadablePurgeRecordIsIgnored) {
  Lookup(key_, &compute_);
  timer_.AdvanceMs(1);
  lru_cache_.Put(cache_.PurgeKey(kUrl), "\xff\xff not a protobuf");
  Lookup(key_, &compute_);
  EXPECT_EQ(1, compute_.calls());
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));

  // A later purge replaces it.
  cache_.InvalidateUrl(kUrl);
  timer_.AdvanceMs(1);
  Lookup(key_, &compute_);
  EXPECT_EQ(2, compute_.calls());
}

TEST_F(TransformCacheTest, UnhealthyBackendIsBypassed) {
  lru_cache_.set_is_healthy(false);
  EXPECT_FALSE(cache_.IsAvailable());
  Lookup(key_, &compute_);
  Lookup(key_, &compute_);
  EXPECT_EQ(2, compute_.calls());
  EXPECT_EQ(0, cache_.hits());

  lru_cache_.set_is_healthy(true);
  EXPECT_TRUE(cache_.IsAvailable());
  Lookup(key_, &compute_);
  Lookup(key_, &compute_);
  EXPECT_EQ(3, compute_.calls());
}

TEST_F(TransformCacheTest, UnreadableRecordIsReplaced) {
  lru_cache_.Put(cache_.CacheKey(key_), "\xff\xff not a protobuf");
  EXPECT_EQ("https://edge.test/1", Lookup(key_, &compute_));
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));
  EXPECT_EQ("https://edge.test/1", Lookup(key_, &compute_));
  EXPECT_EQ(1, compute_.calls());
}

}  // namespace

}  // namespace edge_images
