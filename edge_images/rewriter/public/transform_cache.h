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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_CACHE_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_CACHE_H_

#include "absl/synchronization/mutex.h"
#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/cache/threadsafe_cache.h"

namespace edge_images {

class CacheInterface;
class Hasher;
class MessageHandler;
class Timer;

// Memoizes provider URL computation.  Records are CachedTransform
// protobufs stored under a hash of (source URL, canonical arguments,
// context), with the expiry inside the record.  Negative results are
// cached too, for a shorter time.
//
// Invalidation is by purge record rather than by deleting keys, since the
// hashed keys of one asset cannot be enumerated.  Purge records are
// CachedPurge protobufs stored in the backend itself, one per purged URL
// plus one for the group, so every TransformCache sharing the backend
// honors them.  A purge record lost to eviction leaves the records it
// covered to expire by TTL.
class TransformCache {
 public:
  static const char kKeyPrefix[];
  static const char kPurgeKeyPrefix[];
  static const char kGroupPurgeKey[];

  struct KeyParts {
    KeyParts() {}
    KeyParts(StringPiece url, StringPiece args, StringPiece label)
        : source_url(url), canonical_args(args), context(label) {}

    GoogleString source_url;
    GoogleString canonical_args;
    GoogleString context;
  };

  // The work being memoized.
  class ComputeFunction {
   public:
    ComputeFunction() {}
    virtual ~ComputeFunction();

    // Returns false for a negative result; *value is then ignored.
    virtual bool Compute(GoogleString* value) = 0;

   private:
    DISALLOW_COPY_AND_ASSIGN(ComputeFunction);
  };

  // backend must be blocking; a non-blocking or unhealthy backend is
  // bypassed.  None of the arguments are owned.
  TransformCache(CacheInterface* backend, Hasher* hasher, Timer* timer,
                 MessageHandler* handler, int64 ttl_ms);
  ~TransformCache();

  void set_negative_ttl_ms(int64 x) { negative_ttl_ms_ = x; }

  // Returns the cached result for key, or computes, stores and returns
  // it.  Returns true and fills *value for a positive result; returns
  // false for a negative one.
  bool GetOrCompute(const KeyParts& key, ComputeFunction* compute,
                    GoogleString* value);

  // Entries for source_url written up to now are rejected from now on.
  void InvalidateUrl(StringPiece source_url);

  // Rejects every entry written up to now.
  void FlushGroup();

  // False when lookups go straight to the computation.
  bool IsAvailable() const;

  GoogleString CacheKey(const KeyParts& key) const;

  // Backend key of the purge record for source_url.
  GoogleString PurgeKey(StringPiece source_url) const;

  // Lookups answered from the cache, and lookups that had to compute.
  int64 hits() const ABSL_LOCKS_EXCLUDED(mutex_);
  int64 misses() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  class Callback;
  friend class Callback;

  // Accepts a record for source_url written at write_time_ms?  Reads the
  // purge records, so must not be called from inside a cache callback.
  bool IsValid(const GoogleString& source_url, int64 write_time_ms);

  // Time stored in the purge record under purge_key, or -1 when there is
  // no readable record for source_url.
  int64 PurgeTimeMs(const GoogleString& purge_key, StringPiece source_url);

  // Stores a purge record covering everything written up to now.
  void RecordPurge(const GoogleString& purge_key, StringPiece source_url);

  // Computes and stores the result under cache_key.
  bool ComputeAndStore(const GoogleString& cache_key, const KeyParts& key,
                       ComputeFunction* compute, GoogleString* value);

  ThreadsafeCache cache_;
  bool backend_blocking_;
  Hasher* hasher_;
  Timer* timer_;
  MessageHandler* handler_;
  int64 ttl_ms_;
  int64 negative_ttl_ms_;

  mutable absl::Mutex mutex_;
  int64 hits_ ABSL_GUARDED_BY(mutex_);
  int64 misses_ ABSL_GUARDED_BY(mutex_);

  DISALLOW_COPY_AND_ASSIGN(TransformCache);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_CACHE_H_
