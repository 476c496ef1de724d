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

#include <algorithm>

#include "absl/synchronization/mutex.h"
#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/hasher.h"
#include "edge_images/kernel/base/message_handler.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/base/timer.h"
#include "edge_images/rewriter/transform_cache.pb.h"

namespace edge_images {

const char TransformCache::kKeyPrefix[] = "edge_images/";
const char TransformCache::kPurgeKeyPrefix[] = "edge_images/purge/";
const char TransformCache::kGroupPurgeKey[] = "edge_images/purge/*";

// Decodes the record and vets it before the cache reports a hit.  Purges
// are checked after the lookup completes: the backend lock is held while
// ValidateCandidate runs.
class TransformCache::Callback : public CacheInterface::Callback {
 public:
  Callback(const Timer* timer, const GoogleString& source_url)
      : timer_(timer),
        source_url_(source_url),
        called_(false),
        corrupt_(false),
        state_(CacheInterface::kNotFound) {
  }
  virtual ~Callback() {}

  bool called() const { return called_; }
  bool corrupt() const { return corrupt_; }
  CacheInterface::KeyState state() const { return state_; }
  const CachedTransform& record() const { return record_; }

 protected:
  virtual bool ValidateCandidate(const GoogleString& key,
                                 CacheInterface::KeyState state) {
    if (state != CacheInterface::kAvailable) {
      return false;
    }
    if (!record_.ParseFromString(value())) {
      corrupt_ = true;
      return false;
    }
    if (record_.source_url() != source_url_) {
      return false;  // Hash collision.
    }
    return record_.expiration_time_ms() > timer_->NowMs();
  }

  virtual void Done(CacheInterface::KeyState state) {
    called_ = true;
    state_ = state;
  }

 private:
  const Timer* timer_;
  const GoogleString& source_url_;
  bool called_;
  bool corrupt_;
  CacheInterface::KeyState state_;
  CachedTransform record_;

  DISALLOW_COPY_AND_ASSIGN(Callback);
};

TransformCache::ComputeFunction::~ComputeFunction() {
}

TransformCache::TransformCache(CacheInterface* backend, Hasher* hasher,
                               Timer* timer, MessageHandler* handler,
                               int64 ttl_ms)
    : cache_(backend),
      backend_blocking_(backend->IsBlocking()),
      hasher_(hasher),
      timer_(timer),
      handler_(handler),
      ttl_ms_(ttl_ms),
      negative_ttl_ms_(ttl_ms),
      hits_(0),
      misses_(0) {
  if (!backend_blocking_) {
    EI_LOG_WARN(handler_, "Cache %s is not blocking; transforms will not "
                "be cached.", backend->Name().c_str());
  }
}

TransformCache::~TransformCache() {
}

GoogleString TransformCache::CacheKey(const KeyParts& key) const {
  return StrCat(kKeyPrefix, hasher_->Hash(StrCat(
      key.source_url, "\n", key.canonical_args, "\n", key.context)));
}

GoogleString TransformCache::PurgeKey(StringPiece source_url) const {
  return StrCat(kPurgeKeyPrefix, hasher_->Hash(source_url));
}

bool TransformCache::IsAvailable() const {
  return backend_blocking_ && cache_.IsHealthy();
}

bool TransformCache::GetOrCompute(const KeyParts& key,
                                  ComputeFunction* compute,
                                  GoogleString* value) {
  if (!IsAvailable()) {
    return compute->Compute(value);
  }
  GoogleString cache_key = CacheKey(key);
  Callback callback(timer_, key.source_url);
  cache_.Get(cache_key, &callback);
  if (callback.called() && callback.state() == CacheInterface::kAvailable &&
      IsValid(key.source_url, callback.record().write_time_ms())) {
    {
      absl::MutexLock lock(&mutex_);
      ++hits_;
    }
    const CachedTransform& record = callback.record();
    if (record.negative()) {
      return false;
    }
    *value = record.value();
    return true;
  }
  if (callback.corrupt()) {
    EI_LOG_WARN(handler_, "Dropping unreadable cache record for %s",
                key.source_url.c_str());
  }
  return ComputeAndStore(cache_key, key, compute, value);
}

bool TransformCache::ComputeAndStore(const GoogleString& cache_key,
                                     const KeyParts& key,
                                     ComputeFunction* compute,
                                     GoogleString* value) {
  {
    absl::MutexLock lock(&mutex_);
    ++misses_;
  }
  GoogleString computed;
  bool ok = compute->Compute(&computed);

  int64 now_ms = timer_->NowMs();
  CachedTransform record;
  record.set_source_url(key.source_url);
  record.set_negative(!ok);
  if (ok) {
    record.set_value(computed);
  }
  record.set_write_time_ms(now_ms);
  record.set_expiration_time_ms(now_ms + (ok ? ttl_ms_ : negative_ttl_ms_));
  GoogleString bytes;
  if (!record.SerializeToString(&bytes)) {
    EI_LOG_WARN(handler_, "Could not serialize cache record for %s",
                key.source_url.c_str());
  } else {
    cache_.Put(cache_key, bytes);
  }
  if (ok) {
    value->swap(computed);
  }
  return ok;
}

bool TransformCache::IsValid(const GoogleString& source_url,
                             int64 write_time_ms) {
  int64 purge_ms = std::max(PurgeTimeMs(kGroupPurgeKey, ""),
                            PurgeTimeMs(PurgeKey(source_url), source_url));
  return write_time_ms > purge_ms;
}

int64 TransformCache::PurgeTimeMs(const GoogleString& purge_key,
                                  StringPiece source_url) {
  CacheInterface::SynchronousCallback callback;
  cache_.Get(purge_key, &callback);
  if (!callback.called() || callback.state() != CacheInterface::kAvailable) {
    return -1;
  }
  CachedPurge purge;
  if (!purge.ParseFromString(callback.value())) {
    EI_LOG_WARN(handler_, "Ignoring unreadable purge record %s",
                purge_key.c_str());
    return -1;
  }
  if (purge.source_url() != source_url) {
    return -1;  // Hash collision.
  }
  return purge.purge_time_ms();
}

void TransformCache::RecordPurge(const GoogleString& purge_key,
                                 StringPiece source_url) {
  if (!IsAvailable()) {
    EI_LOG_WARN(handler_, "Cache unavailable; purge of %s not recorded",
                source_url.empty() ? "all entries"
                                   : GoogleString(source_url).c_str());
    return;
  }
  // Never move a purge backwards if clocks disagree between writers.
  int64 purge_ms = std::max(timer_->NowMs(),
                            PurgeTimeMs(purge_key, source_url));
  CachedPurge purge;
  purge.set_source_url(source_url.data(), source_url.size());
  purge.set_purge_time_ms(purge_ms);
  GoogleString bytes;
  if (!purge.SerializeToString(&bytes)) {
    EI_LOG_WARN(handler_, "Could not serialize purge record %s",
                purge_key.c_str());
    return;
  }
  cache_.Put(purge_key, bytes);
}

void TransformCache::InvalidateUrl(StringPiece source_url) {
  RecordPurge(PurgeKey(source_url), source_url);
}

void TransformCache::FlushGroup() {
  RecordPurge(kGroupPurgeKey, "");
}

int64 TransformCache::hits() const {
  absl::MutexLock lock(&mutex_);
  return hits_;
}

int64 TransformCache::misses() const {
  absl::MutexLock lock(&mutex_);
  return misses_;
}

}  // namespace edge_images
