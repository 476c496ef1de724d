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

#include "edge_images/kernel/cache/threadsafe_cache.h"

#include "absl/synchronization/mutex.h"
#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

namespace {

// Holds the cache mutex until the wrapped cache reports a result, then
// releases it before running the caller's Done.
class ThreadsafeCallback : public CacheInterface::Callback {
 public:
  ThreadsafeCallback(absl::Mutex* mutex, CacheInterface::Callback* callback)
      : mutex_(mutex),
        callback_(callback) {
  }

  virtual ~ThreadsafeCallback() {}

  virtual bool ValidateCandidate(const GoogleString& key,
                                 CacheInterface::KeyState state) {
    callback_->set_value(value());
    return callback_->DelegatedValidateCandidate(key, state);
  }

  virtual void Done(CacheInterface::KeyState state)
      ABSL_NO_THREAD_SAFETY_ANALYSIS {
    mutex_->Unlock();
    callback_->DelegatedDone(state);
    delete this;
  }

 private:
  absl::Mutex* mutex_;
  CacheInterface::Callback* callback_;

  DISALLOW_COPY_AND_ASSIGN(ThreadsafeCallback);
};

}  // namespace

ThreadsafeCache::~ThreadsafeCache() {
}

void ThreadsafeCache::Get(const GoogleString& key, Callback* callback)
    ABSL_NO_THREAD_SAFETY_ANALYSIS {
  mutex_.Lock();
  cache_->Get(key, new ThreadsafeCallback(&mutex_, callback));
}

void ThreadsafeCache::Put(const GoogleString& key, const GoogleString& value) {
  absl::MutexLock lock(&mutex_);
  cache_->Put(key, value);
}

void ThreadsafeCache::Delete(const GoogleString& key) {
  absl::MutexLock lock(&mutex_);
  cache_->Delete(key);
}

bool ThreadsafeCache::IsHealthy() const {
  absl::MutexLock lock(&mutex_);
  return cache_->IsHealthy();
}

void ThreadsafeCache::ShutDown() {
  absl::MutexLock lock(&mutex_);
  cache_->ShutDown();
}

GoogleString ThreadsafeCache::FormatName(StringPiece cache) {
  return StrCat("ThreadsafeCache(", cache, ")");
}

}  // namespace edge_images
