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

#ifndef EDGE_IMAGES_KERNEL_CACHE_THREADSAFE_CACHE_H_
#define EDGE_IMAGES_KERNEL_CACHE_THREADSAFE_CACHE_H_

#include "absl/synchronization/mutex.h"
#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// Composes a cache with a mutex to form a threadsafe cache.  Note
// that cache callbacks will be run in a thread that is dependent
// on the cache implementation.  This wrapper class just guarantees
// the thread safety of the cache itself, not the callbacks.
//
// WARNING: Because the mutex is held across the wrapped Get, the
// callback's ValidateCandidate must not call back into this cache.
class ThreadsafeCache : public CacheInterface {
 public:
  // Does not take ownership of cache.
  explicit ThreadsafeCache(CacheInterface* cache)
      : cache_(cache) {
  }
  virtual ~ThreadsafeCache();

  virtual void Get(const GoogleString& key, Callback* callback);
  virtual void Put(const GoogleString& key, const GoogleString& value)
      ABSL_LOCKS_EXCLUDED(mutex_);
  virtual void Delete(const GoogleString& key) ABSL_LOCKS_EXCLUDED(mutex_);
  virtual bool IsBlocking() const { return cache_->IsBlocking(); }
  virtual bool IsHealthy() const ABSL_LOCKS_EXCLUDED(mutex_);
  virtual void ShutDown() ABSL_LOCKS_EXCLUDED(mutex_);

  CacheInterface* Backend() { return cache_; }

  static GoogleString FormatName(StringPiece cache);
  virtual GoogleString Name() const { return FormatName(cache_->Name()); }

 private:
  CacheInterface* cache_;
  mutable absl::Mutex mutex_;

  DISALLOW_COPY_AND_ASSIGN(ThreadsafeCache);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_CACHE_THREADSAFE_CACHE_H_
