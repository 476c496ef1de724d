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

#ifndef EDGE_IMAGES_KERNEL_BASE_CACHE_INTERFACE_H_
#define EDGE_IMAGES_KERNEL_BASE_CACHE_INTERFACE_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"

namespace edge_images {

// Abstract interface for a cache backend.  Values are opaque byte strings;
// expiry and validity are decided by the callers via ValidateCandidate.
class CacheInterface {
 public:
  enum KeyState {
    kAvailable = 0,     // Requested key is available for serving
    kNotFound = 1,      // Requested key needs to be written
    kOverload = 2,      // Lookup is discarded due to cache server is overloaded
    kNetworkError = 3,  // Cache lookup ended up in network error
    kTimeout = 4,       // Request timeout
  };

  class Callback {
   public:
    virtual ~Callback();
    void set_value(const GoogleString& value) { value_ = value; }
    const GoogleString& value() const { return value_; }
    GoogleString* mutable_value() { return &value_; }

    // For callback subclasses that wrap around other callbacks.  Normal
    // cache implementations should use CacheInterface::ValidateAndReportResult.
    bool DelegatedValidateCandidate(const GoogleString& key, KeyState state) {
      return ValidateCandidate(key, state);
    }

    void DelegatedDone(KeyState state) {
      Done(state);
    }

   protected:
    friend class CacheInterface;

    // Lets cache clients veto a value for semantic reasons, e.g. an
    // expired or purged record.  Returning false turns the lookup into
    // kNotFound.  Implementations may not invoke cache operations, as it
    // may be invoked with locks held.
    virtual bool ValidateCandidate(const GoogleString& key,
                                   KeyState state) { return true; }

    // Called once the cache implementation has found a match that was
    // accepted by ValidateCandidate (state == kAvailable) or has failed to
    // do so.  All cache locks are released by then.
    virtual void Done(KeyState state) = 0;

   private:
    GoogleString value_;
  };

  // Helper class for use with implementations for which IsBlocking is true.
  // It simply saves the state, value, and whether Done() has been called.
  class SynchronousCallback : public Callback {
   public:
    SynchronousCallback() { Reset(); }

    bool called() const { return called_; }
    KeyState state() const { return state_; }

    void Reset() {
      called_ = false;
      state_ = CacheInterface::kNotFound;
      set_value(GoogleString());
    }

    virtual void Done(CacheInterface::KeyState state) {
      called_ = true;
      state_ = state;
    }

   private:
    bool called_;
    CacheInterface::KeyState state_;

    DISALLOW_COPY_AND_ASSIGN(SynchronousCallback);
  };

  static const char* KeyStateName(KeyState state);

  CacheInterface() {}
  virtual ~CacheInterface();

  // Initiates a cache fetch, calling callback->ValidateCandidate()
  // and then callback->Done(state) when done.
  virtual void Get(const GoogleString& key, Callback* callback) = 0;

  // Puts a value into the cache; last write wins.
  virtual void Put(const GoogleString& key, const GoogleString& value) = 0;
  virtual void Delete(const GoogleString& key) = 0;

  // The name of this CacheInterface, used for logging and debugging.
  virtual GoogleString Name() const = 0;

  // Returns true if this cache is guaranteed to call its callbacks before
  // returning from Get.
  virtual bool IsBlocking() const = 0;

  // Rough estimation of whether the cache is available for operations.
  // Callers should skip the cache entirely while this is false.
  virtual bool IsHealthy() const = 0;

  // Stops all cache activity.  Further Put/Delete calls are dropped and
  // Get calls report kNotFound immediately.
  virtual void ShutDown() = 0;

 protected:
  // Invokes callback->ValidateCandidate() and callback->Done() as
  // appropriate.
  void ValidateAndReportResult(const GoogleString& key, KeyState state,
                               Callback* callback);

 private:
  DISALLOW_COPY_AND_ASSIGN(CacheInterface);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_CACHE_INTERFACE_H_
