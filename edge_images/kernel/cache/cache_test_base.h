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

// Shared infrastructure for testing cache implementations

#ifndef EDGE_IMAGES_KERNEL_CACHE_CACHE_TEST_BASE_H_
#define EDGE_IMAGES_KERNEL_CACHE_CACHE_TEST_BASE_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

class CacheTestBase : public testing::Test {
 public:
  // Helper class for calling Get on cache implementations that are blocking
  // in nature (e.g. the in-memory LRU).  Also tests the
  // CacheInterface::SynchronousCallback class in the process.
  class Callback : public CacheInterface::SynchronousCallback {
   public:
    Callback() { Reset(); }
    virtual ~Callback() {}
    Callback* Reset() {
      SynchronousCallback::Reset();
      validate_called_ = false;
      invalid_value_ = NULL;
      invalid_key_ = NULL;
      return this;
    }

    virtual bool ValidateCandidate(const GoogleString& key,
                                   CacheInterface::KeyState state) {
      validate_called_ = true;
      if ((invalid_value_ != NULL) && (value() == invalid_value_)) {
        return false;
      }
      if ((invalid_key_ != NULL) && (key == invalid_key_)) {
        return false;
      }
      return true;
    }

    virtual void Done(CacheInterface::KeyState state) {
      SynchronousCallback::Done(state);
      EXPECT_TRUE(validate_called_);
    }

    void set_invalid_value(const char* v) { invalid_value_ = v; }
    void set_invalid_key(const char* k) { invalid_key_ = k; }

    bool validate_called_;

   private:
    const char* invalid_value_;
    const char* invalid_key_;

    DISALLOW_COPY_AND_ASSIGN(Callback);
  };

 protected:
  CacheTestBase() : invalid_value_(NULL), invalid_key_(NULL) {}

  virtual CacheInterface* Cache() = 0;
  virtual void PostOpCleanup() {}

  // Performs a cache Get, waits for callback completion, and checks the
  // result is as expected.
  void CheckGet(const GoogleString& key, const GoogleString& expected_value) {
    CheckGet(Cache(), key, expected_value);
  }

  void CheckGet(CacheInterface* cache, const GoogleString& key,
                const GoogleString& expected_value) {
    Callback callback;
    InitiateGet(cache, key, &callback);
    ASSERT_TRUE(callback.called());
    EXPECT_EQ(expected_value, callback.value());
    EXPECT_EQ(CacheInterface::kAvailable, callback.state());
    PostOpCleanup();
  }

  void CheckPut(const GoogleString& key, const GoogleString& value) {
    CheckPut(Cache(), key, value);
  }

  void CheckPut(CacheInterface* cache, const GoogleString& key,
                const GoogleString& value) {
    cache->Put(key, value);
    PostOpCleanup();
  }

  void CheckDelete(const GoogleString& key) {
    Cache()->Delete(key);
    PostOpCleanup();
  }

  // Performs a Get and verifies that the key is not found.
  void CheckNotFound(const char* key) {
    CheckNotFound(Cache(), key);
  }

  void CheckNotFound(CacheInterface* cache, const char* key) {
    Callback callback;
    InitiateGet(cache, key, &callback);
    ASSERT_TRUE(callback.called());
    EXPECT_EQ(CacheInterface::kNotFound, callback.state());
    PostOpCleanup();
  }

  // Populates the cache with keys in pattern n0 n1 n2 n3...
  // and values in pattern v0 v1 v2 v3...
  void PopulateCache(int num) {
    for (int i = 0; i < num; ++i) {
      CheckPut(StrCat("n", IntegerToString(i)),
               StrCat("v", IntegerToString(i)));
    }
  }

  void set_invalid_value(const char* v) { invalid_value_ = v; }
  void set_invalid_key(const char* k) { invalid_key_ = k; }

 private:
  void InitiateGet(CacheInterface* cache, const GoogleString& key,
                   Callback* callback) {
    callback->set_invalid_value(invalid_value_);
    callback->set_invalid_key(invalid_key_);
    cache->Get(key, callback);
  }

  const char* invalid_value_;
  const char* invalid_key_;

  DISALLOW_COPY_AND_ASSIGN(CacheTestBase);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_CACHE_CACHE_TEST_BASE_H_
