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

#ifndef EDGE_IMAGES_KERNEL_BASE_HASHER_H_
#define EDGE_IMAGES_KERNEL_BASE_HASHER_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// Abstract hash over strings, used to build fixed-size cache keys.
class Hasher {
 public:
  // Hash() output is truncated to max_chars characters.
  explicit Hasher(int max_chars);
  virtual ~Hasher();

  // Computes a web64-encoded hash of a single string, truncated to
  // HashSizeInChars().
  GoogleString Hash(StringPiece content) const;

  // Number of characters returned by Hash().
  int HashSizeInChars() const;

  // The first eight bytes of the raw hash, big-endian.
  uint64 HashToUint64(StringPiece content) const;

  // Binary hash of the content.
  virtual GoogleString RawHash(StringPiece content) const = 0;
  virtual int RawHashSizeInBytes() const = 0;

 private:
  int max_chars_;

  DISALLOW_COPY_AND_ASSIGN(Hasher);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_HASHER_H_
