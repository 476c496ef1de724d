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

#include "edge_images/kernel/base/md5_hasher.h"

#include <openssl/evp.h>
#include <openssl/md5.h>

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

const int MD5Hasher::kDefaultHashSize;

MD5Hasher::~MD5Hasher() {
}

GoogleString MD5Hasher::RawHash(StringPiece content) const {
  // One-shot digest; no context is kept so the hasher stays thread-safe.
  unsigned char digest[MD5_DIGEST_LENGTH];
  unsigned int digest_size = 0;
  if (EVP_Digest(content.data(), content.size(), digest, &digest_size,
                 EVP_md5(), NULL) != 1) {
    return GoogleString();
  }
  return GoogleString(reinterpret_cast<char*>(digest), digest_size);
}

int MD5Hasher::RawHashSizeInBytes() const {
  return MD5_DIGEST_LENGTH;
}

}  // namespace edge_images
