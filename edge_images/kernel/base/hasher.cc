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

#include "edge_images/kernel/base/hasher.h"

#include <algorithm>

#include "absl/strings/escaping.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

Hasher::Hasher(int max_chars) : max_chars_(std::max(0, max_chars)) {
}

Hasher::~Hasher() {
}

GoogleString Hasher::Hash(StringPiece content) const {
  GoogleString raw_hash = RawHash(content);
  GoogleString out;
  absl::WebSafeBase64Escape(raw_hash, &out);

  // Truncate to how many characters are actually requested. We use
  // HashSizeInChars() here for consistency of rounding.
  out.resize(HashSizeInChars());
  return out;
}

int Hasher::HashSizeInChars() const {
  // Base64 expands by 4/3; round down.
  return std::min(max_chars_, RawHashSizeInBytes() * 4 / 3);
}

uint64 Hasher::HashToUint64(StringPiece content) const {
  GoogleString raw_hash = RawHash(content);
  uint64 result = 0;
  for (int i = 0, n = std::min<int>(8, raw_hash.size()); i < n; ++i) {
    result <<= 8;
    result |= static_cast<unsigned char>(raw_hash[i]);
  }
  return result;
}

}  // namespace edge_images
