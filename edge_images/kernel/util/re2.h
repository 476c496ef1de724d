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

#ifndef EDGE_IMAGES_KERNEL_UTIL_RE2_H_
#define EDGE_IMAGES_KERNEL_UTIL_RE2_H_

#include "edge_images/kernel/base/string_util.h"

#include "re2/re2.h"

using re2::RE2;

namespace edge_images {

typedef re2::StringPiece Re2StringPiece;

// Converts a StringPiece into an RE2 StringPiece.  These are the same
// basic thing but as far as C++ type-checking is concerned they may be
// incompatible.
inline re2::StringPiece StringPieceToRe2(StringPiece sp) {
  return re2::StringPiece(sp.data(), sp.size());
}

inline StringPiece Re2ToStringPiece(re2::StringPiece sp) {
  return StringPiece(sp.data(), sp.size());
}

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_UTIL_RE2_H_
