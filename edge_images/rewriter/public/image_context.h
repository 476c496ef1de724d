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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_CONTEXT_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_CONTEXT_H_

#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// Where an image is rendered.  Drives default transform arguments and the
// shape of the srcset.
enum ImageContext {
  kContentContext,  // Post content, constrained to the content width.
  kBlockContext,    // Editor blocks rendered outside the content flow.
  kAvatarContext,   // Always displayed at one size.
  kSchemaContext,   // Structured-data image URLs.
  kSocialContext,   // og:image and similar.
  kOtherContext,
};

const char* ImageContextName(ImageContext context);
bool ImageContextFromName(StringPiece name, ImageContext* context);

// Fixed contexts render at one exact size and get a single 2x candidate
// instead of a width-based srcset.
inline bool IsFixedContext(ImageContext context) {
  return context == kAvatarContext;
}

// Content contexts are clamped to the content width.
inline bool IsContentContext(ImageContext context) {
  return context == kContentContext;
}

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_CONTEXT_H_
