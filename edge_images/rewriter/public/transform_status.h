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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_STATUS_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_STATUS_H_

namespace edge_images {

// Outcome of a transformation.  Every status other than kTransformOk
// means the caller gets its input back unchanged.
enum TransformStatus {
  kTransformOk,
  // A provider field required to build URLs (subdomain, service URL) is
  // missing.
  kProviderMisconfigured,
  // Zero, negative or missing dimensions where they are required.
  kInvalidDimensions,
  // SVG, data: or non-local sources.  Never treated as an error.
  kUnsupportedSource,
  // The cache backend failed; the value was computed directly.
  kCacheUnavailable,
  // Nothing to do: already processed, vetoed, disabled, or no <img>.
  kTransformSkipped,
};

// Stable names for logging, e.g. "ProviderMisconfigured".
const char* TransformStatusName(TransformStatus status);

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_STATUS_H_
