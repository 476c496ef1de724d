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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_ARGS_RESOLVER_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_ARGS_RESOLVER_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/rewriter/public/image_context.h"
#include "edge_images/rewriter/public/transform_args.h"
#include "edge_images/rewriter/public/transform_status.h"

namespace edge_images {

class RewriteOptions;

// Turns what a caller asked for into the complete set of arguments for
// one image, layering, in order: global defaults, context defaults, caller
// overrides, then the size rules (no upscaling, max width, content width).
class TransformArgsResolver {
 public:
  // Schema and social images.
  static const int kSocialWidth = 1200;
  static const int kSocialHeight = 675;
  // Avatars are square.
  static const int kDefaultAvatarSize = 96;
  // Sharpening applied when a small source has to fill a larger box.
  static const int kSmallSourceSharpen = 2;

  // options must outlive the resolver.
  explicit TransformArgsResolver(const RewriteOptions* options);
  ~TransformArgsResolver();

  // Non-positive intrinsic dimensions mean unknown.  On success every knob
  // of *out but height is set; height is only left unset when neither the
  // caller nor the intrinsic size determines it.  Returns
  // kInvalidDimensions, leaving *out alone, when no width can be derived.
  TransformStatus Resolve(ImageContext context,
                          const TransformArgs& caller_args,
                          int intrinsic_width, int intrinsic_height,
                          TransformArgs* out) const;

  // As above.  full_width exempts content images from the content-width
  // constraint (alignfull and similar layouts).
  TransformStatus Resolve(ImageContext context,
                          const TransformArgs& caller_args,
                          int intrinsic_width, int intrinsic_height,
                          bool full_width, TransformArgs* out) const;

  // round(value * numerator / denominator); denominator must be positive.
  static int ScaleDimension(int value, int numerator, int denominator);

 private:
  const RewriteOptions* options_;

  DISALLOW_COPY_AND_ASSIGN(TransformArgsResolver);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_ARGS_RESOLVER_H_
