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

#include "edge_images/rewriter/public/transform_args_resolver.h"

#include <algorithm>
#include <cmath>

#include "edge_images/rewriter/public/rewrite_options.h"

namespace edge_images {

const int TransformArgsResolver::kSocialWidth;
const int TransformArgsResolver::kSocialHeight;
const int TransformArgsResolver::kDefaultAvatarSize;
const int TransformArgsResolver::kSmallSourceSharpen;

namespace {

// Shrinks width and height by the same ratio so that width <= limit.
void ConstrainWidth(int limit, TransformArgs* args) {
  if (limit <= 0 || args->width() <= limit) {
    return;
  }
  if (args->has_height()) {
    args->set_height(TransformArgsResolver::ScaleDimension(
        args->height(), limit, args->width()));
  }
  args->set_width(limit);
}

}  // namespace

TransformArgsResolver::TransformArgsResolver(const RewriteOptions* options)
    : options_(options) {
}

TransformArgsResolver::~TransformArgsResolver() {
}

int TransformArgsResolver::ScaleDimension(int value, int numerator,
                                          int denominator) {
  return static_cast<int>(std::floor(
      static_cast<double>(value) * numerator / denominator + 0.5));
}

TransformStatus TransformArgsResolver::Resolve(
    ImageContext context, const TransformArgs& caller_args,
    int intrinsic_width, int intrinsic_height, TransformArgs* out) const {
  return Resolve(context, caller_args, intrinsic_width, intrinsic_height,
                 false, out);
}

TransformStatus TransformArgsResolver::Resolve(
    ImageContext context, const TransformArgs& caller_args,
    int intrinsic_width, int intrinsic_height, bool full_width,
    TransformArgs* out) const {
  TransformArgs args(options_->default_args());
  args.set_dpr(1.0);

  // Context defaults.  Fixed contexts render at a known box size.
  bool fixed_target = false;
  switch (context) {
    case kSchemaContext:
    case kSocialContext:
      args.set_width(kSocialWidth);
      args.set_height(kSocialHeight);
      args.set_fit(TransformArgs::kFitCover);
      fixed_target = true;
      break;
    case kAvatarContext:
      args.set_width(kDefaultAvatarSize);
      args.set_height(kDefaultAvatarSize);
      args.set_fit(TransformArgs::kFitCover);
      args.set_sharpen(1);
      fixed_target = true;
      break;
    case kContentContext:
    case kBlockContext:
    case kOtherContext:
      break;
  }

  // Caller dimensions replace the context box as a whole.
  if (caller_args.has_width() || caller_args.has_height()) {
    args.clear_width();
    args.clear_height();
  }
  args.MergeOverridesFrom(caller_args);
  if (context == kAvatarContext) {
    if (args.has_width() && !args.has_height()) {
      args.set_height(args.width());
    } else if (args.has_height() && !args.has_width()) {
      args.set_width(args.height());
    }
  }
  args.Clamp();

  bool intrinsic_known = intrinsic_width > 0 && intrinsic_height > 0;
  if (intrinsic_known) {
    if (!args.has_width() && !args.has_height()) {
      args.set_width(intrinsic_width);
      args.set_height(intrinsic_height);
    } else if (!args.has_height()) {
      args.set_height(
          ScaleDimension(args.width(), intrinsic_height, intrinsic_width));
    } else if (!args.has_width()) {
      args.set_width(
          ScaleDimension(args.height(), intrinsic_width, intrinsic_height));
    }
  }
  if (!args.has_width() || args.width() <= 0) {
    return kInvalidDimensions;
  }

  if (intrinsic_known && args.has_height() &&
      (intrinsic_width < args.width() || intrinsic_height < args.height())) {
    TransformArgs::Fit fit = args.fit();
    if (fixed_target || fit == TransformArgs::kFitPad ||
        fit == TransformArgs::kFitContain) {
      // Keep the box; let the edge pad around the small source.
      if (fit != TransformArgs::kFitContain) {
        args.set_fit(TransformArgs::kFitPad);
      }
      args.set_sharpen(std::max(args.has_sharpen() ? args.sharpen() : 0,
                                static_cast<int>(kSmallSourceSharpen)));
    } else {
      // Never upscale: shrink the box until it fits the source.
      double ratio = std::min(
          static_cast<double>(intrinsic_width) / args.width(),
          static_cast<double>(intrinsic_height) / args.height());
      args.set_width(std::max(1, static_cast<int>(
          std::floor(args.width() * ratio + 0.5))));
      args.set_height(std::max(1, static_cast<int>(
          std::floor(args.height() * ratio + 0.5))));
    }
  } else if (intrinsic_known && !args.has_height() &&
             intrinsic_width < args.width()) {
    args.set_width(intrinsic_width);
  }

  if (!fixed_target) {
    ConstrainWidth(options_->max_width(), &args);
    if (IsContentContext(context) && !full_width) {
      ConstrainWidth(options_->content_width(), &args);
    }
  }

  args.Clamp();
  if (!args.has_width()) {
    return kInvalidDimensions;
  }
  if (!args.has_dpr()) {
    args.set_dpr(1.0);
  }
  *out = args;
  return kTransformOk;
}

}  // namespace edge_images
