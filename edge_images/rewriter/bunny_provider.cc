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

#include "edge_images/rewriter/public/bunny_provider.h"

#include <algorithm>

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/util/re2.h"

namespace edge_images {

namespace {

const RE2& TransformedPattern() {
  static const RE2* pattern =
      new RE2("https?://[^/]+\\.b-cdn\\.net/[^/]*=[^/]*(/.*)");
  return *pattern;
}

const char* BunnyAspectRatio(TransformArgs::Fit fit) {
  switch (fit) {
    case TransformArgs::kFitCover:     return "force";
    case TransformArgs::kFitCrop:      return "force";
    case TransformArgs::kFitContain:   return "contain";
    case TransformArgs::kFitScaleDown: return "contain";
    case TransformArgs::kFitPad:       return "stretch";
  }
  return "force";
}

const char* BunnyGravity(TransformArgs::Gravity gravity) {
  switch (gravity) {
    case TransformArgs::kGravityAuto:   return "center";
    case TransformArgs::kGravityCenter: return "center";
    case TransformArgs::kGravityNorth:  return "top";
    case TransformArgs::kGravitySouth:  return "bottom";
    case TransformArgs::kGravityEast:   return "right";
    case TransformArgs::kGravityRight:  return "right";
    case TransformArgs::kGravityWest:   return "left";
    case TransformArgs::kGravityLeft:   return "left";
  }
  return "center";
}

int ClampTo(int value, int low, int high) {
  return std::max(low, std::min(high, value));
}

}  // namespace

const char BunnyProvider::kEdgeRoot[] = ".b-cdn.net/";

BunnyProvider::BunnyProvider(const ProviderConfig& config)
    : EdgeProvider(config) {
}

BunnyProvider::~BunnyProvider() {
}

TransformStatus BunnyProvider::BuildUrl(const ImageRef& image,
                                        const TransformArgs& args,
                                        GoogleString* url) const {
  if (!IsConfigured()) {
    return kProviderMisconfigured;
  }
  GoogleString domain, path;
  SplitSource(image.source_url(), &domain, &path);

  ArgVector edge_args;
  if (args.has_width()) {
    AddIntArg("width", args.width(), &edge_args);
  }
  if (args.has_height()) {
    AddIntArg("height", args.height(), &edge_args);
  }
  if (args.has_fit()) {
    AddArg("aspect_ratio", BunnyAspectRatio(args.fit()), &edge_args);
  }
  if (args.has_quality()) {
    AddIntArg("quality", args.quality(), &edge_args);
  }
  if (args.has_format()) {
    AddArg("format", TransformArgs::FormatName(args.format()), &edge_args);
  }
  if (args.has_gravity()) {
    AddArg("gravity", BunnyGravity(args.gravity()), &edge_args);
  }
  if (args.has_blur()) {
    AddIntArg("blur", ClampTo(args.blur(), 0, 100), &edge_args);
  }
  if (args.has_sharpen()) {
    AddIntArg("sharpen", ClampTo(args.sharpen(), 0, 100), &edge_args);
  }
  if (args.has_brightness()) {
    AddIntArg("brightness", ClampTo(args.brightness(), -100, 100),
              &edge_args);
  }
  if (args.has_contrast()) {
    AddIntArg("contrast", ClampTo(args.contrast(), -100, 100), &edge_args);
  }
  if (edge_args.empty()) {
    AddArg("format", "auto", &edge_args);
  }
  *url = StrCat("https://", config().subdomain, kEdgeRoot,
                JoinArgs(&edge_args, "=", ","), path);
  return kTransformOk;
}

bool BunnyProvider::IsTransformedUrl(StringPiece url) const {
  return RE2::FullMatch(StringPieceToRe2(url), TransformedPattern());
}

bool BunnyProvider::ExtractSourceUrl(StringPiece url,
                                     GoogleString* source) const {
  Re2StringPiece path;
  if (!RE2::FullMatch(StringPieceToRe2(url), TransformedPattern(), &path)) {
    return false;
  }
  *source = JoinSource(StringPiece(), Re2ToStringPiece(path));
  return true;
}

}  // namespace edge_images
