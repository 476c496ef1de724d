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

#include "edge_images/rewriter/public/cloudflare_provider.h"

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/util/re2.h"

namespace edge_images {

namespace {

const RE2& TransformedPattern() {
  static const RE2* pattern = new RE2("(.*?)/cdn-cgi/image/[^/]*(/.*)");
  return *pattern;
}

// Cloudflare has no named compass gravity; it takes sides.
const char* CloudflareGravity(TransformArgs::Gravity gravity) {
  switch (gravity) {
    case TransformArgs::kGravityAuto:   return "auto";
    case TransformArgs::kGravityNorth:  return "top";
    case TransformArgs::kGravitySouth:  return "bottom";
    case TransformArgs::kGravityEast:   return "right";
    case TransformArgs::kGravityRight:  return "right";
    case TransformArgs::kGravityWest:   return "left";
    case TransformArgs::kGravityLeft:   return "left";
    case TransformArgs::kGravityCenter: return NULL;  // the default
  }
  return NULL;
}

}  // namespace

const char CloudflareProvider::kEdgeRoot[] = "/cdn-cgi/image/";
const char CloudflareProvider::kOptionSeparator[] = "%2C";

CloudflareProvider::CloudflareProvider(const ProviderConfig& config)
    : EdgeProvider(config) {
}

CloudflareProvider::~CloudflareProvider() {
}

TransformStatus CloudflareProvider::BuildUrl(const ImageRef& image,
                                             const TransformArgs& args,
                                             GoogleString* url) const {
  GoogleString domain, path;
  SplitSource(image.source_url(), &domain, &path);

  ArgVector edge_args;
  if (args.has_blur()) {
    AddIntArg("blur", args.blur(), &edge_args);
  }
  if (args.has_brightness()) {
    AddIntArg("brightness", args.brightness(), &edge_args);
  }
  if (args.has_contrast()) {
    AddIntArg("contrast", args.contrast(), &edge_args);
  }
  if (args.has_dpr()) {
    AddArg("dpr", DoubleToString(args.dpr()), &edge_args);
  }
  if (args.has_fit()) {
    AddArg("fit", TransformArgs::FitName(args.fit()), &edge_args);
  }
  // png and gif are not output formats here.
  if (args.has_format() && args.format() != TransformArgs::kFormatPng &&
      args.format() != TransformArgs::kFormatGif) {
    AddArg("format", TransformArgs::FormatName(args.format()), &edge_args);
  }
  if (args.has_gravity() && CloudflareGravity(args.gravity()) != NULL) {
    AddArg("gravity", CloudflareGravity(args.gravity()), &edge_args);
  }
  if (args.has_height()) {
    AddIntArg("height", args.height(), &edge_args);
  }
  if (args.has_quality()) {
    AddIntArg("quality", args.quality(), &edge_args);
  }
  if (args.has_sharpen()) {
    AddIntArg("sharpen", args.sharpen(), &edge_args);
  }
  if (args.has_width()) {
    AddIntArg("width", args.width(), &edge_args);
  }
  // The options segment may not be empty.
  if (edge_args.empty()) {
    AddArg("format", "auto", &edge_args);
  }
  *url = StrCat(domain, kEdgeRoot,
                JoinArgs(&edge_args, "=", kOptionSeparator), path);
  return kTransformOk;
}

bool CloudflareProvider::IsTransformedUrl(StringPiece url) const {
  return RE2::FullMatch(StringPieceToRe2(url), TransformedPattern());
}

bool CloudflareProvider::ExtractSourceUrl(StringPiece url,
                                          GoogleString* source) const {
  Re2StringPiece domain, path;
  if (!RE2::FullMatch(StringPieceToRe2(url), TransformedPattern(),
                      &domain, &path)) {
    return false;
  }
  *source = JoinSource(Re2ToStringPiece(domain), Re2ToStringPiece(path));
  return true;
}

}  // namespace edge_images
