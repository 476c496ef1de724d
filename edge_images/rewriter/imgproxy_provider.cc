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

#include "edge_images/rewriter/public/imgproxy_provider.h"

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/util/re2.h"

namespace edge_images {

namespace {

const RE2& TransformedPattern() {
  static const RE2* pattern = new RE2("(.*?)/insecure/.*?/plain(/.*)");
  return *pattern;
}

// NULL leaves gravity to imgproxy.
const char* ImgproxyGravity(TransformArgs::Gravity gravity) {
  switch (gravity) {
    case TransformArgs::kGravityAuto:   return NULL;
    case TransformArgs::kGravityCenter: return "center";
    case TransformArgs::kGravityNorth:  return "north";
    case TransformArgs::kGravitySouth:  return "south";
    case TransformArgs::kGravityEast:   return "east";
    case TransformArgs::kGravityRight:  return "east";
    case TransformArgs::kGravityWest:   return "west";
    case TransformArgs::kGravityLeft:   return "west";
  }
  return NULL;
}

}  // namespace

const char ImgproxyProvider::kEdgeRoot[] = "/insecure/";

ImgproxyProvider::ImgproxyProvider(const ProviderConfig& config)
    : EdgeProvider(config) {
}

ImgproxyProvider::~ImgproxyProvider() {
}

TransformStatus ImgproxyProvider::BuildUrl(const ImageRef& image,
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
    AddArg("fit", TransformArgs::FitName(args.fit()), &edge_args);
  }
  if (args.has_quality()) {
    AddIntArg("quality", args.quality(), &edge_args);
  }
  if (args.has_format() && args.format() != TransformArgs::kFormatAuto) {
    AddArg("format", TransformArgs::FormatName(args.format()), &edge_args);
  }
  if (args.has_gravity() && ImgproxyGravity(args.gravity()) != NULL) {
    AddArg("gravity", ImgproxyGravity(args.gravity()), &edge_args);
  }
  if (args.has_blur()) {
    AddIntArg("blur", args.blur(), &edge_args);
  }
  if (args.has_sharpen()) {
    AddIntArg("sharpen", args.sharpen(), &edge_args);
  }
  GoogleString processing = JoinArgs(&edge_args, ":", "/");
  if (processing.empty()) {
    processing = "format:auto";
  }
  *url = StrCat(StripTrailingSlash(config().service_url), kEdgeRoot,
                processing, "/plain", path);
  return kTransformOk;
}

bool ImgproxyProvider::IsTransformedUrl(StringPiece url) const {
  if (!IsConfigured()) {
    return false;
  }
  GoogleString prefix = StrCat(StripTrailingSlash(config().service_url),
                               kEdgeRoot);
  return HasPrefixString(url, prefix) &&
      RE2::FullMatch(StringPieceToRe2(url), TransformedPattern());
}

bool ImgproxyProvider::ExtractSourceUrl(StringPiece url,
                                        GoogleString* source) const {
  if (!IsTransformedUrl(url)) {
    return false;
  }
  Re2StringPiece service, path;
  if (!RE2::FullMatch(StringPieceToRe2(url), TransformedPattern(),
                      &service, &path)) {
    return false;
  }
  *source = JoinSource(StringPiece(), Re2ToStringPiece(path));
  return true;
}

}  // namespace edge_images
