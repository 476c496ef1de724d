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

#include "edge_images/rewriter/public/imgix_provider.h"

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/http/google_url.h"

namespace edge_images {

namespace {

const char* ImgixFit(TransformArgs::Fit fit) {
  switch (fit) {
    case TransformArgs::kFitCover:     return "crop";
    case TransformArgs::kFitContain:   return "fit";
    case TransformArgs::kFitScaleDown: return "max";
    case TransformArgs::kFitCrop:      return "crop";
    case TransformArgs::kFitPad:       return "fill";
  }
  return "crop";
}

// NULL means leave cropping to imgix.
const char* ImgixCrop(TransformArgs::Gravity gravity) {
  switch (gravity) {
    case TransformArgs::kGravityAuto:   return NULL;
    case TransformArgs::kGravityNorth:  return "top";
    case TransformArgs::kGravitySouth:  return "bottom";
    case TransformArgs::kGravityEast:   return "right";
    case TransformArgs::kGravityRight:  return "right";
    case TransformArgs::kGravityWest:   return "left";
    case TransformArgs::kGravityLeft:   return "left";
    case TransformArgs::kGravityCenter: return "center";
  }
  return "center";
}

}  // namespace

const char ImgixProvider::kEdgeRoot[] = ".imgix.net";

ImgixProvider::ImgixProvider(const ProviderConfig& config)
    : EdgeProvider(config) {
}

ImgixProvider::~ImgixProvider() {
}

GoogleString ImgixProvider::EdgeHost() const {
  return StrCat(config().subdomain, kEdgeRoot);
}

TransformStatus ImgixProvider::BuildUrl(const ImageRef& image,
                                        const TransformArgs& args,
                                        GoogleString* url) const {
  if (!IsConfigured()) {
    return kProviderMisconfigured;
  }
  GoogleString domain, path;
  SplitSource(image.source_url(), &domain, &path);

  ArgVector edge_args;
  if (args.has_width()) {
    AddIntArg("w", args.width(), &edge_args);
  }
  if (args.has_height()) {
    AddIntArg("h", args.height(), &edge_args);
  }
  if (args.has_fit()) {
    AddArg("fit", ImgixFit(args.fit()), &edge_args);
  }
  if (args.has_quality()) {
    AddIntArg("q", args.quality(), &edge_args);
  }
  if (args.has_format() && args.format() != TransformArgs::kFormatAuto) {
    AddArg("fm", TransformArgs::FormatName(args.format()), &edge_args);
  } else {
    AddArg("auto", "format,compress", &edge_args);
  }
  if (args.has_gravity() && ImgixCrop(args.gravity()) != NULL) {
    AddArg("crop", ImgixCrop(args.gravity()), &edge_args);
  }
  if (args.has_blur()) {
    AddIntArg("blur", args.blur(), &edge_args);
  }
  if (args.has_sharpen()) {
    AddIntArg("sharp", args.sharpen(), &edge_args);
  }
  AddArg("cs", "srgb", &edge_args);
  AddArg("dpr", DoubleToString(args.dpr()), &edge_args);

  *url = StrCat("https://", EdgeHost(), path, "?",
                JoinArgs(&edge_args, "=", "&"));
  return kTransformOk;
}

bool ImgixProvider::IsTransformedUrl(StringPiece url) const {
  if (!IsConfigured()) {
    return false;
  }
  GoogleUrl gurl(url);
  return gurl.IsWebValid() && gurl.Host() == EdgeHost();
}

bool ImgixProvider::ExtractSourceUrl(StringPiece url,
                                     GoogleString* source) const {
  if (!IsTransformedUrl(url)) {
    return false;
  }
  GoogleUrl gurl(url);
  // imgix maps its host onto the origin; the path is shared.
  *source = JoinSource(StringPiece(), gurl.PathSansQuery());
  return true;
}

}  // namespace edge_images
