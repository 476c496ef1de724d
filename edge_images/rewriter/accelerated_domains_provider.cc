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

#include "edge_images/rewriter/public/accelerated_domains_provider.h"

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/util/re2.h"

namespace edge_images {

namespace {

const RE2& TransformedPattern() {
  static const RE2* pattern = new RE2("(.*?)/acd-cgi/img/v1(/[^?#]+).*");
  return *pattern;
}

}  // namespace

const char AcceleratedDomainsProvider::kEdgeRoot[] = "/acd-cgi/img/v1";

AcceleratedDomainsProvider::AcceleratedDomainsProvider(
    const ProviderConfig& config)
    : EdgeProvider(config) {
}

AcceleratedDomainsProvider::~AcceleratedDomainsProvider() {
}

TransformStatus AcceleratedDomainsProvider::BuildUrl(
    const ImageRef& image, const TransformArgs& args,
    GoogleString* url) const {
  GoogleString domain, path;
  SplitSource(image.source_url(), &domain, &path);

  // Never nest the edge root.
  Re2StringPiece prefix, original_path;
  if (RE2::FullMatch(StringPieceToRe2(path), TransformedPattern(),
                     &prefix, &original_path)) {
    path = GoogleString(Re2ToStringPiece(original_path));
  }

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
  if (args.has_format()) {
    AddArg("f", TransformArgs::FormatName(args.format()), &edge_args);
  }
  if (args.has_quality()) {
    AddIntArg("q", args.quality(), &edge_args);
  }
  if (args.has_dpr()) {
    AddArg("dpr", DoubleToString(args.dpr()), &edge_args);
  }
  if (args.has_gravity()) {
    AddArg("gravity", TransformArgs::GravityName(args.gravity()),
           &edge_args);
  }
  if (args.has_sharpen()) {
    AddIntArg("sharpen", args.sharpen(), &edge_args);
  }
  if (args.has_blur()) {
    AddIntArg("blur", args.blur(), &edge_args);
  }
  if (edge_args.empty()) {
    AddArg("f", "auto", &edge_args);
  }
  *url = StrCat(domain, kEdgeRoot, path, "?",
                JoinArgs(&edge_args, "=", "&"));
  return kTransformOk;
}

bool AcceleratedDomainsProvider::IsTransformedUrl(StringPiece url) const {
  return RE2::FullMatch(StringPieceToRe2(url), TransformedPattern());
}

bool AcceleratedDomainsProvider::ExtractSourceUrl(
    StringPiece url, GoogleString* source) const {
  Re2StringPiece domain, path;
  if (!RE2::FullMatch(StringPieceToRe2(url), TransformedPattern(),
                      &domain, &path)) {
    return false;
  }
  *source = JoinSource(Re2ToStringPiece(domain), Re2ToStringPiece(path));
  return true;
}

}  // namespace edge_images
