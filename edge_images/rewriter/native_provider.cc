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

#include "edge_images/rewriter/public/native_provider.h"

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

const char NativeProvider::kTransformParam[] = "edge_images=true";

NativeProvider::NativeProvider(const ProviderConfig& config)
    : EdgeProvider(config) {
}

NativeProvider::~NativeProvider() {
}

TransformStatus NativeProvider::BuildUrl(const ImageRef& image,
                                         const TransformArgs& args,
                                         GoogleString* url) const {
  GoogleString domain, path;
  SplitSource(image.source_url(), &domain, &path);

  ArgVector edge_args;
  if (args.has_height()) {
    AddIntArg("height", args.height(), &edge_args);
  }
  if (args.has_width()) {
    AddIntArg("width", args.width(), &edge_args);
  }
  GoogleString query(kTransformParam);
  if (!edge_args.empty()) {
    StrAppend(&query, "&", JoinArgs(&edge_args, "=", "&"));
  }
  *url = StrCat(domain, path, "?", query);
  return kTransformOk;
}

bool NativeProvider::IsTransformedUrl(StringPiece url) const {
  StringPiece::size_type q = url.find('?');
  if (q == StringPiece::npos) {
    return false;
  }
  StringPiece query = url.substr(q + 1);
  return HasPrefixString(query, kTransformParam) ||
      query.find(StrCat("&", kTransformParam)) != StringPiece::npos;
}

bool NativeProvider::ExtractSourceUrl(StringPiece url,
                                      GoogleString* source) const {
  if (!IsTransformedUrl(url)) {
    return false;
  }
  *source = GoogleString(url.substr(0, url.find('?')));
  return true;
}

}  // namespace edge_images
