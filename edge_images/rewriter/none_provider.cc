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

#include "edge_images/rewriter/public/none_provider.h"

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

NoneProvider::NoneProvider(const ProviderConfig& config)
    : EdgeProvider(config) {
}

NoneProvider::~NoneProvider() {
}

TransformStatus NoneProvider::BuildUrl(const ImageRef& image,
                                       const TransformArgs& args,
                                       GoogleString* url) const {
  GoogleString domain, path;
  SplitSource(image.source_url(), &domain, &path);
  *url = StrCat(domain, path);
  return kTransformOk;
}

bool NoneProvider::IsTransformedUrl(StringPiece url) const {
  return false;
}

bool NoneProvider::ExtractSourceUrl(StringPiece url,
                                    GoogleString* source) const {
  return false;
}

}  // namespace edge_images
