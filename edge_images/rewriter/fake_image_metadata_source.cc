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

#include "edge_images/rewriter/public/fake_image_metadata_source.h"

namespace edge_images {

FakeImageMetadataSource::FakeImageMetadataSource(StringPiece site_root)
    : site_root_(site_root.data(), site_root.size()),
      dimension_lookups_(0) {
}

FakeImageMetadataSource::~FakeImageMetadataSource() {
}

void FakeImageMetadataSource::AddImage(int64 id, StringPiece url, int width,
                                       int height) {
  dimensions_[id] = std::make_pair(width, height);
  identities_[GoogleString(url.data(), url.size())] = id;
}

bool FakeImageMetadataSource::GetIntrinsicDimensions(int64 id, int* width,
                                                     int* height) const {
  ++dimension_lookups_;
  DimensionMap::const_iterator p = dimensions_.find(id);
  if (p == dimensions_.end()) {
    return false;
  }
  *width = p->second.first;
  *height = p->second.second;
  return true;
}

bool FakeImageMetadataSource::ResolveIdentityFromUrl(StringPiece url,
                                                     int64* id) const {
  IdentityMap::const_iterator p =
      identities_.find(GoogleString(url.data(), url.size()));
  if (p == identities_.end()) {
    return false;
  }
  *id = p->second;
  return true;
}

bool FakeImageMetadataSource::IsLocalUrl(StringPiece url) const {
  return HasPrefixString(url, site_root_) ||
      (HasPrefixString(url, "/") && !HasPrefixString(url, "//"));
}

}  // namespace edge_images
