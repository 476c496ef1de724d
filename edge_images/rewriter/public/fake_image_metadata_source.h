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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_FAKE_IMAGE_METADATA_SOURCE_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_FAKE_IMAGE_METADATA_SOURCE_H_

#include <map>
#include <utility>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/image_metadata_source.h"

namespace edge_images {

// In-memory media library for tests.  URLs under the site root, and
// root-relative URLs, count as local.
class FakeImageMetadataSource : public ImageMetadataSource {
 public:
  explicit FakeImageMetadataSource(StringPiece site_root);
  virtual ~FakeImageMetadataSource();

  // Registers asset id at url with the given intrinsic size.
  void AddImage(int64 id, StringPiece url, int width, int height);

  virtual bool GetIntrinsicDimensions(int64 id, int* width,
                                      int* height) const;
  virtual bool ResolveIdentityFromUrl(StringPiece url, int64* id) const;
  virtual bool IsLocalUrl(StringPiece url) const;

  int dimension_lookups() const { return dimension_lookups_; }

 private:
  typedef std::map<int64, std::pair<int, int> > DimensionMap;
  typedef std::map<GoogleString, int64> IdentityMap;

  GoogleString site_root_;
  DimensionMap dimensions_;
  IdentityMap identities_;
  mutable int dimension_lookups_;

  DISALLOW_COPY_AND_ASSIGN(FakeImageMetadataSource);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_FAKE_IMAGE_METADATA_SOURCE_H_
