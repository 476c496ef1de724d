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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_METADATA_SOURCE_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_METADATA_SOURCE_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// Lookups into the media library that owns the source images.  All
// methods may be called concurrently from several threads.
class ImageMetadataSource {
 public:
  ImageMetadataSource() {}
  virtual ~ImageMetadataSource();

  // Intrinsic pixel size of asset id.  Returns false if unknown.
  virtual bool GetIntrinsicDimensions(int64 id, int* width,
                                      int* height) const = 0;

  // Maps an image URL back to its asset id.  Returns false if the URL is
  // not a known asset.
  virtual bool ResolveIdentityFromUrl(StringPiece url, int64* id) const = 0;

  // Is url served from this site, and so eligible for transformation?
  virtual bool IsLocalUrl(StringPiece url) const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(ImageMetadataSource);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_METADATA_SOURCE_H_
