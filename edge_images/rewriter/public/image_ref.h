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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_REF_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_REF_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// A source image: its canonical pre-transform URL and, when known, its
// intrinsic pixel dimensions.  Immutable.
class ImageRef {
 public:
  // Dimensions unknown.
  explicit ImageRef(StringPiece source_url);
  // Non-positive dimensions are treated as unknown.
  ImageRef(StringPiece source_url, int intrinsic_width, int intrinsic_height);
  ~ImageRef();

  const GoogleString& source_url() const { return source_url_; }

  // Both dimensions known and positive.
  bool has_intrinsic_dimensions() const {
    return intrinsic_width_ > 0 && intrinsic_height_ > 0;
  }
  int intrinsic_width() const { return intrinsic_width_; }
  int intrinsic_height() const { return intrinsic_height_; }

  // Derived from a .svg or .svgz extension on the URL path; the query and
  // fragment are ignored.
  bool is_svg() const { return is_svg_; }

  static bool IsSvgUrl(StringPiece url);

 private:
  GoogleString source_url_;
  int intrinsic_width_;
  int intrinsic_height_;
  bool is_svg_;

  // Copy and assign OK.
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_REF_H_
