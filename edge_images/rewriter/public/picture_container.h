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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_PICTURE_CONTAINER_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_PICTURE_CONTAINER_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

class RewriteOptions;

// Builds the <picture> element a rewritten image is wrapped in.  The
// container pins the aspect ratio and the largest render width through CSS
// custom properties:
//
//   <picture class="edge-images-container extra"
//            style="--aspect-ratio: 1600/900; --max-width: 650px;">
//     <a href="...">  <img ...>  </a>
//   </picture>
//
// The anchor, when there is one, sits inside the container around the
// image, and nothing else does.
class PictureContainer {
 public:
  static const char kAvatarClass[];

  // options must outlive the container builder.
  explicit PictureContainer(const RewriteOptions* options);
  ~PictureContainer();

  // Wraps img_html (and the anchor, if anchor_open is non-empty) in a
  // container for an image of width x height.  extra_classes is a
  // space-separated list appended to the configured container class.
  // Returns false, leaving *out alone, for non-positive dimensions.
  bool Wrap(StringPiece img_html, StringPiece anchor_open,
            StringPiece anchor_close, int width, int height,
            StringPiece extra_classes, bool avatar, GoogleString* out) const;

  // The container's class attribute: the base class followed by the extra
  // classes, duplicates removed, first occurrence kept.
  GoogleString ClassList(StringPiece extra_classes, bool avatar) const;

  // The container's style attribute.
  GoogleString Style(int width, int height) const;

 private:
  const RewriteOptions* options_;

  DISALLOW_COPY_AND_ASSIGN(PictureContainer);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_PICTURE_CONTAINER_H_
