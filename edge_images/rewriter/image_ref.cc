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

#include "edge_images/rewriter/public/image_ref.h"

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

ImageRef::ImageRef(StringPiece source_url)
    : source_url_(source_url.data(), source_url.size()),
      intrinsic_width_(0),
      intrinsic_height_(0),
      is_svg_(IsSvgUrl(source_url)) {
}

ImageRef::ImageRef(StringPiece source_url, int intrinsic_width,
                   int intrinsic_height)
    : source_url_(source_url.data(), source_url.size()),
      intrinsic_width_(intrinsic_width > 0 ? intrinsic_width : 0),
      intrinsic_height_(intrinsic_height > 0 ? intrinsic_height : 0),
      is_svg_(IsSvgUrl(source_url)) {
}

ImageRef::~ImageRef() {
}

bool ImageRef::IsSvgUrl(StringPiece url) {
  StringPiece::size_type end = url.find_first_of("?#");
  if (end != StringPiece::npos) {
    url = url.substr(0, end);
  }
  return StringCaseEndsWith(url, ".svg") || StringCaseEndsWith(url, ".svgz");
}

}  // namespace edge_images
