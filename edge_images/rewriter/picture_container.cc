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

#include "edge_images/rewriter/public/picture_container.h"

#include <algorithm>

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/html/html_tag.h"
#include "edge_images/rewriter/public/rewrite_options.h"

namespace edge_images {

const char PictureContainer::kAvatarClass[] = "avatar-picture";

PictureContainer::PictureContainer(const RewriteOptions* options)
    : options_(options) {
}

PictureContainer::~PictureContainer() {
}

GoogleString PictureContainer::ClassList(StringPiece extra_classes,
                                         bool avatar) const {
  StringPieceVector names;
  SplitStringPieceToVector(options_->container_class(), " \t\n\r\f",
                           &names, true);
  SplitStringPieceToVector(extra_classes, " \t\n\r\f", &names, true);
  if (avatar) {
    names.push_back(kAvatarClass);
  }
  StringVector unique;
  for (int i = 0, n = names.size(); i < n; ++i) {
    GoogleString name(names[i].data(), names[i].size());
    if (!name.empty() &&
        std::find(unique.begin(), unique.end(), name) == unique.end()) {
      unique.push_back(name);
    }
  }
  return JoinCollection(unique, " ");
}

GoogleString PictureContainer::Style(int width, int height) const {
  int max_width = std::min(width, options_->max_width());
  return StrCat("--aspect-ratio: ", IntegerToString(width), "/",
                IntegerToString(height), "; --max-width: ",
                IntegerToString(max_width), "px;");
}

bool PictureContainer::Wrap(StringPiece img_html, StringPiece anchor_open,
                            StringPiece anchor_close, int width, int height,
                            StringPiece extra_classes, bool avatar,
                            GoogleString* out) const {
  if (width <= 0 || height <= 0) {
    return false;
  }
  HtmlTag picture;
  picture.set_name("picture");
  picture.SetAttribute("class", ClassList(extra_classes, avatar));
  picture.SetAttribute("style", Style(width, height));

  *out = picture.ToString();
  if (!anchor_open.empty()) {
    StrAppend(out, anchor_open, img_html, anchor_close);
  } else {
    StrAppend(out, img_html);
  }
  StrAppend(out, "</picture>");
  return true;
}

}  // namespace edge_images
