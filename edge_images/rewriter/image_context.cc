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

#include "edge_images/rewriter/public/image_context.h"

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

namespace {

struct ContextName {
  ImageContext context;
  const char* name;
};

const ContextName kContextNames[] = {
  { kContentContext, "content" },
  { kBlockContext, "block" },
  { kAvatarContext, "avatar" },
  { kSchemaContext, "schema" },
  { kSocialContext, "social" },
  { kOtherContext, "other" },
};

}  // namespace

const char* ImageContextName(ImageContext context) {
  for (int i = 0, n = arraysize(kContextNames); i < n; ++i) {
    if (kContextNames[i].context == context) {
      return kContextNames[i].name;
    }
  }
  return "other";
}

bool ImageContextFromName(StringPiece name, ImageContext* context) {
  for (int i = 0, n = arraysize(kContextNames); i < n; ++i) {
    if (StringCaseEqual(name, kContextNames[i].name)) {
      *context = kContextNames[i].context;
      return true;
    }
  }
  return false;
}

}  // namespace edge_images
