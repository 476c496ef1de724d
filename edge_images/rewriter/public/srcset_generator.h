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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_SRCSET_GENERATOR_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_SRCSET_GENERATOR_H_

#include <vector>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/transform_status.h"

namespace edge_images {

class EdgeProvider;
class ImageRef;
class RewriteOptions;
class TransformArgs;
class TransformCache;

// One srcset entry.
struct SrcsetCandidate {
  SrcsetCandidate() {}
  SrcsetCandidate(StringPiece u, StringPiece d) : url(u), descriptor(d) {}

  GoogleString url;
  GoogleString descriptor;  // "650w" or "2x".
};

struct SrcsetResult {
  SrcsetResult() : ceiling(0) {}

  void Clear() {
    candidates.clear();
    srcset.clear();
    sizes.clear();
    ceiling = 0;
  }

  std::vector<SrcsetCandidate> candidates;
  GoogleString srcset;  // Candidates joined with ", ".
  GoogleString sizes;
  int ceiling;  // Largest width offered.
};

// Derives the responsive variants of one image and renders them through
// the provider, memoized by the transform cache.
//
// Responsive images get width descriptors: a width w is dropped when 2w is
// already offered, so one candidate never serves as another's 2x variant.
// Fixed images (avatars) get a single 2x candidate and nothing else.
class SrcsetGenerator {
 public:
  // Widths below this are only offered when the image is that small.
  static const int kMinSrcsetWidth = 300;
  static const int kMaxSrcsetWidth = 2400;
  // Images narrower than this do not get the kMinSrcsetWidth candidate.
  static const int kMinWidthForSmallestCandidate = 150;
  // Applied to the ceiling width when no breakpoints are configured.
  static const double kWidthMultipliers[];
  static const int kNumWidthMultipliers;

  // Nothing is owned.  cache may be NULL, in which case every URL is
  // computed.
  SrcsetGenerator(const RewriteOptions* options, const EdgeProvider* provider,
                  TransformCache* cache);
  ~SrcsetGenerator();

  // Fills *out.  Images without intrinsic dimensions get an empty srcset
  // and kTransformOk.  Returns kInvalidDimensions for a non-positive
  // ceiling width, and passes on provider failures; *out is cleared on
  // failure.  sizes_hint replaces the generated sizes when non-empty.
  TransformStatus Generate(const ImageRef& image, const TransformArgs& base,
                           StringPiece sizes_hint, bool fixed_context,
                           SrcsetResult* out) const;

  // Candidate widths for the given ceiling, ascending.
  void CandidateWidths(int ceiling, std::vector<int>* widths) const;

  // Provider URL for image, through the cache.  context_label becomes part
  // of the cache key.
  TransformStatus BuildUrl(const ImageRef& image, const TransformArgs& args,
                           StringPiece context_label,
                           GoogleString* url) const;

 private:
  const RewriteOptions* options_;
  const EdgeProvider* provider_;
  TransformCache* cache_;
  // Provider name and settings; every cache key carries it, so entries
  // built for other settings are never served.
  GoogleString key_prefix_;

  DISALLOW_COPY_AND_ASSIGN(SrcsetGenerator);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_SRCSET_GENERATOR_H_
