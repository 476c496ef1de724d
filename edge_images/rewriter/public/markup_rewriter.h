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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_MARKUP_REWRITER_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_MARKUP_REWRITER_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/html/html_tag.h"
#include "edge_images/rewriter/public/image_context.h"
#include "edge_images/rewriter/public/picture_container.h"
#include "edge_images/rewriter/public/transform_args.h"
#include "edge_images/rewriter/public/transform_args_resolver.h"
#include "edge_images/rewriter/public/transform_status.h"

namespace edge_images {

class EdgeProvider;
class FeatureGate;
class ImageMetadataSource;
class MessageHandler;
class RewriteOptions;
class SrcsetGenerator;

// What the caller knows about the image beyond the markup itself.
struct RewriteRequest {
  RewriteRequest() : image_id(0), full_width(false) {}

  // Overrides for the resolved transform arguments.  Transform attributes
  // on the tag itself take precedence over these.
  TransformArgs args;
  // Replaces the generated sizes attribute when non-empty.
  GoogleString sizes;
  // Extra classes for the picture container, space separated.
  GoogleString container_class;
  // Media library id of the image; 0 if unknown.
  int64 image_id;
  // Exempts content images from the content-width constraint.
  bool full_width;
};

struct RewriteResult {
  RewriteResult() : transformed(false), status(kTransformSkipped) {}

  // The whole fragment, rewritten or not.
  GoogleString html;
  // The synthesized <picture> element; empty when the image was not
  // wrapped.
  GoogleString container_html;
  bool transformed;
  TransformStatus status;
};

// Lets an integration (a page builder, say) keep its images away from the
// rewriter.
class TagVetoPredicate {
 public:
  TagVetoPredicate() {}
  virtual ~TagVetoPredicate();

  // Returns true to leave img untouched.  html is the whole fragment.
  virtual bool VetoTag(const HtmlTag& img, StringPiece html) const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(TagVetoPredicate);
};

// Rewrites the first <img> of an HTML fragment so that it is served by the
// edge provider: src, srcset and sizes point at transformed URLs, the
// processed marker class is added, and the image is optionally wrapped in
// a <picture> container.  An <a> wrapped directly around the image (only
// whitespace between) moves into the container with it.
//
// Works on tags, not a DOM: everything outside the replaced range is kept
// byte for byte.  Rewriting the output a second time leaves it unchanged.
class MarkupRewriter {
 public:
  enum State {
    kInit,
    kLocateImgTag,
    kSkip,
    kExtractLink,
    kComputeAttributes,
    kWrapInContainer,
    kReplaceInPlace,
    kDone,
  };

  // Nothing is owned.  metadata may be NULL, in which case dimensions come
  // from the tag alone and every URL counts as local.
  MarkupRewriter(const RewriteOptions* options, const FeatureGate* gate,
                 const EdgeProvider* provider,
                 const SrcsetGenerator* srcset_generator,
                 const ImageMetadataSource* metadata,
                 MessageHandler* handler);
  ~MarkupRewriter();

  // Not owned; NULL clears it.
  void set_tag_veto(const TagVetoPredicate* veto) { veto_ = veto; }

  // Fills *result and returns result->status.  On any status but
  // kTransformOk, result->html is html unchanged.
  TransformStatus Rewrite(StringPiece html, ImageContext context,
                          const RewriteRequest& request,
                          RewriteResult* result) const;

  // Converts a src attribute back to the URL of the full-size source:
  // provider URLs are unwrapped and a "-300x200" size suffix before the
  // extension is removed.
  GoogleString NormalizeSourceUrl(StringPiece src) const;

  static const char* StateName(State state);

  // Removes a "-WxH" size suffix in front of the file extension.  Returns
  // false, leaving *out alone, if url has none.
  static bool StripSizeSuffix(StringPiece url, GoogleString* out);

  // Finds the media library id in a "wp-image-N" class.
  static bool ParseImageIdentity(StringPiece classes, int64* id);

  // Do the classes (of the image or its figure) ask for a layout wider
  // than the content column?
  static bool IsFullWidthClass(StringPiece classes);

 private:
  struct Pass;

  State LocateImgTag(Pass* pass) const;
  State Skip(Pass* pass) const;
  State ExtractLink(Pass* pass) const;
  State ComputeAttributes(Pass* pass) const;
  State WrapInContainer(Pass* pass) const;
  State ReplaceInPlace(Pass* pass) const;

  // Why the located image must be left alone, or kTransformOk.
  TransformStatus CheckSkip(Pass* pass) const;

  // Intrinsic size from the media library.
  bool LookupDimensions(const Pass& pass, int* width, int* height) const;

  // Moves transform attributes (fit="contain", q="70"...) from img into
  // *args.
  void ConsumeTransformAttributes(HtmlTag* img, TransformArgs* args) const;

  // Replaces [begin, end) of the input with replacement.
  void Splice(int begin, int end, StringPiece replacement, Pass* pass) const;

  const RewriteOptions* options_;
  const FeatureGate* gate_;
  const EdgeProvider* provider_;
  const SrcsetGenerator* srcset_generator_;
  const ImageMetadataSource* metadata_;
  MessageHandler* handler_;
  const TagVetoPredicate* veto_;
  TransformArgsResolver resolver_;
  PictureContainer container_;

  DISALLOW_COPY_AND_ASSIGN(MarkupRewriter);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_MARKUP_REWRITER_H_
