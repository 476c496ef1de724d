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

#include "edge_images/rewriter/public/markup_rewriter.h"

#include "edge_images/kernel/base/message_handler.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/html/html_tag_lexer.h"
#include "edge_images/kernel/util/re2.h"
#include "edge_images/rewriter/public/edge_provider.h"
#include "edge_images/rewriter/public/feature_gate.h"
#include "edge_images/rewriter/public/image_metadata_source.h"
#include "edge_images/rewriter/public/image_ref.h"
#include "edge_images/rewriter/public/rewrite_options.h"
#include "edge_images/rewriter/public/srcset_generator.h"

namespace edge_images {

namespace {

const char kClassAttribute[] = "class";
const char kSrcAttribute[] = "src";
const char kSrcsetAttribute[] = "srcset";
const char kSizesAttribute[] = "sizes";
const char kWidthAttribute[] = "width";
const char kHeightAttribute[] = "height";

// Layout classes meaning the image may be wider than the content column.
const char* const kFullWidthClasses[] = {
  "alignfull",
  "alignwide",
  "full-width",
  "width-full",
};

const RE2& SizeSuffixPattern() {
  static const RE2* pattern =
      new RE2("(?i)(.*)-[0-9]+x[0-9]+(\\.[a-z]{3,4})");
  return *pattern;
}

const RE2& ImageIdentityPattern() {
  static const RE2* pattern = new RE2("wp-image-([0-9]+)");
  return *pattern;
}

bool IsAllHtmlSpace(StringPiece text) {
  for (int i = 0, n = text.size(); i < n; ++i) {
    if (!IsHtmlSpace(text[i])) {
      return false;
    }
  }
  return true;
}

bool ParsePositiveInt(const char* value, int* out) {
  return value != NULL && StringToInt(TrimWhitespace(StringPiece(value)), out)
      && *out > 0;
}

}  // namespace

TagVetoPredicate::~TagVetoPredicate() {
}

// State carried from one step of a Rewrite() to the next.
struct MarkupRewriter::Pass {
  Pass(StringPiece html_arg, ImageContext context_arg,
       const RewriteRequest& request_arg, RewriteResult* result_arg)
      : html(html_arg),
        context(context_arg),
        request(request_arg),
        result(result_arg),
        in_anchor(false),
        has_anchor(false),
        intrinsic_width(0),
        intrinsic_height(0),
        status(kTransformSkipped) {
  }

  StringPiece html;
  ImageContext context;
  const RewriteRequest& request;
  RewriteResult* result;

  HtmlTag img;
  // The innermost <a> open when img was found.
  HtmlTag open_anchor;
  bool in_anchor;
  // The anchor directly around img, once confirmed.
  HtmlTag anchor_open;
  HtmlTag anchor_close;
  bool has_anchor;
  // Classes of the innermost enclosing <figure>.
  GoogleString figure_classes;

  GoogleString source_url;
  int intrinsic_width;
  int intrinsic_height;
  GoogleString img_html;
  TransformStatus status;

 private:
  DISALLOW_COPY_AND_ASSIGN(Pass);
};

MarkupRewriter::MarkupRewriter(const RewriteOptions* options,
                               const FeatureGate* gate,
                               const EdgeProvider* provider,
                               const SrcsetGenerator* srcset_generator,
                               const ImageMetadataSource* metadata,
                               MessageHandler* handler)
    : options_(options),
      gate_(gate),
      provider_(provider),
      srcset_generator_(srcset_generator),
      metadata_(metadata),
      handler_(handler),
      veto_(NULL),
      resolver_(options),
      container_(options) {
}

MarkupRewriter::~MarkupRewriter() {
}

const char* MarkupRewriter::StateName(State state) {
  switch (state) {
    case kInit:              return "Init";
    case kLocateImgTag:      return "LocateImgTag";
    case kSkip:              return "Skip";
    case kExtractLink:       return "ExtractLink";
    case kComputeAttributes: return "ComputeAttributes";
    case kWrapInContainer:   return "WrapInContainer";
    case kReplaceInPlace:    return "ReplaceInPlace";
    case kDone:              return "Done";
  }
  return "Unknown";
}

TransformStatus MarkupRewriter::Rewrite(StringPiece html,
                                        ImageContext context,
                                        const RewriteRequest& request,
                                        RewriteResult* result) const {
  Pass pass(html, context, request, result);
  State state = kInit;
  while (state != kDone) {
    switch (state) {
      case kInit:
        result->html.assign(html.data(), html.size());
        result->container_html.clear();
        result->transformed = false;
        state = kLocateImgTag;
        break;
      case kLocateImgTag:
        state = LocateImgTag(&pass);
        break;
      case kSkip:
        state = Skip(&pass);
        break;
      case kExtractLink:
        state = ExtractLink(&pass);
        break;
      case kComputeAttributes:
        state = ComputeAttributes(&pass);
        break;
      case kWrapInContainer:
        state = WrapInContainer(&pass);
        break;
      case kReplaceInPlace:
        state = ReplaceInPlace(&pass);
        break;
      case kDone:
        break;
    }
  }
  result->status = pass.status;
  return pass.status;
}

MarkupRewriter::State MarkupRewriter::LocateImgTag(Pass* pass) const {
  HtmlTagLexer lexer(pass->html);
  HtmlTag tag;
  GoogleString figure_classes;
  while (lexer.NextTag(&tag)) {
    if (tag.name() == "a") {
      pass->in_anchor = !tag.is_close_tag();
      if (pass->in_anchor) {
        pass->open_anchor = tag;
      }
    } else if (tag.name() == "figure") {
      const char* classes = tag.AttributeValue(kClassAttribute);
      if (tag.is_close_tag() || classes == NULL) {
        figure_classes.clear();
      } else {
        figure_classes = classes;
      }
    } else if (tag.name() == "img" && !tag.is_close_tag()) {
      pass->img = tag;
      pass->figure_classes = figure_classes;
      pass->status = CheckSkip(pass);
      return (pass->status == kTransformOk) ? kExtractLink : kSkip;
    }
  }
  pass->status = kTransformSkipped;
  return kDone;
}

TransformStatus MarkupRewriter::CheckSkip(Pass* pass) const {
  const HtmlTag& img = pass->img;
  if (!gate_->ShouldTransform()) {
    return kTransformSkipped;
  }
  if (pass->context == kAvatarContext &&
      !gate_->FeatureEnabled(RewriteOptions::kAvatars)) {
    return kTransformSkipped;
  }
  if (img.HasClass(options_->processed_class())) {
    return kTransformSkipped;
  }
  const char* src = img.AttributeValue(kSrcAttribute);
  StringPiece src_piece =
      (src == NULL) ? StringPiece() : TrimWhitespace(StringPiece(src));
  if (src_piece.empty()) {
    return kTransformSkipped;
  }
  if (StringCaseStartsWith(src_piece, "data:") ||
      ImageRef::IsSvgUrl(src_piece)) {
    return kUnsupportedSource;
  }
  if (options_->IsExcluded(src_piece)) {
    return kTransformSkipped;
  }
  pass->source_url = NormalizeSourceUrl(src_piece);
  if (metadata_ != NULL && !metadata_->IsLocalUrl(pass->source_url)) {
    return kUnsupportedSource;
  }
  if (veto_ != NULL && veto_->VetoTag(img, pass->html)) {
    return kTransformSkipped;
  }
  return kTransformOk;
}

MarkupRewriter::State MarkupRewriter::Skip(Pass* pass) const {
  const char* src = pass->img.AttributeValue(kSrcAttribute);
  if (src == NULL) {
    src = "";
  }
  switch (pass->status) {
    case kProviderMisconfigured:
    case kInvalidDimensions:
      EI_LOG_WARN(handler_, "Leaving image %s untransformed: %s", src,
                  TransformStatusName(pass->status));
      break;
    default:
      EI_LOG_INFO(handler_, "Skipping image %s: %s", src,
                  TransformStatusName(pass->status));
      break;
  }
  return kDone;
}

MarkupRewriter::State MarkupRewriter::ExtractLink(Pass* pass) const {
  if (!pass->in_anchor ||
      !IsAllHtmlSpace(pass->html.substr(
          pass->open_anchor.end(),
          pass->img.begin() - pass->open_anchor.end()))) {
    return kComputeAttributes;
  }
  StringPiece rest = pass->html.substr(pass->img.end());
  HtmlTagLexer lexer(rest);
  HtmlTag close;
  if (lexer.NextTag(&close) && close.name() == "a" && close.is_close_tag() &&
      IsAllHtmlSpace(rest.substr(0, close.begin()))) {
    int offset = pass->img.end();
    close.set_range(close.begin() + offset, close.end() + offset);
    pass->anchor_open = pass->open_anchor;
    pass->anchor_close = close;
    pass->has_anchor = true;
  }
  return kComputeAttributes;
}

MarkupRewriter::State MarkupRewriter::ComputeAttributes(Pass* pass) const {
  HtmlTag* img = &pass->img;
  int width = 0;
  int height = 0;
  if (!ParsePositiveInt(img->AttributeValue(kWidthAttribute), &width) ||
      !ParsePositiveInt(img->AttributeValue(kHeightAttribute), &height)) {
    width = 0;
    height = 0;
    if (!LookupDimensions(*pass, &width, &height)) {
      width = 0;
      height = 0;
    }
  }
  pass->intrinsic_width = width;
  pass->intrinsic_height = height;

  TransformArgs caller(pass->request.args);
  ConsumeTransformAttributes(img, &caller);

  const char* img_classes = img->AttributeValue(kClassAttribute);
  bool full_width = pass->request.full_width ||
      (img_classes != NULL && IsFullWidthClass(img_classes)) ||
      IsFullWidthClass(pass->figure_classes);

  TransformArgs args;
  pass->status = resolver_.Resolve(pass->context, caller, width, height,
                                   full_width, &args);
  if (pass->status != kTransformOk) {
    return kSkip;
  }

  ImageRef image(pass->source_url, width, height);
  GoogleString src;
  pass->status = srcset_generator_->BuildUrl(
      image, args, ImageContextName(pass->context), &src);
  if (pass->status != kTransformOk) {
    return kSkip;
  }

  GoogleString sizes_hint(pass->request.sizes);
  if (sizes_hint.empty() && img->AttributeValue(kSizesAttribute) != NULL) {
    sizes_hint = img->AttributeValue(kSizesAttribute);
  }
  SrcsetResult srcset;
  pass->status = srcset_generator_->Generate(
      image, args, sizes_hint, IsFixedContext(pass->context), &srcset);
  if (pass->status != kTransformOk) {
    return kSkip;
  }

  img->SetAttribute(kSrcAttribute, src);
  if (!srcset.srcset.empty()) {
    img->SetAttribute(kSrcsetAttribute, srcset.srcset);
    if (!srcset.sizes.empty()) {
      img->SetAttribute(kSizesAttribute, srcset.sizes);
    }
  }
  // Layout keeps the source's own aspect ratio, not the transform's.
  if (image.has_intrinsic_dimensions()) {
    img->SetAttribute(kWidthAttribute, IntegerToString(width));
    img->SetAttribute(kHeightAttribute, IntegerToString(height));
  }
  img->AddClass(options_->processed_class());
  pass->img_html = img->ToString();

  if (gate_->PictureWrapEnabled() && image.has_intrinsic_dimensions()) {
    return kWrapInContainer;
  }
  return kReplaceInPlace;
}

MarkupRewriter::State MarkupRewriter::WrapInContainer(Pass* pass) const {
  GoogleString anchor_open, anchor_close;
  int begin = pass->img.begin();
  int end = pass->img.end();
  if (pass->has_anchor) {
    begin = pass->anchor_open.begin();
    end = pass->anchor_close.end();
    anchor_open = GoogleString(
        pass->html.substr(begin, pass->anchor_open.end() - begin));
    anchor_close = GoogleString(pass->html.substr(
        pass->anchor_close.begin(), end - pass->anchor_close.begin()));
  }
  GoogleString picture;
  if (!container_.Wrap(pass->img_html, anchor_open, anchor_close,
                       pass->intrinsic_width, pass->intrinsic_height,
                       pass->request.container_class,
                       pass->context == kAvatarContext, &picture)) {
    return kReplaceInPlace;
  }
  Splice(begin, end, picture, pass);
  pass->result->container_html.swap(picture);
  return kDone;
}

MarkupRewriter::State MarkupRewriter::ReplaceInPlace(Pass* pass) const {
  Splice(pass->img.begin(), pass->img.end(), pass->img_html, pass);
  return kDone;
}

void MarkupRewriter::Splice(int begin, int end, StringPiece replacement,
                            Pass* pass) const {
  RewriteResult* result = pass->result;
  result->html.clear();
  StrAppend(&result->html, pass->html.substr(0, begin), replacement,
            pass->html.substr(end));
  result->transformed = true;
  pass->status = kTransformOk;
}

bool MarkupRewriter::LookupDimensions(const Pass& pass, int* width,
                                      int* height) const {
  if (metadata_ == NULL) {
    return false;
  }
  int64 id = pass.request.image_id;
  if (id <= 0) {
    const char* classes = pass.img.AttributeValue(kClassAttribute);
    if ((classes == NULL || !ParseImageIdentity(classes, &id)) &&
        !metadata_->ResolveIdentityFromUrl(pass.source_url, &id)) {
      return false;
    }
  }
  return metadata_->GetIntrinsicDimensions(id, width, height) &&
      *width > 0 && *height > 0;
}

void MarkupRewriter::ConsumeTransformAttributes(HtmlTag* img,
                                                TransformArgs* args) const {
  StringVector consumed;
  TransformArgs from_tag;
  for (int i = 0, n = img->num_attributes(); i < n; ++i) {
    const HtmlTag::Attribute& attribute = img->attribute(i);
    const GoogleString& name = attribute.name();
    // width and height are layout attributes, not transform requests.
    if (StringCaseEqual(name, "width") || StringCaseEqual(name, "height") ||
        StringCaseEqual(name, "w") || StringCaseEqual(name, "h") ||
        !TransformArgs::IsKnobName(name)) {
      continue;
    }
    if (!attribute.has_value() ||
        !from_tag.SetFromName(name, attribute.value())) {
      EI_LOG_INFO(handler_, "Ignoring transform attribute %s=\"%s\"",
                  name.c_str(), attribute.value().c_str());
    }
    consumed.push_back(name);
  }
  for (int i = 0, n = consumed.size(); i < n; ++i) {
    img->DeleteAttribute(consumed[i]);
  }
  args->MergeOverridesFrom(from_tag);
}

GoogleString MarkupRewriter::NormalizeSourceUrl(StringPiece src) const {
  GoogleString source(src.data(), src.size());
  GoogleString recovered;
  if (provider_->ExtractSourceUrl(source, &recovered)) {
    source.swap(recovered);
  }
  GoogleString stripped;
  if (StripSizeSuffix(source, &stripped)) {
    source.swap(stripped);
  }
  return source;
}

bool MarkupRewriter::StripSizeSuffix(StringPiece url, GoogleString* out) {
  Re2StringPiece stem, extension;
  if (!RE2::FullMatch(StringPieceToRe2(url), SizeSuffixPattern(), &stem,
                      &extension)) {
    return false;
  }
  *out = StrCat(Re2ToStringPiece(stem), Re2ToStringPiece(extension));
  return true;
}

bool MarkupRewriter::ParseImageIdentity(StringPiece classes, int64* id) {
  Re2StringPiece digits;
  if (!RE2::PartialMatch(StringPieceToRe2(classes), ImageIdentityPattern(),
                         &digits)) {
    return false;
  }
  int64 value = 0;
  if (!StringToInt64(Re2ToStringPiece(digits), &value) || value <= 0) {
    return false;
  }
  *id = value;
  return true;
}

bool MarkupRewriter::IsFullWidthClass(StringPiece classes) {
  StringPieceVector names;
  SplitStringPieceToVector(classes, " \t\n\r\f", &names, true);
  for (int i = 0, n = names.size(); i < n; ++i) {
    for (int j = 0, m = arraysize(kFullWidthClasses); j < m; ++j) {
      if (StringCaseEqual(names[i], kFullWidthClasses[j])) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace edge_images
