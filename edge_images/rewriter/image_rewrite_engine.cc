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

#include "edge_images/rewriter/public/image_rewrite_engine.h"

#include "edge_images/kernel/base/cache_interface.h"
#include "edge_images/kernel/base/message_handler.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/base/timer.h"
#include "edge_images/kernel/html/html_tag.h"
#include "edge_images/rewriter/public/image_metadata_source.h"
#include "edge_images/rewriter/public/image_ref.h"
#include "edge_images/rewriter/public/provider_registry.h"
#include "edge_images/rewriter/public/rewrite_options.h"

namespace edge_images {

ImageRewriteEngine::ImageRewriteEngine(const RewriteOptions* options,
                                       const ImageMetadataSource* metadata,
                                       CacheInterface* cache_backend,
                                       Timer* timer, MessageHandler* handler)
    : options_(options),
      metadata_(metadata),
      handler_(handler),
      gate_(options),
      provider_(ProviderRegistry::NewProvider(options->provider_config())),
      cache_(cache_backend == NULL
             ? NULL
             : new TransformCache(cache_backend, &hasher_, timer, handler,
                                  options->cache_ttl_ms())),
      resolver_(options),
      srcset_generator_(options, provider_.get(), cache_.get()),
      markup_rewriter_(options, &gate_, provider_.get(), &srcset_generator_,
                       metadata, handler) {
  if (cache_ != NULL) {
    cache_->set_negative_ttl_ms(options->negative_cache_ttl_ms());
  }
  if (!options->frozen()) {
    EI_LOG_DFATAL(handler_, "ImageRewriteEngine built from unfrozen options");
  }
  if (options->transformation_enabled() && !gate_.ProviderConfigured()) {
    EI_LOG_WARN(handler_, "Edge provider %s is missing required settings; "
                "images will not be transformed", provider_->name());
  }
}

ImageRewriteEngine::~ImageRewriteEngine() {
}

void ImageRewriteEngine::CheckCacheAvailable(StringPiece what) const {
  if (cache_ != NULL && !cache_->IsAvailable()) {
    GoogleString what_str(what.data(), what.size());
    EI_LOG_WARN(handler_, "Transform cache unavailable (%s); computing %s "
                "directly", TransformStatusName(kCacheUnavailable),
                what_str.c_str());
  }
}

TransformStatus ImageRewriteEngine::RewriteFragment(
    StringPiece html, ImageContext context, const RewriteRequest& request,
    RewriteResult* result) const {
  CheckCacheAvailable(ImageContextName(context));
  return markup_rewriter_.Rewrite(html, context, request, result);
}

TransformStatus ImageRewriteEngine::TransformUrl(StringPiece url,
                                                 ImageContext context,
                                                 const TransformArgs& args,
                                                 GoogleString* out) const {
  out->assign(url.data(), url.size());
  if (!gate_.ShouldTransform() ||
      (context == kAvatarContext &&
       !gate_.FeatureEnabled(RewriteOptions::kAvatars))) {
    return kTransformSkipped;
  }
  StringPiece trimmed = TrimWhitespace(url);
  if (trimmed.empty()) {
    return kTransformSkipped;
  }
  if (StringCaseStartsWith(trimmed, "data:") || ImageRef::IsSvgUrl(trimmed)) {
    return kUnsupportedSource;
  }
  if (options_->IsExcluded(trimmed)) {
    return kTransformSkipped;
  }
  GoogleString source = markup_rewriter_.NormalizeSourceUrl(trimmed);
  if (metadata_ != NULL && !metadata_->IsLocalUrl(source)) {
    return kUnsupportedSource;
  }
  CheckCacheAvailable(source);

  int width = 0;
  int height = 0;
  int64 id = 0;
  if (metadata_ == NULL || !metadata_->ResolveIdentityFromUrl(source, &id) ||
      !metadata_->GetIntrinsicDimensions(id, &width, &height)) {
    width = 0;
    height = 0;
  }

  TransformArgs resolved;
  TransformStatus status =
      resolver_.Resolve(context, args, width, height, &resolved);
  if (status == kTransformOk) {
    GoogleString transformed;
    status = srcset_generator_.BuildUrl(ImageRef(source, width, height),
                                        resolved, ImageContextName(context),
                                        &transformed);
    if (status == kTransformOk) {
      out->swap(transformed);
      return kTransformOk;
    }
  }
  EI_LOG_WARN(handler_, "Leaving %s untransformed: %s", source.c_str(),
              TransformStatusName(status));
  return status;
}

TransformStatus ImageRewriteEngine::TransformAvatar(
    StringPiece url, int size, StringPiece extra_classes,
    RewriteResult* result) const {
  if (size <= 0) {
    size = TransformArgsResolver::kDefaultAvatarSize;
  }
  GoogleString size_str = IntegerToString(size);
  HtmlTag img;
  img.set_name("img");
  img.SetAttribute("alt", "");
  img.SetAttribute("src", url);
  img.SetAttribute("class", StrCat("avatar avatar-", size_str, " photo"));
  img.SetAttribute("width", size_str);
  img.SetAttribute("height", size_str);

  RewriteRequest request;
  request.args.set_width(size);
  request.args.set_height(size);
  request.sizes = StrCat("(max-width: ", size_str, "px) 100vw, ", size_str,
                         "px");
  request.container_class = GoogleString(extra_classes);
  return RewriteFragment(img.ToString(), kAvatarContext, request, result);
}

void ImageRewriteEngine::InvalidateAsset(StringPiece current_url,
                                         StringPiece prior_url) {
  if (cache_ == NULL) {
    return;
  }
  if (!current_url.empty()) {
    cache_->InvalidateUrl(markup_rewriter_.NormalizeSourceUrl(current_url));
  }
  if (!prior_url.empty()) {
    cache_->InvalidateUrl(markup_rewriter_.NormalizeSourceUrl(prior_url));
  }
}

void ImageRewriteEngine::FlushCache() {
  if (cache_ != NULL) {
    cache_->FlushGroup();
  }
}

}  // namespace edge_images
