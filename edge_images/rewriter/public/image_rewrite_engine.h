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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_REWRITE_ENGINE_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_REWRITE_ENGINE_H_

#include <memory>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/md5_hasher.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/edge_provider.h"
#include "edge_images/rewriter/public/feature_gate.h"
#include "edge_images/rewriter/public/image_context.h"
#include "edge_images/rewriter/public/markup_rewriter.h"
#include "edge_images/rewriter/public/srcset_generator.h"
#include "edge_images/rewriter/public/transform_args.h"
#include "edge_images/rewriter/public/transform_args_resolver.h"
#include "edge_images/rewriter/public/transform_cache.h"
#include "edge_images/rewriter/public/transform_status.h"

namespace edge_images {

class CacheInterface;
class ImageMetadataSource;
class MessageHandler;
class RewriteOptions;
class Timer;

// The entry point for callers.  An engine is built from one frozen
// configuration snapshot and owns everything derived from it: the edge
// provider, the transform cache and the rewriters.  Its methods may be
// called from several threads at once; the cache is the only shared
// mutable state.
//
// No method fails loudly.  Whatever goes wrong, the caller gets its input
// back along with a status saying why.
class ImageRewriteEngine {
 public:
  // Nothing is owned; everything must outlive the engine.  metadata may be
  // NULL (dimensions then come from markup alone, and every URL is
  // local).  cache_backend may be NULL, in which case nothing is cached.
  // A backend shared by several engines must be thread-safe itself, e.g.
  // wrapped in a ThreadsafeCache; purges reach every engine through it.
  ImageRewriteEngine(const RewriteOptions* options,
                     const ImageMetadataSource* metadata,
                     CacheInterface* cache_backend, Timer* timer,
                     MessageHandler* handler);
  ~ImageRewriteEngine();

  // Rewrites the first <img> in html.
  TransformStatus RewriteFragment(StringPiece html, ImageContext context,
                                  const RewriteRequest& request,
                                  RewriteResult* result) const;

  // Transformed URL for a non-markup use (og:image, schema, sitemaps).
  // On failure *out is url unchanged.
  TransformStatus TransformUrl(StringPiece url, ImageContext context,
                               const TransformArgs& args,
                               GoogleString* out) const;

  // Builds a square avatar <img> of the given size for url and rewrites
  // it.  On failure result->html is the untransformed tag.
  TransformStatus TransformAvatar(StringPiece url, int size,
                                  StringPiece extra_classes,
                                  RewriteResult* result) const;

  // The asset behind current_url changed (replaced, or moved from
  // prior_url).  Cached transforms of either URL are dropped.  prior_url
  // may be empty.
  void InvalidateAsset(StringPiece current_url, StringPiece prior_url);

  // Drops every cached transform.
  void FlushCache();

  // Not owned; NULL clears it.
  void set_tag_veto(const TagVetoPredicate* veto) {
    markup_rewriter_.set_tag_veto(veto);
  }

  const FeatureGate& gate() const { return gate_; }
  const EdgeProvider* provider() const { return provider_.get(); }
  // NULL when the engine runs without a cache.
  const TransformCache* cache() const { return cache_.get(); }

 private:
  // Logs, once per call, that transforms are being computed uncached.
  void CheckCacheAvailable(StringPiece what) const;

  const RewriteOptions* options_;
  const ImageMetadataSource* metadata_;
  MessageHandler* handler_;
  FeatureGate gate_;
  std::unique_ptr<EdgeProvider> provider_;
  MD5Hasher hasher_;
  std::unique_ptr<TransformCache> cache_;
  TransformArgsResolver resolver_;
  SrcsetGenerator srcset_generator_;
  MarkupRewriter markup_rewriter_;

  DISALLOW_COPY_AND_ASSIGN(ImageRewriteEngine);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_IMAGE_REWRITE_ENGINE_H_
