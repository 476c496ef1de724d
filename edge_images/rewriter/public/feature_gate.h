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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_FEATURE_GATE_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_FEATURE_GATE_H_

#include <memory>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/rewrite_options.h"

namespace edge_images {

class EdgeProvider;

// Predicates consulted before any transformation work starts.  All of them
// are side-effect free and cheap enough to call per image.
class FeatureGate {
 public:
  // options must outlive the gate.
  explicit FeatureGate(const RewriteOptions* options);
  ~FeatureGate();

  // Required provider fields (subdomain, service URL) are present.
  bool ProviderConfigured() const;

  bool TransformationGloballyEnabled() const {
    return options_->transformation_enabled();
  }

  bool PictureWrapEnabled() const {
    return options_->FeatureEnabled(RewriteOptions::kPictureWrap);
  }

  bool FeatureEnabled(RewriteOptions::Feature feature) const {
    return options_->FeatureEnabled(feature);
  }

  // Global switch on, a real provider chosen, and configured.
  bool ShouldTransform() const;

  // The URL is worth handing to a provider: not excluded, not a data: URL,
  // not an SVG.
  bool ShouldTransformUrl(StringPiece url) const;

 private:
  const RewriteOptions* options_;
  // Built once to answer IsConfigured().
  std::unique_ptr<EdgeProvider> provider_;

  DISALLOW_COPY_AND_ASSIGN(FeatureGate);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_FEATURE_GATE_H_
