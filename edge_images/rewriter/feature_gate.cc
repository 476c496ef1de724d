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

#include "edge_images/rewriter/public/feature_gate.h"

#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/edge_provider.h"
#include "edge_images/rewriter/public/image_ref.h"
#include "edge_images/rewriter/public/provider_registry.h"

namespace edge_images {

FeatureGate::FeatureGate(const RewriteOptions* options)
    : options_(options),
      provider_(ProviderRegistry::NewProvider(options->provider_config())) {
}

FeatureGate::~FeatureGate() {
}

bool FeatureGate::ProviderConfigured() const {
  return provider_->IsConfigured();
}

bool FeatureGate::ShouldTransform() const {
  return TransformationGloballyEnabled() &&
      options_->provider_id() != kProviderNone && ProviderConfigured();
}

bool FeatureGate::ShouldTransformUrl(StringPiece url) const {
  url = TrimWhitespace(url);
  if (url.empty() || StringCaseStartsWith(url, "data:")) {
    return false;
  }
  return !ImageRef::IsSvgUrl(url) && !options_->IsExcluded(url);
}

}  // namespace edge_images
