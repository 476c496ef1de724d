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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_PROVIDER_REGISTRY_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_PROVIDER_REGISTRY_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/provider_config.h"

namespace edge_images {

class EdgeProvider;

// Maps provider names, as stored in configuration, to implementations.
class ProviderRegistry {
 public:
  // Case-insensitive.  Returns false for unknown names and leaves *id
  // alone.
  static bool ProviderIdFromName(StringPiece name, ProviderId* id);

  // e.g. "accelerated_domains".
  static const char* ProviderIdName(ProviderId id);

  static bool IsValidProviderName(StringPiece name);

  // Returns a new provider for config.id.  Caller owns the result.
  static EdgeProvider* NewProvider(const ProviderConfig& config);

 private:
  DISALLOW_IMPLICIT_CONSTRUCTORS(ProviderRegistry);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_PROVIDER_REGISTRY_H_
