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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_CONFIGURATION_SOURCE_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_CONFIGURATION_SOURCE_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/provider_config.h"

namespace edge_images {

// The settings store the engine is configured from.  Only read while a
// RewriteOptions snapshot is being built; the engine never consults it
// afterwards.
class ConfigurationSource {
 public:
  ConfigurationSource() {}
  virtual ~ConfigurationSource();

  // Provider name as stored, e.g. "cloudflare".  Empty if unset.
  virtual GoogleString GetProvider() const = 0;

  // Fills the provider-specific fields (domain, subdomain, service URL)
  // for id.  config->id is set by the caller.
  virtual void GetProviderConfig(ProviderId id,
                                 ProviderConfig* config) const = 0;

  // Non-positive means unset.
  virtual int GetMaxWidth() const = 0;

  // Per-feature opt-out, by feature name ("avatars", "picture_wrap",
  // "htaccess_caching").
  virtual bool IsFeatureEnabled(StringPiece name) const = 0;

  // Any other setting by its option name, e.g. "edge_images_quality".
  // Returns false if the setting is absent.
  virtual bool GetOption(StringPiece name, GoogleString* value) const {
    return false;
  }

 private:
  DISALLOW_COPY_AND_ASSIGN(ConfigurationSource);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_CONFIGURATION_SOURCE_H_
