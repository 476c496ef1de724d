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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_PROVIDER_CONFIG_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_PROVIDER_CONFIG_H_

#include "edge_images/kernel/base/string.h"

namespace edge_images {

enum ProviderId {
  kProviderNone,
  kProviderNative,
  kProviderCloudflare,
  kProviderImgix,
  kProviderBunny,
  kProviderImgproxy,
  kProviderAcceleratedDomains,
};

// Everything a provider needs to build URLs.  Read-only once handed to a
// provider.
struct ProviderConfig {
  ProviderConfig() : id(kProviderNone) {}

  ProviderId id;
  // Scheme and host URLs are rewritten onto, e.g. "https://site.test".
  // Falls back to the origin of each source URL when empty.
  GoogleString rewrite_domain;
  // imgix and bunny: the account subdomain, e.g. "acme" for acme.imgix.net.
  GoogleString subdomain;
  // imgproxy: base URL of the imgproxy service.
  GoogleString service_url;
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_PROVIDER_CONFIG_H_
