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

#include "edge_images/rewriter/public/provider_registry.h"

#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/accelerated_domains_provider.h"
#include "edge_images/rewriter/public/bunny_provider.h"
#include "edge_images/rewriter/public/cloudflare_provider.h"
#include "edge_images/rewriter/public/edge_provider.h"
#include "edge_images/rewriter/public/imgix_provider.h"
#include "edge_images/rewriter/public/imgproxy_provider.h"
#include "edge_images/rewriter/public/native_provider.h"
#include "edge_images/rewriter/public/none_provider.h"

namespace edge_images {

namespace {

struct ProviderName {
  ProviderId id;
  const char* name;
};

const ProviderName kProviderNames[] = {
  {kProviderNone, "none"},
  {kProviderNative, "native"},
  {kProviderCloudflare, "cloudflare"},
  {kProviderImgix, "imgix"},
  {kProviderBunny, "bunny"},
  {kProviderImgproxy, "imgproxy"},
  {kProviderAcceleratedDomains, "accelerated_domains"},
};

}  // namespace

bool ProviderRegistry::ProviderIdFromName(StringPiece name, ProviderId* id) {
  for (int i = 0, n = arraysize(kProviderNames); i < n; ++i) {
    if (StringCaseEqual(name, kProviderNames[i].name)) {
      *id = kProviderNames[i].id;
      return true;
    }
  }
  return false;
}

const char* ProviderRegistry::ProviderIdName(ProviderId id) {
  for (int i = 0, n = arraysize(kProviderNames); i < n; ++i) {
    if (kProviderNames[i].id == id) {
      return kProviderNames[i].name;
    }
  }
  return "none";
}

bool ProviderRegistry::IsValidProviderName(StringPiece name) {
  ProviderId id;
  return ProviderIdFromName(name, &id);
}

EdgeProvider* ProviderRegistry::NewProvider(const ProviderConfig& config) {
  switch (config.id) {
    case kProviderNative:
      return new NativeProvider(config);
    case kProviderCloudflare:
      return new CloudflareProvider(config);
    case kProviderImgix:
      return new ImgixProvider(config);
    case kProviderBunny:
      return new BunnyProvider(config);
    case kProviderImgproxy:
      return new ImgproxyProvider(config);
    case kProviderAcceleratedDomains:
      return new AcceleratedDomainsProvider(config);
    case kProviderNone:
      break;
  }
  return new NoneProvider(config);
}

}  // namespace edge_images
