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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_ACCELERATED_DOMAINS_PROVIDER_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_ACCELERATED_DOMAINS_PROVIDER_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/edge_provider.h"

namespace edge_images {

// Accelerated Domains image resizing, served from the site's own host:
//   {domain}/acd-cgi/img/v1{path}?{query}
class AcceleratedDomainsProvider : public EdgeProvider {
 public:
  static const char kEdgeRoot[];

  explicit AcceleratedDomainsProvider(const ProviderConfig& config);
  virtual ~AcceleratedDomainsProvider();

  virtual TransformStatus BuildUrl(const ImageRef& image,
                                   const TransformArgs& args,
                                   GoogleString* url) const;
  virtual bool UsesHostedSubdomain() const { return false; }
  virtual bool IsTransformedUrl(StringPiece url) const;
  virtual bool ExtractSourceUrl(StringPiece url, GoogleString* source) const;
  virtual const char* name() const { return "accelerated_domains"; }

 private:
  DISALLOW_COPY_AND_ASSIGN(AcceleratedDomainsProvider);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_ACCELERATED_DOMAINS_PROVIDER_H_
