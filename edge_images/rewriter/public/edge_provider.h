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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_EDGE_PROVIDER_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_EDGE_PROVIDER_H_

#include <utility>
#include <vector>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/image_ref.h"
#include "edge_images/rewriter/public/provider_config.h"
#include "edge_images/rewriter/public/transform_args.h"
#include "edge_images/rewriter/public/transform_status.h"

namespace edge_images {

// Turns transform intent into the URL of one image-transformation
// service.  URL construction is pure string work; nothing here performs
// I/O.  Implementations are immutable after construction and may be
// shared between threads.
class EdgeProvider {
 public:
  explicit EdgeProvider(const ProviderConfig& config);
  virtual ~EdgeProvider();

  // Builds the transformed URL for image.  Knobs the service does not
  // support are dropped.  Keys are emitted in a canonical sorted order so
  // the same arguments always give the same URL.  On failure *url is left
  // untouched.
  virtual TransformStatus BuildUrl(const ImageRef& image,
                                   const TransformArgs& args,
                                   GoogleString* url) const = 0;

  // True when URLs point at a dedicated service host rather than a path
  // prefix on the site's own domain.
  virtual bool UsesHostedSubdomain() const = 0;

  // Are the provider-specific required fields present?
  virtual bool IsConfigured() const { return true; }

  // Does url look like one this provider built?
  virtual bool IsTransformedUrl(StringPiece url) const = 0;

  // Recovers the source URL from a transformed one.  Returns false if url
  // was not built by this provider.
  virtual bool ExtractSourceUrl(StringPiece url,
                                GoogleString* source) const = 0;

  virtual const char* name() const = 0;

  const ProviderConfig& config() const { return config_; }

 protected:
  typedef std::pair<GoogleString, GoogleString> Arg;
  typedef std::vector<Arg> ArgVector;

  // Splits a source URL into the domain URLs are built on (the configured
  // rewrite domain, else the source origin) and the path without query.
  // Relative sources yield an empty domain unless one is configured.
  void SplitSource(StringPiece source_url, GoogleString* domain,
                   GoogleString* path) const;

  // Joins domain and path back into a source URL for ExtractSourceUrl.
  GoogleString JoinSource(StringPiece domain, StringPiece path) const;

  static void AddArg(StringPiece key, StringPiece value, ArgVector* args);
  static void AddIntArg(StringPiece key, int value, ArgVector* args);

  // Sorts args by key, then joins them as key<kv_separator>value pairs
  // separated by separator.
  static GoogleString JoinArgs(ArgVector* args, StringPiece kv_separator,
                               StringPiece separator);

  static GoogleString StripTrailingSlash(StringPiece url);

 private:
  ProviderConfig config_;

  DISALLOW_COPY_AND_ASSIGN(EdgeProvider);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_EDGE_PROVIDER_H_
