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

#include "edge_images/rewriter/public/edge_provider.h"

#include <algorithm>

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/http/google_url.h"

namespace edge_images {

namespace {

bool ArgKeyLess(const std::pair<GoogleString, GoogleString>& a,
                const std::pair<GoogleString, GoogleString>& b) {
  return a.first < b.first;
}

}  // namespace

EdgeProvider::EdgeProvider(const ProviderConfig& config)
    : config_(config) {
}

EdgeProvider::~EdgeProvider() {
}

void EdgeProvider::SplitSource(StringPiece source_url, GoogleString* domain,
                               GoogleString* path) const {
  GoogleString origin;
  GoogleUrl gurl;
  if (HasPrefixString(source_url, "//")) {
    gurl.Reset(StrCat("https:", source_url));
  } else {
    gurl.Reset(source_url);
  }
  if (gurl.IsWebValid()) {
    origin = GoogleString(gurl.Origin());
    *path = GoogleString(gurl.PathSansQuery());
  } else {
    StringPiece::size_type end = source_url.find_first_of("?#");
    StringPiece bare = source_url.substr(0, end);
    *path = HasPrefixString(bare, "/") ? GoogleString(bare)
                                       : StrCat("/", bare);
  }
  if (!config_.rewrite_domain.empty()) {
    *domain = StripTrailingSlash(config_.rewrite_domain);
  } else {
    *domain = origin;
  }
}

GoogleString EdgeProvider::JoinSource(StringPiece domain,
                                      StringPiece path) const {
  if (domain.empty()) {
    domain = config_.rewrite_domain;
  }
  return StrCat(StripTrailingSlash(domain), path);
}

void EdgeProvider::AddArg(StringPiece key, StringPiece value,
                          ArgVector* args) {
  args->push_back(Arg(GoogleString(key), GoogleString(value)));
}

void EdgeProvider::AddIntArg(StringPiece key, int value, ArgVector* args) {
  AddArg(key, IntegerToString(value), args);
}

GoogleString EdgeProvider::JoinArgs(ArgVector* args,
                                    StringPiece kv_separator,
                                    StringPiece separator) {
  std::stable_sort(args->begin(), args->end(), ArgKeyLess);
  GoogleString out;
  for (int i = 0, n = args->size(); i < n; ++i) {
    if (i != 0) {
      StrAppend(&out, separator);
    }
    StrAppend(&out, (*args)[i].first, kv_separator, (*args)[i].second);
  }
  return out;
}

GoogleString EdgeProvider::StripTrailingSlash(StringPiece url) {
  while (!url.empty() && url[url.size() - 1] == '/') {
    url.remove_suffix(1);
  }
  return GoogleString(url);
}

}  // namespace edge_images
