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

#include "edge_images/kernel/http/google_url.h"

#include <algorithm>
#include <cstddef>

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/util/re2.h"

namespace edge_images {

namespace {

// scheme ":" [ "//" authority ] path [ "?" query ] [ "#" fragment ]
const RE2& UrlPattern() {
  static const RE2* pattern = new RE2(
      "([A-Za-z][A-Za-z0-9+.\\-]*):(?://([^/?#]*))?([^?#]*)"
      "(?:\\?([^#]*))?(?:#.*)?");
  return *pattern;
}

bool HasScheme(StringPiece url) {
  return RE2::PartialMatch(StringPieceToRe2(url),
                           "^[A-Za-z][A-Za-z0-9+.\\-]*:");
}

}  // namespace

const size_t GoogleUrl::npos;

GoogleUrl::GoogleUrl() {
  Clear();
}

GoogleUrl::GoogleUrl(StringPiece spec) {
  Reset(spec);
}

GoogleUrl::GoogleUrl(const GoogleUrl& base, StringPiece relative) {
  Reset(base, relative);
}

GoogleUrl::~GoogleUrl() {
}

void GoogleUrl::Clear() {
  spec_.clear();
  is_valid_ = false;
  scheme_end_ = npos;
  host_begin_ = npos;
  host_end_ = npos;
  authority_end_ = npos;
  path_end_ = npos;
  query_begin_ = npos;
  query_end_ = npos;
}

bool GoogleUrl::Reset(StringPiece new_url) {
  Clear();
  spec_.assign(new_url.data(), new_url.size());
  is_valid_ = Parse();
  return is_valid_;
}

bool GoogleUrl::Reset(const GoogleUrl& base, StringPiece relative) {
  relative = TrimWhitespace(relative);
  if (HasScheme(relative) || !base.IsAnyValid() ||
      (base.host_begin_ == npos)) {
    return Reset(relative);
  }
  GoogleString resolved;
  if (HasPrefixString(relative, "//")) {
    resolved = StrCat(base.Scheme(), ":", relative);
  } else if (HasPrefixString(relative, "/")) {
    resolved = StrCat(base.Origin(), relative);
  } else if (relative.empty()) {
    resolved = GoogleString(base.Spec());
  } else {
    resolved = StrCat(base.Origin(), base.PathSansLeaf(), relative);
  }
  return Reset(resolved);
}

bool GoogleUrl::Parse() {
  Re2StringPiece scheme, authority, path, query;
  if (!RE2::FullMatch(StringPieceToRe2(spec_), UrlPattern(),
                      &scheme, &authority, &path, &query)) {
    return false;
  }
  const char* base = spec_.data();
  scheme_end_ = scheme.size();
  for (size_t i = 0; i < scheme_end_; ++i) {
    spec_[i] = LowerChar(spec_[i]);
  }

  if (authority.data() != NULL) {
    size_t authority_begin = authority.data() - base;
    authority_end_ = authority_begin + authority.size();
    StringPiece hostport = Re2ToStringPiece(authority);
    StringPiece::size_type at = hostport.rfind('@');
    host_begin_ = authority_begin;
    if (at != StringPiece::npos) {
      host_begin_ += at + 1;
      hostport.remove_prefix(at + 1);
    }
    StringPiece::size_type host_size = hostport.size();
    if (!hostport.empty() && hostport[0] == '[') {
      StringPiece::size_type bracket = hostport.find(']');
      if (bracket != StringPiece::npos) {
        host_size = bracket + 1;
      }
    } else {
      StringPiece::size_type colon = hostport.find(':');
      if (colon != StringPiece::npos) {
        host_size = colon;
      }
    }
    host_end_ = host_begin_ + host_size;
    for (size_t i = host_begin_; i < host_end_; ++i) {
      spec_[i] = LowerChar(spec_[i]);
    }
  }

  path_end_ = (path.data() - base) + path.size();
  if (query.data() != NULL) {
    query_begin_ = query.data() - base;
    query_end_ = query_begin_ + query.size();
  } else {
    query_end_ = path_end_;
  }

  // Web URLs always have at least a "/" path.
  if ((host_begin_ != npos) && (path.size() == 0) &&
      (Scheme() == "http" || Scheme() == "https")) {
    spec_.insert(path_end_, "/");
    return Parse();
  }
  return true;
}

bool GoogleUrl::IsWebValid() const {
  if (!is_valid_ || (host_begin_ == npos) || (host_end_ == host_begin_)) {
    return false;
  }
  StringPiece scheme = Scheme();
  return (scheme == "http") || (scheme == "https");
}

bool GoogleUrl::IsDataUrl() const {
  return is_valid_ && (Scheme() == "data");
}

StringPiece GoogleUrl::Spec() const {
  return is_valid_ ? StringPiece(spec_) : StringPiece();
}

StringPiece GoogleUrl::Scheme() const {
  if (!is_valid_) {
    return StringPiece();
  }
  return StringPiece(spec_).substr(0, scheme_end_);
}

StringPiece GoogleUrl::Host() const {
  if (!is_valid_ || host_begin_ == npos) {
    return StringPiece();
  }
  return StringPiece(spec_).substr(host_begin_, host_end_ - host_begin_);
}

StringPiece GoogleUrl::HostAndPort() const {
  if (!is_valid_ || host_begin_ == npos) {
    return StringPiece();
  }
  return StringPiece(spec_).substr(host_begin_,
                                   authority_end_ - host_begin_);
}

StringPiece GoogleUrl::Origin() const {
  if (!is_valid_ || host_begin_ == npos) {
    return StringPiece();
  }
  return StringPiece(spec_).substr(0, authority_end_);
}

StringPiece GoogleUrl::PathAndLeaf() const {
  if (!is_valid_) {
    return StringPiece();
  }
  size_t begin = (host_begin_ == npos) ? scheme_end_ + 1 : authority_end_;
  return StringPiece(spec_).substr(begin, query_end_ - begin);
}

StringPiece GoogleUrl::PathSansQuery() const {
  if (!is_valid_) {
    return StringPiece();
  }
  size_t begin = (host_begin_ == npos) ? scheme_end_ + 1 : authority_end_;
  return StringPiece(spec_).substr(begin, path_end_ - begin);
}

size_t GoogleUrl::LeafStartPosition() const {
  size_t slash = spec_.rfind('/', path_end_ == 0 ? 0 : path_end_ - 1);
  size_t path_begin =
      (host_begin_ == npos) ? scheme_end_ + 1 : authority_end_;
  if (slash == GoogleString::npos || slash < path_begin) {
    return path_begin;
  }
  return slash + 1;
}

StringPiece GoogleUrl::PathSansLeaf() const {
  if (!is_valid_) {
    return StringPiece();
  }
  size_t begin = (host_begin_ == npos) ? scheme_end_ + 1 : authority_end_;
  return StringPiece(spec_).substr(begin, LeafStartPosition() - begin);
}

StringPiece GoogleUrl::LeafSansQuery() const {
  if (!is_valid_) {
    return StringPiece();
  }
  size_t leaf_start = LeafStartPosition();
  return StringPiece(spec_).substr(leaf_start, path_end_ - leaf_start);
}

StringPiece GoogleUrl::Query() const {
  if (!has_query()) {
    return StringPiece();
  }
  return StringPiece(spec_).substr(query_begin_, query_end_ - query_begin_);
}

StringPiece GoogleUrl::AllExceptQuery() const {
  if (!is_valid_) {
    return StringPiece();
  }
  return StringPiece(spec_).substr(0, path_end_);
}

GoogleString GoogleUrl::ExtractFileName() const {
  StringPiece leaf = LeafSansQuery();
  StringPiece::size_type dot = leaf.rfind('.');
  if (dot != StringPiece::npos) {
    leaf = leaf.substr(0, dot);
  }
  return GoogleString(leaf);
}

}  // namespace edge_images
