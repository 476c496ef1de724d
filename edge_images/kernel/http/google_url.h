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

#ifndef EDGE_IMAGES_KERNEL_HTTP_GOOGLE_URL_H_
#define EDGE_IMAGES_KERNEL_HTTP_GOOGLE_URL_H_

#include <cstddef>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// Splits a URL into its components without any network or DNS access.
// Only syntax is checked: a URL is "web valid" when it has an http or
// https scheme and a non-empty host.  The scheme and host are lower-cased
// and an empty web path becomes "/"; nothing else is canonicalized.
//
// For "https://www.example.com:8080/a/b/c.jpg?w=1#top":
//   Scheme()         "https"
//   Host()           "www.example.com"
//   HostAndPort()    "www.example.com:8080"
//   Origin()         "https://www.example.com:8080"
//   PathAndLeaf()    "/a/b/c.jpg?w=1"
//   PathSansQuery()  "/a/b/c.jpg"
//   PathSansLeaf()   "/a/b/"
//   LeafSansQuery()  "c.jpg"
//   Query()          "w=1"
//   AllExceptQuery() "https://www.example.com:8080/a/b/c.jpg"
class GoogleUrl {
 public:
  GoogleUrl();
  explicit GoogleUrl(StringPiece spec);

  // Resolves relative against base.  Handles absolute, scheme-relative
  // ("//host/x"), root-relative ("/x") and leaf-relative ("x") forms.
  GoogleUrl(const GoogleUrl& base, StringPiece relative);
  ~GoogleUrl();

  // Returns the same as IsAnyValid() after resetting.
  bool Reset(StringPiece new_url);
  bool Reset(const GoogleUrl& base, StringPiece relative);
  void Clear();

  // Is a valid web (HTTP or HTTPS) URL.  Most users will want this.
  bool IsWebValid() const;

  // Is a syntactically valid URL with any scheme, including data:.
  bool IsAnyValid() const { return is_valid_; }
  bool IsDataUrl() const;

  // Components; see the class comment.  All return empty pieces for
  // invalid URLs.
  StringPiece Spec() const;
  StringPiece Scheme() const;
  StringPiece Host() const;
  StringPiece HostAndPort() const;
  StringPiece Origin() const;
  StringPiece PathAndLeaf() const;
  StringPiece PathSansQuery() const;
  StringPiece PathSansLeaf() const;
  StringPiece LeafSansQuery() const;
  StringPiece Query() const;
  StringPiece AllExceptQuery() const;

  bool has_query() const { return is_valid_ && query_begin_ != npos; }

  // Returns the leaf with the extension stripped, e.g. "c" for the example
  // above.
  GoogleString ExtractFileName() const;

  bool operator==(const GoogleUrl& other) const {
    return is_valid_ == other.is_valid_ && spec_ == other.spec_;
  }
  bool operator!=(const GoogleUrl& other) const {
    return !(*this == other);
  }

 private:
  static const size_t npos = static_cast<size_t>(-1);

  // Fills in the component offsets from spec_.
  bool Parse();
  size_t LeafStartPosition() const;

  GoogleString spec_;
  bool is_valid_;
  size_t scheme_end_;   // position of the ':'
  size_t host_begin_;   // after "//" and any userinfo; npos without one
  size_t host_end_;
  size_t authority_end_;
  size_t path_end_;     // position of '?', '#' or the end
  size_t query_begin_;  // after the '?'; npos without one
  size_t query_end_;

  DISALLOW_COPY_AND_ASSIGN(GoogleUrl);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_HTTP_GOOGLE_URL_H_
