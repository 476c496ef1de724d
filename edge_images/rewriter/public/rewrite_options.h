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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_REWRITE_OPTIONS_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_REWRITE_OPTIONS_H_

#include <vector>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/provider_config.h"
#include "edge_images/rewriter/public/transform_args.h"

namespace edge_images {

class ConfigurationSource;
class MessageHandler;

// Configuration snapshot for one ImageRewriteEngine.  Options are set
// while the snapshot is built, then Freeze() makes it read-only so that it
// can be shared between threads without locking.
class RewriteOptions {
 public:
  // Features that can be opted out of individually.
  enum Feature {
    kAvatars,
    kPictureWrap,
    kHtaccessCaching,
  };

  // Used for return value of SetOptionFromName.
  enum OptionSettingResult {
    kOptionOk,
    kOptionNameUnknown,
    kOptionValueInvalid,
  };

  // Option names, as kept in the settings store.
  static const char kProvider[];
  static const char kMaxWidth[];
  static const char kContentWidth[];
  static const char kDomain[];
  static const char kImgixSubdomain[];
  static const char kBunnySubdomain[];
  static const char kImgproxyUrl[];
  static const char kEnablePictureWrap[];
  static const char kFeatureAvatars[];
  static const char kFeatureHtaccessCaching[];
  static const char kDisable[];
  static const char kQuality[];
  static const char kBreakpoints[];
  static const char kExclude[];
  static const char kCacheTtlSec[];

  static const int kDefaultMaxWidth = 800;
  // No content width: only max_width bounds content images.
  static const int kDefaultContentWidth = 0;
  static const int kDefaultQuality = 85;
  static const int64 kDefaultCacheTtlSec = 3600;
  static const int64 kDefaultNegativeCacheTtlSec = 300;
  static const char kDefaultProcessedClass[];
  static const char kDefaultContainerClass[];

  // handler receives complaints about writes to a frozen snapshot and
  // about unusable settings in NewFromSource.  Not owned.
  explicit RewriteOptions(MessageHandler* handler);
  ~RewriteOptions();

  // Builds a snapshot from the settings store.  Unknown provider names
  // fall back to kProviderNone with a warning; invalid settings are
  // logged and ignored.  The result is not frozen.  Caller owns it.
  static RewriteOptions* NewFromSource(const ConfigurationSource& source,
                                       MessageHandler* handler);

  static bool IsValidOptionName(StringPiece name);

  // Sets the option called name from its string form.  On failure *msg
  // describes the problem and the option keeps its value.
  OptionSettingResult SetOptionFromName(StringPiece name, StringPiece value,
                                        GoogleString* msg);

  static const char* FeatureName(Feature feature);
  static bool ParseFeature(StringPiece name, Feature* feature);

  // Returns an unfrozen copy.  Caller owns it.
  RewriteOptions* Clone() const;

  void Freeze() { frozen_ = true; }
  bool frozen() const { return frozen_; }

  ProviderId provider_id() const { return provider_config_.id; }
  const ProviderConfig& provider_config() const { return provider_config_; }
  void set_provider_id(ProviderId id);
  void set_rewrite_domain(StringPiece domain);
  void set_subdomain(StringPiece subdomain);
  void set_service_url(StringPiece url);

  int max_width() const { return max_width_; }
  void set_max_width(int x);

  // 0 turns the content-width constraint off.
  int content_width() const { return content_width_; }
  void set_content_width(int x);

  // Global defaults: quality, fit, format, gravity.
  const TransformArgs& default_args() const { return default_args_; }
  void set_default_quality(int x);
  void set_default_fit(TransformArgs::Fit x);
  void set_default_format(TransformArgs::Format x);
  void set_default_gravity(TransformArgs::Gravity x);

  // Explicit srcset widths.  Empty means widths are derived from the
  // target width.
  const std::vector<int>& breakpoints() const { return breakpoints_; }
  void set_breakpoints(const std::vector<int>& widths);

  // URLs containing any of these substrings are left alone.
  const StringVector& exclusions() const { return exclusions_; }
  void AddExclusion(StringPiece substring);
  bool IsExcluded(StringPiece url) const;

  bool FeatureEnabled(Feature feature) const;
  void set_feature_enabled(Feature feature, bool enabled);

  // The master switch.
  bool transformation_enabled() const { return transformation_enabled_; }
  void set_transformation_enabled(bool x);

  const GoogleString& processed_class() const { return processed_class_; }
  void set_processed_class(StringPiece x);
  const GoogleString& container_class() const { return container_class_; }
  void set_container_class(StringPiece x);

  int64 cache_ttl_ms() const { return cache_ttl_ms_; }
  void set_cache_ttl_ms(int64 x);
  int64 negative_cache_ttl_ms() const { return negative_cache_ttl_ms_; }
  void set_negative_cache_ttl_ms(int64 x);

  // Debugging aid: every option in "name: value" form, one per line.
  GoogleString OptionsToString() const;

 private:
  // Returns false, after complaining, when the snapshot is frozen.
  bool Modifiable(const char* what);

  OptionSettingResult SetOptionFromNameInternal(StringPiece name,
                                                StringPiece value,
                                                GoogleString* error_detail);

  MessageHandler* handler_;
  bool frozen_;

  ProviderConfig provider_config_;
  int max_width_;
  int content_width_;
  TransformArgs default_args_;
  std::vector<int> breakpoints_;
  StringVector exclusions_;
  bool avatars_enabled_;
  bool picture_wrap_enabled_;
  bool htaccess_caching_enabled_;
  bool transformation_enabled_;
  GoogleString processed_class_;
  GoogleString container_class_;
  int64 cache_ttl_ms_;
  int64 negative_cache_ttl_ms_;

  DISALLOW_COPY_AND_ASSIGN(RewriteOptions);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_REWRITE_OPTIONS_H_
