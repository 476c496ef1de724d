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

#include "edge_images/rewriter/public/rewrite_options.h"

#include <algorithm>

#include "absl/strings/str_format.h"
#include "edge_images/kernel/base/message_handler.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/base/timer.h"
#include "edge_images/kernel/http/google_url.h"
#include "edge_images/rewriter/public/configuration_source.h"
#include "edge_images/rewriter/public/provider_registry.h"

namespace edge_images {

const char RewriteOptions::kProvider[] = "edge_images_provider";
const char RewriteOptions::kMaxWidth[] = "edge_images_max_width";
const char RewriteOptions::kContentWidth[] = "edge_images_content_width";
const char RewriteOptions::kDomain[] = "edge_images_domain";
const char RewriteOptions::kImgixSubdomain[] = "edge_images_imgix_subdomain";
const char RewriteOptions::kBunnySubdomain[] = "edge_images_bunny_subdomain";
const char RewriteOptions::kImgproxyUrl[] = "edge_images_imgproxy_url";
const char RewriteOptions::kEnablePictureWrap[] =
    "edge_images_enable_picture_wrap";
const char RewriteOptions::kFeatureAvatars[] = "edge_images_feature_avatars";
const char RewriteOptions::kFeatureHtaccessCaching[] =
    "edge_images_feature_htaccess_caching";
const char RewriteOptions::kDisable[] = "edge_images_disable";
const char RewriteOptions::kQuality[] = "edge_images_quality";
const char RewriteOptions::kBreakpoints[] = "edge_images_breakpoints";
const char RewriteOptions::kExclude[] = "edge_images_exclude";
const char RewriteOptions::kCacheTtlSec[] = "edge_images_cache_ttl_sec";

const int RewriteOptions::kDefaultMaxWidth;
const int RewriteOptions::kDefaultContentWidth;
const int RewriteOptions::kDefaultQuality;
const int64 RewriteOptions::kDefaultCacheTtlSec;
const int64 RewriteOptions::kDefaultNegativeCacheTtlSec;

const char RewriteOptions::kDefaultProcessedClass[] = "edge-images-processed";
const char RewriteOptions::kDefaultContainerClass[] = "edge-images-container";

namespace {

const char* const kOptionNames[] = {
  RewriteOptions::kProvider,
  RewriteOptions::kMaxWidth,
  RewriteOptions::kContentWidth,
  RewriteOptions::kDomain,
  RewriteOptions::kImgixSubdomain,
  RewriteOptions::kBunnySubdomain,
  RewriteOptions::kImgproxyUrl,
  RewriteOptions::kEnablePictureWrap,
  RewriteOptions::kFeatureAvatars,
  RewriteOptions::kFeatureHtaccessCaching,
  RewriteOptions::kDisable,
  RewriteOptions::kQuality,
  RewriteOptions::kBreakpoints,
  RewriteOptions::kExclude,
  RewriteOptions::kCacheTtlSec,
};

struct FeatureEntry {
  RewriteOptions::Feature feature;
  const char* name;
};

const FeatureEntry kFeatureNames[] = {
  { RewriteOptions::kAvatars, "avatars" },
  { RewriteOptions::kPictureWrap, "picture_wrap" },
  { RewriteOptions::kHtaccessCaching, "htaccess_caching" },
};

// A URL setting must be empty or an absolute http(s) URL.
bool IsUsableUrlSetting(StringPiece value) {
  return value.empty() || GoogleUrl(value).IsWebValid();
}

}  // namespace

RewriteOptions::RewriteOptions(MessageHandler* handler)
    : handler_(handler),
      frozen_(false),
      max_width_(kDefaultMaxWidth),
      content_width_(kDefaultContentWidth),
      avatars_enabled_(true),
      picture_wrap_enabled_(false),
      htaccess_caching_enabled_(false),
      transformation_enabled_(true),
      processed_class_(kDefaultProcessedClass),
      container_class_(kDefaultContainerClass),
      cache_ttl_ms_(kDefaultCacheTtlSec * Timer::kSecondMs),
      negative_cache_ttl_ms_(
          kDefaultNegativeCacheTtlSec * Timer::kSecondMs) {
  default_args_.set_quality(kDefaultQuality);
  default_args_.set_fit(TransformArgs::kFitCover);
  default_args_.set_format(TransformArgs::kFormatAuto);
  default_args_.set_gravity(TransformArgs::kGravityAuto);
}

RewriteOptions::~RewriteOptions() {
}

RewriteOptions* RewriteOptions::NewFromSource(
    const ConfigurationSource& source, MessageHandler* handler) {
  RewriteOptions* options = new RewriteOptions(handler);

  GoogleString provider_name = source.GetProvider();
  ProviderId id = kProviderNone;
  if (!provider_name.empty() &&
      !ProviderRegistry::ProviderIdFromName(provider_name, &id)) {
    EI_LOG_WARN(handler, "Unknown edge provider '%s', images will not be "
                "transformed.", provider_name.c_str());
    id = kProviderNone;
  }
  ProviderConfig config;
  config.id = id;
  source.GetProviderConfig(id, &config);
  config.id = id;
  options->provider_config_ = config;

  int max_width = source.GetMaxWidth();
  if (max_width > 0) {
    options->set_max_width(max_width);
  }
  for (int i = 0, n = arraysize(kFeatureNames); i < n; ++i) {
    options->set_feature_enabled(
        kFeatureNames[i].feature,
        source.IsFeatureEnabled(kFeatureNames[i].name));
  }

  // Everything else travels by option name.  The provider fields were
  // already taken from GetProviderConfig.
  for (int i = 0, n = arraysize(kOptionNames); i < n; ++i) {
    StringPiece name(kOptionNames[i]);
    if (name == kProvider || name == kMaxWidth || name == kDomain ||
        name == kImgixSubdomain || name == kBunnySubdomain ||
        name == kImgproxyUrl) {
      continue;
    }
    GoogleString value, msg;
    if (source.GetOption(name, &value) &&
        options->SetOptionFromName(name, value, &msg) != kOptionOk) {
      EI_LOG_WARN(handler, "Ignoring setting: %s", msg.c_str());
    }
  }
  return options;
}

bool RewriteOptions::IsValidOptionName(StringPiece name) {
  for (int i = 0, n = arraysize(kOptionNames); i < n; ++i) {
    if (StringCaseEqual(name, kOptionNames[i])) {
      return true;
    }
  }
  return false;
}

RewriteOptions::OptionSettingResult RewriteOptions::SetOptionFromName(
    StringPiece name, StringPiece value, GoogleString* msg) {
  if (!IsValidOptionName(name)) {
    *msg = absl::StrFormat("Option %s not mapped.", name);
    return kOptionNameUnknown;
  }
  if (!Modifiable("SetOptionFromName")) {
    *msg = absl::StrFormat("Cannot set option %s: options are frozen.", name);
    return kOptionValueInvalid;
  }
  GoogleString error_detail;
  OptionSettingResult result =
      SetOptionFromNameInternal(name, value, &error_detail);
  if (result == kOptionValueInvalid) {
    *msg = absl::StrFormat("Cannot set option %s to %s. %s", name, value,
                           error_detail);
  }
  return result;
}

RewriteOptions::OptionSettingResult RewriteOptions::SetOptionFromNameInternal(
    StringPiece name, StringPiece value, GoogleString* error_detail) {
  value = TrimWhitespace(value);
  int int_value = 0;
  int64 int64_value = 0;
  bool bool_value = false;

  if (StringCaseEqual(name, kProvider)) {
    ProviderId id;
    if (!ProviderRegistry::ProviderIdFromName(value, &id)) {
      *error_detail = "Unknown provider.";
      return kOptionValueInvalid;
    }
    set_provider_id(id);
  } else if (StringCaseEqual(name, kMaxWidth)) {
    if (!StringToInt(value, &int_value) || int_value <= 0) {
      *error_detail = "Must be a positive integer.";
      return kOptionValueInvalid;
    }
    set_max_width(int_value);
  } else if (StringCaseEqual(name, kContentWidth)) {
    if (!StringToInt(value, &int_value) || int_value < 0) {
      *error_detail = "Must be a non-negative integer.";
      return kOptionValueInvalid;
    }
    set_content_width(int_value);
  } else if (StringCaseEqual(name, kDomain)) {
    if (!IsUsableUrlSetting(value)) {
      *error_detail = "Not an absolute http(s) URL.";
      return kOptionValueInvalid;
    }
    set_rewrite_domain(value);
  } else if (StringCaseEqual(name, kImgixSubdomain) ||
             StringCaseEqual(name, kBunnySubdomain)) {
    if (value.find_first_of("/:.") != StringPiece::npos) {
      *error_detail = "Expected a bare subdomain label.";
      return kOptionValueInvalid;
    }
    // Only the subdomain of the provider in use matters.
    set_subdomain(value);
  } else if (StringCaseEqual(name, kImgproxyUrl)) {
    if (!IsUsableUrlSetting(value)) {
      *error_detail = "Not an absolute http(s) URL.";
      return kOptionValueInvalid;
    }
    set_service_url(value);
  } else if (StringCaseEqual(name, kEnablePictureWrap) ||
             StringCaseEqual(name, kFeatureAvatars) ||
             StringCaseEqual(name, kFeatureHtaccessCaching) ||
             StringCaseEqual(name, kDisable)) {
    if (!StringToBool(value, &bool_value)) {
      *error_detail = "Expected a boolean.";
      return kOptionValueInvalid;
    }
    if (StringCaseEqual(name, kEnablePictureWrap)) {
      set_feature_enabled(kPictureWrap, bool_value);
    } else if (StringCaseEqual(name, kFeatureAvatars)) {
      set_feature_enabled(kAvatars, bool_value);
    } else if (StringCaseEqual(name, kFeatureHtaccessCaching)) {
      set_feature_enabled(kHtaccessCaching, bool_value);
    } else {
      set_transformation_enabled(!bool_value);
    }
  } else if (StringCaseEqual(name, kQuality)) {
    if (!StringToInt(value, &int_value) ||
        int_value < TransformArgs::kMinQuality ||
        int_value > TransformArgs::kMaxQuality) {
      *error_detail = "Must be an integer between 1 and 100.";
      return kOptionValueInvalid;
    }
    set_default_quality(int_value);
  } else if (StringCaseEqual(name, kBreakpoints)) {
    StringPieceVector pieces;
    SplitStringPieceToVector(value, ", ", &pieces, true);
    std::vector<int> widths;
    for (int i = 0, n = pieces.size(); i < n; ++i) {
      if (!StringToInt(pieces[i], &int_value) || int_value <= 0) {
        *error_detail = "Expected a comma-separated list of widths.";
        return kOptionValueInvalid;
      }
      widths.push_back(int_value);
    }
    set_breakpoints(widths);
  } else if (StringCaseEqual(name, kExclude)) {
    StringPieceVector pieces;
    SplitStringPieceToVector(value, ",\n", &pieces, true);
    exclusions_.clear();
    for (int i = 0, n = pieces.size(); i < n; ++i) {
      AddExclusion(pieces[i]);
    }
  } else if (StringCaseEqual(name, kCacheTtlSec)) {
    if (!StringToInt64(value, &int64_value) || int64_value <= 0) {
      *error_detail = "Must be a positive number of seconds.";
      return kOptionValueInvalid;
    }
    set_cache_ttl_ms(int64_value * Timer::kSecondMs);
  } else {
    return kOptionNameUnknown;
  }
  return kOptionOk;
}

const char* RewriteOptions::FeatureName(Feature feature) {
  for (int i = 0, n = arraysize(kFeatureNames); i < n; ++i) {
    if (kFeatureNames[i].feature == feature) {
      return kFeatureNames[i].name;
    }
  }
  return "unknown";
}

bool RewriteOptions::ParseFeature(StringPiece name, Feature* feature) {
  for (int i = 0, n = arraysize(kFeatureNames); i < n; ++i) {
    if (StringCaseEqual(name, kFeatureNames[i].name)) {
      *feature = kFeatureNames[i].feature;
      return true;
    }
  }
  return false;
}

RewriteOptions* RewriteOptions::Clone() const {
  RewriteOptions* options = new RewriteOptions(handler_);
  options->provider_config_ = provider_config_;
  options->max_width_ = max_width_;
  options->content_width_ = content_width_;
  options->default_args_ = default_args_;
  options->breakpoints_ = breakpoints_;
  options->exclusions_ = exclusions_;
  options->avatars_enabled_ = avatars_enabled_;
  options->picture_wrap_enabled_ = picture_wrap_enabled_;
  options->htaccess_caching_enabled_ = htaccess_caching_enabled_;
  options->transformation_enabled_ = transformation_enabled_;
  options->processed_class_ = processed_class_;
  options->container_class_ = container_class_;
  options->cache_ttl_ms_ = cache_ttl_ms_;
  options->negative_cache_ttl_ms_ = negative_cache_ttl_ms_;
  return options;
}

bool RewriteOptions::Modifiable(const char* what) {
  if (frozen_) {
    EI_LOG_DFATAL(handler_, "Attempt to modify frozen RewriteOptions: %s",
                  what);
    return false;
  }
  return true;
}

void RewriteOptions::set_provider_id(ProviderId id) {
  if (Modifiable("provider")) {
    provider_config_.id = id;
  }
}

void RewriteOptions::set_rewrite_domain(StringPiece domain) {
  if (Modifiable("rewrite_domain")) {
    provider_config_.rewrite_domain = GoogleString(domain);
  }
}

void RewriteOptions::set_subdomain(StringPiece subdomain) {
  if (Modifiable("subdomain")) {
    provider_config_.subdomain = GoogleString(subdomain);
  }
}

void RewriteOptions::set_service_url(StringPiece url) {
  if (Modifiable("service_url")) {
    provider_config_.service_url = GoogleString(url);
  }
}

void RewriteOptions::set_max_width(int x) {
  if (Modifiable("max_width")) {
    max_width_ = x;
  }
}

void RewriteOptions::set_content_width(int x) {
  if (Modifiable("content_width")) {
    content_width_ = x;
  }
}

void RewriteOptions::set_default_quality(int x) {
  if (Modifiable("quality")) {
    default_args_.set_quality(x);
  }
}

void RewriteOptions::set_default_fit(TransformArgs::Fit x) {
  if (Modifiable("fit")) {
    default_args_.set_fit(x);
  }
}

void RewriteOptions::set_default_format(TransformArgs::Format x) {
  if (Modifiable("format")) {
    default_args_.set_format(x);
  }
}

void RewriteOptions::set_default_gravity(TransformArgs::Gravity x) {
  if (Modifiable("gravity")) {
    default_args_.set_gravity(x);
  }
}

void RewriteOptions::set_breakpoints(const std::vector<int>& widths) {
  if (Modifiable("breakpoints")) {
    breakpoints_.clear();
    for (int i = 0, n = widths.size(); i < n; ++i) {
      if (widths[i] > 0) {
        breakpoints_.push_back(widths[i]);
      }
    }
    std::sort(breakpoints_.begin(), breakpoints_.end());
    breakpoints_.erase(std::unique(breakpoints_.begin(), breakpoints_.end()),
                       breakpoints_.end());
  }
}

void RewriteOptions::AddExclusion(StringPiece substring) {
  substring = TrimWhitespace(substring);
  if (!substring.empty() && Modifiable("exclusions")) {
    exclusions_.push_back(GoogleString(substring));
  }
}

bool RewriteOptions::IsExcluded(StringPiece url) const {
  for (int i = 0, n = exclusions_.size(); i < n; ++i) {
    if (url.find(exclusions_[i]) != StringPiece::npos) {
      return true;
    }
  }
  return false;
}

bool RewriteOptions::FeatureEnabled(Feature feature) const {
  switch (feature) {
    case kAvatars:         return avatars_enabled_;
    case kPictureWrap:     return picture_wrap_enabled_;
    case kHtaccessCaching: return htaccess_caching_enabled_;
  }
  return false;
}

void RewriteOptions::set_feature_enabled(Feature feature, bool enabled) {
  if (!Modifiable(FeatureName(feature))) {
    return;
  }
  switch (feature) {
    case kAvatars:
      avatars_enabled_ = enabled;
      break;
    case kPictureWrap:
      picture_wrap_enabled_ = enabled;
      break;
    case kHtaccessCaching:
      htaccess_caching_enabled_ = enabled;
      break;
  }
}

void RewriteOptions::set_transformation_enabled(bool x) {
  if (Modifiable("transformation_enabled")) {
    transformation_enabled_ = x;
  }
}

void RewriteOptions::set_processed_class(StringPiece x) {
  if (Modifiable("processed_class")) {
    processed_class_ = GoogleString(x);
  }
}

void RewriteOptions::set_container_class(StringPiece x) {
  if (Modifiable("container_class")) {
    container_class_ = GoogleString(x);
  }
}

void RewriteOptions::set_cache_ttl_ms(int64 x) {
  if (Modifiable("cache_ttl_ms")) {
    cache_ttl_ms_ = x;
  }
}

void RewriteOptions::set_negative_cache_ttl_ms(int64 x) {
  if (Modifiable("negative_cache_ttl_ms")) {
    negative_cache_ttl_ms_ = x;
  }
}

GoogleString RewriteOptions::OptionsToString() const {
  GoogleString out;
  StrAppend(&out, kProvider, ": ",
            ProviderRegistry::ProviderIdName(provider_config_.id), "\n");
  StrAppend(&out, kDomain, ": ", provider_config_.rewrite_domain, "\n");
  StrAppend(&out, "subdomain: ", provider_config_.subdomain, "\n");
  StrAppend(&out, kImgproxyUrl, ": ", provider_config_.service_url, "\n");
  StrAppend(&out, kMaxWidth, ": ", max_width_, "\n");
  StrAppend(&out, kContentWidth, ": ", content_width_, "\n");
  StrAppend(&out, "defaults: ", default_args_.CanonicalString(), "\n");
  StrAppend(&out, kBreakpoints, ": ", JoinCollection(breakpoints_, ","),
            "\n");
  StrAppend(&out, kExclude, ": ", JoinCollection(exclusions_, ","), "\n");
  for (int i = 0, n = arraysize(kFeatureNames); i < n; ++i) {
    StrAppend(&out, "feature ", kFeatureNames[i].name, ": ",
              BoolToString(FeatureEnabled(kFeatureNames[i].feature)), "\n");
  }
  StrAppend(&out, "transformation_enabled: ",
            BoolToString(transformation_enabled_), "\n");
  StrAppend(&out, kCacheTtlSec, ": ", cache_ttl_ms_ / Timer::kSecondMs,
            "\n");
  return out;
}

}  // namespace edge_images
