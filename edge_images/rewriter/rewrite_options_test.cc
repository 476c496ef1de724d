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

#include <map>
#include <memory>
#include <vector>

#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/mock_message_handler.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/timer.h"
#include "edge_images/rewriter/public/configuration_source.h"
#include "edge_images/rewriter/public/feature_gate.h"

namespace edge_images {

namespace {

// Settings store backed by a map of option names.
class MapConfigurationSource : public ConfigurationSource {
 public:
  MapConfigurationSource() : max_width_(0) {}
  virtual ~MapConfigurationSource() {}

  virtual GoogleString GetProvider() const { return provider_; }
  virtual void GetProviderConfig(ProviderId id,
                                 ProviderConfig* config) const {
    config->rewrite_domain = domain_;
    config->subdomain = subdomain_;
  }
  virtual int GetMaxWidth() const { return max_width_; }
  virtual bool IsFeatureEnabled(StringPiece name) const {
    return features_.find(GoogleString(name)) != features_.end();
  }
  virtual bool GetOption(StringPiece name, GoogleString* value) const {
    StringStringMap::const_iterator p = options_.find(GoogleString(name));
    if (p == options_.end()) {
      return false;
    }
    *value = p->second;
    return true;
  }

  GoogleString provider_;
  GoogleString domain_;
  GoogleString subdomain_;
  int max_width_;
  StringSet features_;
  StringStringMap options_;

 private:
  DISALLOW_COPY_AND_ASSIGN(MapConfigurationSource);
};

class RewriteOptionsTest : public testing::Test {
 protected:
  RewriteOptionsTest() : options_(&handler_) {}

  RewriteOptions::OptionSettingResult Set(StringPiece name,
                                          StringPiece value) {
    msg_.clear();
    return options_.SetOptionFromName(name, value, &msg_);
  }

  MockMessageHandler handler_;
  RewriteOptions options_;
  GoogleString msg_;

 private:
  DISALLOW_COPY_AND_ASSIGN(RewriteOptionsTest);
};

TEST_F(RewriteOptionsTest, Defaults) {
  EXPECT_EQ(kProviderNone, options_.provider_id());
  EXPECT_EQ(800, options_.max_width());
  EXPECT_EQ(0, options_.content_width());
  EXPECT_EQ(85, options_.default_args().quality());
  EXPECT_EQ(TransformArgs::kFitCover, options_.default_args().fit());
  EXPECT_EQ(TransformArgs::kFormatAuto, options_.default_args().format());
  EXPECT_EQ(TransformArgs::kGravityAuto, options_.default_args().gravity());
  EXPECT_TRUE(options_.breakpoints().empty());
  EXPECT_TRUE(options_.FeatureEnabled(RewriteOptions::kAvatars));
  EXPECT_FALSE(options_.FeatureEnabled(RewriteOptions::kPictureWrap));
  EXPECT_FALSE(options_.FeatureEnabled(RewriteOptions::kHtaccessCaching));
  EXPECT_TRUE(options_.transformation_enabled());
  EXPECT_EQ("edge-images-processed", options_.processed_class());
  EXPECT_EQ("edge-images-container", options_.container_class());
  EXPECT_EQ(3600 * Timer::kSecondMs, options_.cache_ttl_ms());
}

TEST_F(RewriteOptionsTest, SetOptionFromName) {
  EXPECT_EQ(RewriteOptions::kOptionOk, Set("edge_images_provider", "imgix"));
  EXPECT_EQ(kProviderImgix, options_.provider_id());
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_imgix_subdomain", "acme"));
  EXPECT_EQ("acme", options_.provider_config().subdomain);
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_max_width", " 1200 "));
  EXPECT_EQ(1200, options_.max_width());
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_content_width", "640"));
  EXPECT_EQ(640, options_.content_width());
  EXPECT_EQ(RewriteOptions::kOptionOk, Set("edge_images_quality", "70"));
  EXPECT_EQ(70, options_.default_args().quality());
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_enable_picture_wrap", "on"));
  EXPECT_TRUE(options_.FeatureEnabled(RewriteOptions::kPictureWrap));
  EXPECT_EQ(RewriteOptions::kOptionOk, Set("edge_images_disable", "true"));
  EXPECT_FALSE(options_.transformation_enabled());
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_cache_ttl_sec", "60"));
  EXPECT_EQ(60 * Timer::kSecondMs, options_.cache_ttl_ms());
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_domain", "https://cdn.site.test"));
  EXPECT_EQ("https://cdn.site.test",
            options_.provider_config().rewrite_domain);
}

TEST_F(RewriteOptionsTest, Breakpoints) {
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_breakpoints", "1024, 320,640,320"));
  std::vector<int> expected;
  expected.push_back(320);
  expected.push_back(640);
  expected.push_back(1024);
  EXPECT_EQ(expected, options_.breakpoints());
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_breakpoints", "320,big"));
  EXPECT_EQ(expected, options_.breakpoints());
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_breakpoints", "0,400"));
  EXPECT_EQ(expected, options_.breakpoints());

  // Widths that are not positive are dropped.
  std::vector<int> widths;
  widths.push_back(0);
  widths.push_back(-5);
  widths.push_back(400);
  widths.push_back(400);
  options_.set_breakpoints(widths);
  ASSERT_EQ(static_cast<size_t>(1), options_.breakpoints().size());
  EXPECT_EQ(400, options_.breakpoints()[0]);
}

TEST_F(RewriteOptionsTest, Exclusions) {
  EXPECT_EQ(RewriteOptions::kOptionOk,
            Set("edge_images_exclude", "/logos/, hero.png\n,"));
  ASSERT_EQ(static_cast<size_t>(2), options_.exclusions().size());
  EXPECT_TRUE(options_.IsExcluded("https://site.test/logos/a.png"));
  EXPECT_TRUE(options_.IsExcluded("/img/hero.png"));
  EXPECT_FALSE(options_.IsExcluded("/img/a.png"));
}

TEST_F(RewriteOptionsTest, InvalidValues) {
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_provider", "fastly"));
  EXPECT_HAS_SUBSTR("edge_images_provider", msg_);
  EXPECT_EQ(kProviderNone, options_.provider_id());
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_max_width", "-5"));
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_quality", "101"));
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_enable_picture_wrap", "maybe"));
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_imgproxy_url", "not a url"));
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_bunny_subdomain", "zone.b-cdn.net"));
  EXPECT_EQ(800, options_.max_width());
  EXPECT_EQ(85, options_.default_args().quality());
}

TEST_F(RewriteOptionsTest, UnknownName) {
  EXPECT_EQ(RewriteOptions::kOptionNameUnknown,
            Set("edge_images_lazy_load", "true"));
  EXPECT_HAS_SUBSTR("not mapped", msg_);
  EXPECT_TRUE(RewriteOptions::IsValidOptionName("EDGE_IMAGES_QUALITY"));
}

TEST_F(RewriteOptionsTest, FrozenIgnoresWrites) {
  options_.Freeze();
  options_.set_max_width(100);
  EXPECT_EQ(800, options_.max_width());
  EXPECT_EQ(1, handler_.SeriousMessages());
  EXPECT_EQ(RewriteOptions::kOptionValueInvalid,
            Set("edge_images_quality", "50"));
  EXPECT_EQ(85, options_.default_args().quality());

  std::unique_ptr<RewriteOptions> clone(options_.Clone());
  EXPECT_FALSE(clone->frozen());
  clone->set_max_width(100);
  EXPECT_EQ(100, clone->max_width());
}

TEST_F(RewriteOptionsTest, FeatureNames) {
  RewriteOptions::Feature feature = RewriteOptions::kAvatars;
  ASSERT_TRUE(RewriteOptions::ParseFeature("picture_wrap", &feature));
  EXPECT_EQ(RewriteOptions::kPictureWrap, feature);
  EXPECT_STREQ("htaccess_caching",
               RewriteOptions::FeatureName(RewriteOptions::kHtaccessCaching));
  EXPECT_FALSE(RewriteOptions::ParseFeature("comments", &feature));
}

TEST_F(RewriteOptionsTest, NewFromSource) {
  MapConfigurationSource source;
  source.provider_ = "bunny";
  source.subdomain_ = "zone";
  source.max_width_ = 1000;
  source.features_.insert("avatars");
  source.features_.insert("picture_wrap");
  source.options_["edge_images_quality"] = "60";
  source.options_["edge_images_content_width"] = "bogus";

  std::unique_ptr<RewriteOptions> options(
      RewriteOptions::NewFromSource(source, &handler_));
  EXPECT_EQ(kProviderBunny, options->provider_id());
  EXPECT_EQ("zone", options->provider_config().subdomain);
  EXPECT_EQ(1000, options->max_width());
  EXPECT_EQ(60, options->default_args().quality());
  EXPECT_EQ(0, options->content_width());
  EXPECT_TRUE(options->FeatureEnabled(RewriteOptions::kPictureWrap));
  EXPECT_FALSE(options->FeatureEnabled(RewriteOptions::kHtaccessCaching));
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));
}

TEST_F(RewriteOptionsTest, NewFromSourceUnknownProvider) {
  MapConfigurationSource source;
  source.provider_ = "fastly";
  std::unique_ptr<RewriteOptions> options(
      RewriteOptions::NewFromSource(source, &handler_));
  EXPECT_EQ(kProviderNone, options->provider_id());
  EXPECT_EQ(800, options->max_width());
  EXPECT_FALSE(options->FeatureEnabled(RewriteOptions::kAvatars));
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));
}

class FeatureGateTest : public RewriteOptionsTest {
};

TEST_F(FeatureGateTest, ProviderMustBeChosenAndConfigured) {
  {
    FeatureGate gate(&options_);
    EXPECT_TRUE(gate.ProviderConfigured());
    EXPECT_FALSE(gate.ShouldTransform());
  }
  options_.set_provider_id(kProviderImgix);
  {
    FeatureGate gate(&options_);
    EXPECT_FALSE(gate.ProviderConfigured());
    EXPECT_FALSE(gate.ShouldTransform());
  }
  options_.set_subdomain("acme");
  {
    FeatureGate gate(&options_);
    EXPECT_TRUE(gate.ProviderConfigured());
    EXPECT_TRUE(gate.ShouldTransform());
  }
  options_.set_transformation_enabled(false);
  FeatureGate gate(&options_);
  EXPECT_FALSE(gate.TransformationGloballyEnabled());
  EXPECT_FALSE(gate.ShouldTransform());
}

TEST_F(FeatureGateTest, Features) {
  options_.set_feature_enabled(RewriteOptions::kPictureWrap, true);
  options_.set_feature_enabled(RewriteOptions::kAvatars, false);
  FeatureGate gate(&options_);
  EXPECT_TRUE(gate.PictureWrapEnabled());
  EXPECT_FALSE(gate.FeatureEnabled(RewriteOptions::kAvatars));
  // Asking twice changes nothing.
  EXPECT_TRUE(gate.PictureWrapEnabled());
}

TEST_F(FeatureGateTest, ShouldTransformUrl) {
  options_.AddExclusion("/no-cdn/");
  FeatureGate gate(&options_);
  EXPECT_TRUE(gate.ShouldTransformUrl("https://site.test/a.jpg"));
  EXPECT_TRUE(gate.ShouldTransformUrl("/a.jpg?x=svg"));
  EXPECT_FALSE(gate.ShouldTransformUrl("https://site.test/logo.SVG"));
  EXPECT_FALSE(gate.ShouldTransformUrl("data:image/png;base64,AAAA"));
  EXPECT_FALSE(gate.ShouldTransformUrl("https://site.test/no-cdn/a.jpg"));
  EXPECT_FALSE(gate.ShouldTransformUrl("  "));
}

}  // namespace

}  // namespace edge_images
