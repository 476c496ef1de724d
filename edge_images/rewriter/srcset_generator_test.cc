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

#include "edge_images/rewriter/public/srcset_generator.h"

#include <memory>
#include <vector>

#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/md5_hasher.h"
#include "edge_images/kernel/base/mock_message_handler.h"
#include "edge_images/kernel/base/mock_timer.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/base/timer.h"
#include "edge_images/kernel/cache/lru_cache.h"
#include "edge_images/rewriter/public/edge_provider.h"
#include "edge_images/rewriter/public/image_ref.h"
#include "edge_images/rewriter/public/provider_registry.h"
#include "edge_images/rewriter/public/rewrite_options.h"
#include "edge_images/rewriter/public/transform_args.h"
#include "edge_images/rewriter/public/transform_cache.h"

namespace edge_images {

namespace {

const char kSource[] = "https://site.test/a.jpg";
const char kEdge[] = "https://site.test/cdn-cgi/image/";

class SrcsetGeneratorTest : public testing::Test {
 protected:
  SrcsetGeneratorTest()
      : options_(&handler_),
        lru_cache_(100000),
        timer_(MockTimer::kApr_5_2010_ms),
        cache_(&lru_cache_, &hasher_, &timer_, &handler_,
               10 * Timer::kMinuteMs) {
    options_.set_max_width(650);
    UseProvider(kProviderCloudflare);
  }

  void UseProvider(ProviderId id) {
    ProviderConfig config;
    config.id = id;
    UseConfig(config);
  }

  void UseConfig(const ProviderConfig& config) {
    provider_.reset(ProviderRegistry::NewProvider(config));
    generator_.reset(new SrcsetGenerator(&options_, provider_.get(), &cache_));
  }

  std::vector<int> Widths(int ceiling) {
    std::vector<int> widths;
    generator_->CandidateWidths(ceiling, &widths);
    return widths;
  }

  // What the resolver hands over for a 1600x900 content image.
  TransformArgs ContentArgs() {
    TransformArgs args;
    args.set_width(650);
    args.set_height(366);
    args.set_fit(TransformArgs::kFitCover);
    args.set_format(TransformArgs::kFormatAuto);
    args.set_quality(85);
    args.set_gravity(TransformArgs::kGravityAuto);
    return args;
  }

  MockMessageHandler handler_;
  RewriteOptions options_;
  LRUCache lru_cache_;
  MD5Hasher hasher_;
  MockTimer timer_;
  TransformCache cache_;
  std::unique_ptr<EdgeProvider> provider_;
  std::unique_ptr<SrcsetGenerator> generator_;

 private:
  DISALLOW_COPY_AND_ASSIGN(SrcsetGeneratorTest);
};

TEST_F(SrcsetGeneratorTest, CandidateWidthsSkipDoubles) {
  std::vector<int> widths = Widths(650);
  ASSERT_EQ(static_cast<size_t>(2), widths.size());
  EXPECT_EQ(300, widths[0]);
  EXPECT_EQ(650, widths[1]);

  // 600 is dropped because 1200 is offered.
  widths = Widths(1200);
  ASSERT_EQ(static_cast<size_t>(2), widths.size());
  EXPECT_EQ(300, widths[0]);
  EXPECT_EQ(1200, widths[1]);

  widths = Widths(96);
  ASSERT_EQ(static_cast<size_t>(1), widths.size());
  EXPECT_EQ(96, widths[0]);

  EXPECT_TRUE(Widths(0).empty());
}

TEST_F(SrcsetGeneratorTest, CandidateWidthsAscendAndNeverExceedCeiling) {
  const int kCeilings[] = { 150, 299, 301, 800, 1600, 3000 };
  for (int i = 0; i < static_cast<int>(arraysize(kCeilings)); ++i) {
    std::vector<int> widths = Widths(kCeilings[i]);
    ASSERT_FALSE(widths.empty());
    EXPECT_EQ(kCeilings[i], widths.back());
    for (int j = 1, n = widths.size(); j < n; ++j) {
      EXPECT_LT(widths[j - 1], widths[j]);
      EXPECT_NE(2 * widths[j - 1], widths[j]);
    }
  }
}

TEST_F(SrcsetGeneratorTest, Breakpoints) {
  std::vector<int> breakpoints;
  breakpoints.push_back(200);
  breakpoints.push_back(640);
  breakpoints.push_back(1024);
  breakpoints.push_back(2000);
  options_.set_breakpoints(breakpoints);

  // Configured widths are not subject to the minimum.
  std::vector<int> widths = Widths(800);
  ASSERT_EQ(static_cast<size_t>(3), widths.size());
  EXPECT_EQ(200, widths[0]);
  EXPECT_EQ(640, widths[1]);
  EXPECT_EQ(800, widths[2]);

  // 320 is dropped because 640 is offered.
  breakpoints.clear();
  breakpoints.push_back(320);
  breakpoints.push_back(640);
  options_.set_breakpoints(breakpoints);
  widths = Widths(800);
  ASSERT_EQ(static_cast<size_t>(2), widths.size());
  EXPECT_EQ(640, widths[0]);
  EXPECT_EQ(800, widths[1]);
}

TEST_F(SrcsetGeneratorTest, BreakpointsArePositive) {
  std::vector<int> breakpoints;
  breakpoints.push_back(0);
  breakpoints.push_back(-100);
  breakpoints.push_back(400);
  options_.set_breakpoints(breakpoints);
  std::vector<int> widths = Widths(650);
  ASSERT_EQ(static_cast<size_t>(2), widths.size());
  EXPECT_EQ(400, widths[0]);
  EXPECT_EQ(650, widths[1]);
}

TEST_F(SrcsetGeneratorTest, ResponsiveSrcset) {
  SrcsetResult result;
  ASSERT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource, 1600, 900), ContentArgs(),
                                 "", false, &result));
  ASSERT_EQ(static_cast<size_t>(2), result.candidates.size());
  EXPECT_EQ("300w", result.candidates[0].descriptor);
  EXPECT_EQ("650w", result.candidates[1].descriptor);
  EXPECT_EQ(StrCat(kEdge, "fit=cover%2Cformat=auto%2Cgravity=auto%2Cheight=169"
                   "%2Cquality=85%2Cwidth=300/a.jpg 300w, ",
                   kEdge, "fit=cover%2Cformat=auto%2Cgravity=auto%2Cheight=366"
                   "%2Cquality=85%2Cwidth=650/a.jpg 650w"),
            result.srcset);
  EXPECT_EQ("(max-width: 650px) 100vw, 650px", result.sizes);
  EXPECT_EQ(650, result.ceiling);
}

TEST_F(SrcsetGeneratorTest, SizesHint) {
  SrcsetResult result;
  ASSERT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource, 1600, 900), ContentArgs(),
                                 "50vw", false, &result));
  EXPECT_EQ("50vw", result.sizes);
}

TEST_F(SrcsetGeneratorTest, CeilingIsIntrinsicWidth) {
  SrcsetResult result;
  TransformArgs args;
  args.set_width(400);
  ASSERT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource, 320, 240), args, "", false,
                                 &result));
  EXPECT_EQ(320, result.ceiling);
  ASSERT_EQ(static_cast<size_t>(2), result.candidates.size());
  EXPECT_EQ("300w", result.candidates[0].descriptor);
  EXPECT_EQ("320w", result.candidates[1].descriptor);
}

TEST_F(SrcsetGeneratorTest, FixedContextGetsOneDensityCandidate) {
  TransformArgs args;
  args.set_width(96);
  args.set_height(96);
  SrcsetResult result;
  ASSERT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource, 512, 512), args, "96px",
                                 true, &result));
  ASSERT_EQ(static_cast<size_t>(1), result.candidates.size());
  EXPECT_EQ("2x", result.candidates[0].descriptor);
  EXPECT_EQ(StrCat(kEdge, "dpr=2%2Cheight=96%2Cwidth=96/a.jpg 2x"),
            result.srcset);
  EXPECT_EQ("96px", result.sizes);
  EXPECT_EQ(96, result.ceiling);
}

TEST_F(SrcsetGeneratorTest, UnknownDimensionsGiveNoSrcset) {
  SrcsetResult result;
  result.srcset = "stale";
  EXPECT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource), ContentArgs(), "", false,
                                 &result));
  EXPECT_TRUE(result.candidates.empty());
  EXPECT_TRUE(result.srcset.empty());
  EXPECT_TRUE(result.sizes.empty());
}

TEST_F(SrcsetGeneratorTest, NonPositiveCeiling) {
  TransformArgs args;
  args.set_width(0);
  SrcsetResult result;
  EXPECT_EQ(kInvalidDimensions,
            generator_->Generate(ImageRef(kSource, 1600, 900), args, "",
                                 false, &result));
  EXPECT_TRUE(result.srcset.empty());
}

TEST_F(SrcsetGeneratorTest, ProviderFailureClearsResult) {
  UseProvider(kProviderImgix);
  SrcsetResult result;
  EXPECT_EQ(kProviderMisconfigured,
            generator_->Generate(ImageRef(kSource, 1600, 900), ContentArgs(),
                                 "", false, &result));
  EXPECT_TRUE(result.candidates.empty());
  EXPECT_TRUE(result.srcset.empty());

  // The remembered failure reports the same status.
  EXPECT_EQ(kProviderMisconfigured,
            generator_->Generate(ImageRef(kSource, 1600, 900), ContentArgs(),
                                 "", false, &result));
}

TEST_F(SrcsetGeneratorTest, IdenticalUrlsCollapse) {
  UseProvider(kProviderNone);
  SrcsetResult result;
  ASSERT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource, 1600, 900), ContentArgs(),
                                 "", false, &result));
  ASSERT_EQ(static_cast<size_t>(1), result.candidates.size());
  EXPECT_EQ(StrCat(kSource, " 300w"), result.srcset);
}

TEST_F(SrcsetGeneratorTest, ProviderSettingsAreKeyed) {
  ImageRef image(kSource, 1600, 900);
  ProviderConfig config;
  config.id = kProviderImgix;
  config.subdomain = "before";
  UseConfig(config);
  GoogleString url;
  ASSERT_EQ(kTransformOk,
            generator_->BuildUrl(image, ContentArgs(), "content", &url));
  EXPECT_TRUE(HasPrefixString(url, "https://before.imgix.net/")) << url;

  config.subdomain = "after";
  UseConfig(config);
  ASSERT_EQ(kTransformOk,
            generator_->BuildUrl(image, ContentArgs(), "content", &url));
  EXPECT_TRUE(HasPrefixString(url, "https://after.imgix.net/")) << url;

  config.id = kProviderCloudflare;
  config.rewrite_domain = "https://cdn.site.test";
  UseConfig(config);
  ASSERT_EQ(kTransformOk,
            generator_->BuildUrl(image, ContentArgs(), "content", &url));
  EXPECT_TRUE(HasPrefixString(url, "https://cdn.site.test/cdn-cgi/")) << url;
  EXPECT_EQ(3, cache_.misses());
  EXPECT_EQ(0, cache_.hits());
}

TEST_F(SrcsetGeneratorTest, UrlsAreCached) {
  SrcsetResult first, second;
  ASSERT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource, 1600, 900), ContentArgs(),
                                 "", false, &first));
  EXPECT_EQ(2, cache_.misses());
  EXPECT_EQ(0, cache_.hits());
  ASSERT_EQ(kTransformOk,
            generator_->Generate(ImageRef(kSource, 1600, 900), ContentArgs(),
                                 "", false, &second));
  EXPECT_EQ(2, cache_.misses());
  EXPECT_EQ(2, cache_.hits());
  EXPECT_EQ(first.srcset, second.srcset);
}

TEST_F(SrcsetGeneratorTest, WorksWithoutCache) {
  SrcsetGenerator uncached(&options_, provider_.get(), NULL);
  SrcsetResult result;
  ASSERT_EQ(kTransformOk,
            uncached.Generate(ImageRef(kSource, 1600, 900), ContentArgs(), "",
                              false, &result));
  EXPECT_EQ(static_cast<size_t>(2), result.candidates.size());
  EXPECT_EQ(0, cache_.misses());
}

}  // namespace

}  // namespace edge_images
