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

#include "edge_images/rewriter/public/transform_args_resolver.h"

#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/mock_message_handler.h"
#include "edge_images/rewriter/public/rewrite_options.h"

namespace edge_images {

namespace {

class TransformArgsResolverTest : public testing::Test {
 protected:
  TransformArgsResolverTest()
      : options_(&handler_),
        resolver_(&options_) {
  }

  // Resolves and checks for success.
  TransformArgs Resolve(ImageContext context, const TransformArgs& caller,
                        int width, int height) {
    TransformArgs out;
    EXPECT_EQ(kTransformOk,
              resolver_.Resolve(context, caller, width, height, &out));
    return out;
  }

  MockMessageHandler handler_;
  RewriteOptions options_;
  TransformArgsResolver resolver_;

 private:
  DISALLOW_COPY_AND_ASSIGN(TransformArgsResolverTest);
};

TEST_F(TransformArgsResolverTest, FullyPopulatedFromDefaults) {
  options_.set_max_width(650);
  TransformArgs args = Resolve(kContentContext, TransformArgs(), 1600, 900);
  EXPECT_EQ(650, args.width());
  EXPECT_EQ(366, args.height());
  EXPECT_EQ(TransformArgs::kFitCover, args.fit());
  EXPECT_EQ(TransformArgs::kFormatAuto, args.format());
  EXPECT_EQ(85, args.quality());
  EXPECT_EQ(TransformArgs::kGravityAuto, args.gravity());
  ASSERT_TRUE(args.has_dpr());
  EXPECT_EQ(1.0, args.dpr());
  EXPECT_FALSE(args.has_sharpen());
}

TEST_F(TransformArgsResolverTest, ContentWidthConstraint) {
  options_.set_content_width(600);
  TransformArgs args = Resolve(kContentContext, TransformArgs(), 1600, 900);
  EXPECT_EQ(600, args.width());
  EXPECT_EQ(338, args.height());

  TransformArgs full;
  ASSERT_EQ(kTransformOk, resolver_.Resolve(kContentContext, TransformArgs(),
                                            1600, 900, true, &full));
  EXPECT_EQ(800, full.width());
  EXPECT_EQ(450, full.height());

  args = Resolve(kBlockContext, TransformArgs(), 1600, 900);
  EXPECT_EQ(800, args.width());
  EXPECT_EQ(450, args.height());
}

TEST_F(TransformArgsResolverTest, DerivesMissingDimension) {
  TransformArgs caller;
  caller.set_width(400);
  TransformArgs args = Resolve(kBlockContext, caller, 1600, 900);
  EXPECT_EQ(400, args.width());
  EXPECT_EQ(225, args.height());

  caller.clear_width();
  caller.set_height(450);
  args = Resolve(kBlockContext, caller, 1600, 900);
  EXPECT_EQ(800, args.width());
  EXPECT_EQ(450, args.height());
}

TEST_F(TransformArgsResolverTest, NeverUpscales) {
  TransformArgs caller;
  caller.set_width(600);
  TransformArgs args = Resolve(kBlockContext, caller, 300, 200);
  EXPECT_EQ(300, args.width());
  EXPECT_EQ(200, args.height());
  EXPECT_EQ(TransformArgs::kFitCover, args.fit());
  EXPECT_FALSE(args.has_sharpen());
}

TEST_F(TransformArgsResolverTest, SmallSourceWithContainKeepsBox) {
  TransformArgs caller;
  caller.set_width(600);
  caller.set_height(400);
  caller.set_fit(TransformArgs::kFitContain);
  TransformArgs args = Resolve(kBlockContext, caller, 300, 200);
  EXPECT_EQ(600, args.width());
  EXPECT_EQ(400, args.height());
  EXPECT_EQ(TransformArgs::kFitContain, args.fit());
  EXPECT_EQ(2, args.sharpen());

  caller.set_fit(TransformArgs::kFitPad);
  caller.set_sharpen(5);
  args = Resolve(kBlockContext, caller, 300, 200);
  EXPECT_EQ(TransformArgs::kFitPad, args.fit());
  EXPECT_EQ(5, args.sharpen());
}

TEST_F(TransformArgsResolverTest, SocialContext) {
  TransformArgs args = Resolve(kSocialContext, TransformArgs(), 2000, 1500);
  EXPECT_EQ(1200, args.width());
  EXPECT_EQ(675, args.height());
  EXPECT_EQ(TransformArgs::kFitCover, args.fit());

  // A small source is padded into the fixed box, not shrunk.
  args = Resolve(kSchemaContext, TransformArgs(), 600, 400);
  EXPECT_EQ(1200, args.width());
  EXPECT_EQ(675, args.height());
  EXPECT_EQ(TransformArgs::kFitPad, args.fit());
  EXPECT_EQ(2, args.sharpen());
}

TEST_F(TransformArgsResolverTest, AvatarContext) {
  TransformArgs args = Resolve(kAvatarContext, TransformArgs(), 0, 0);
  EXPECT_EQ(96, args.width());
  EXPECT_EQ(96, args.height());
  EXPECT_EQ(TransformArgs::kFitCover, args.fit());
  EXPECT_EQ(1, args.sharpen());

  TransformArgs caller;
  caller.set_width(48);
  args = Resolve(kAvatarContext, caller, 512, 512);
  EXPECT_EQ(48, args.width());
  EXPECT_EQ(48, args.height());
}

TEST_F(TransformArgsResolverTest, CallerOverridesWin) {
  TransformArgs caller;
  caller.set_quality(500);
  caller.set_gravity(TransformArgs::kGravityNorth);
  caller.set_format(TransformArgs::kFormatWebp);
  TransformArgs args = Resolve(kContentContext, caller, 400, 300);
  EXPECT_EQ(100, args.quality());
  EXPECT_EQ(TransformArgs::kGravityNorth, args.gravity());
  EXPECT_EQ(TransformArgs::kFormatWebp, args.format());
  EXPECT_EQ(400, args.width());
  EXPECT_EQ(300, args.height());
}

TEST_F(TransformArgsResolverTest, UnknownIntrinsic) {
  TransformArgs out;
  out.set_width(7);
  EXPECT_EQ(kInvalidDimensions,
            resolver_.Resolve(kContentContext, TransformArgs(), 0, 0, &out));
  EXPECT_EQ(7, out.width());

  TransformArgs caller;
  caller.set_width(300);
  TransformArgs args = Resolve(kContentContext, caller, 0, 0);
  EXPECT_EQ(300, args.width());
  EXPECT_FALSE(args.has_height());
}

TEST_F(TransformArgsResolverTest, ScaleDimension) {
  EXPECT_EQ(366, TransformArgsResolver::ScaleDimension(650, 900, 1600));
  EXPECT_EQ(338, TransformArgsResolver::ScaleDimension(600, 900, 1600));
  EXPECT_EQ(1, TransformArgsResolver::ScaleDimension(1, 1, 1));
}

}  // namespace

}  // namespace edge_images
