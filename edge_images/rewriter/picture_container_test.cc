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

#include "edge_images/rewriter/public/picture_container.h"

#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/mock_message_handler.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/rewriter/public/rewrite_options.h"

namespace edge_images {

namespace {

const char kImg[] = "<img src=\"https://site.test/a.jpg\">";

class PictureContainerTest : public testing::Test {
 protected:
  PictureContainerTest() : options_(&handler_), container_(&options_) {
    options_.set_max_width(650);
  }

  MockMessageHandler handler_;
  RewriteOptions options_;
  PictureContainer container_;

 private:
  DISALLOW_COPY_AND_ASSIGN(PictureContainerTest);
};

TEST_F(PictureContainerTest, WrapsImage) {
  GoogleString out;
  ASSERT_TRUE(container_.Wrap(kImg, "", "", 1600, 900, "", false, &out));
  EXPECT_EQ(StrCat("<picture class=\"edge-images-container\" "
                   "style=\"--aspect-ratio: 1600/900; --max-width: 650px;\">",
                   kImg, "</picture>"),
            out);
}

TEST_F(PictureContainerTest, AnchorGoesInside) {
  GoogleString out;
  ASSERT_TRUE(container_.Wrap(kImg, "<a href=\"/post\">", "</a>", 400, 300,
                              "", false, &out));
  EXPECT_EQ(StrCat("<picture class=\"edge-images-container\" "
                   "style=\"--aspect-ratio: 400/300; --max-width: 400px;\">"
                   "<a href=\"/post\">", kImg, "</a></picture>"),
            out);
}

TEST_F(PictureContainerTest, ClassListIsDeduplicated) {
  EXPECT_EQ("edge-images-container",
            container_.ClassList("", false));
  EXPECT_EQ("edge-images-container hero wide",
            container_.ClassList("  hero wide hero edge-images-container ",
                                 false));
  EXPECT_EQ("edge-images-container avatar-picture",
            container_.ClassList("avatar-picture", true));
  EXPECT_EQ("edge-images-container round avatar-picture",
            container_.ClassList("round", true));

  options_.set_container_class("pic");
  EXPECT_EQ("pic hero", container_.ClassList("hero pic", false));
}

TEST_F(PictureContainerTest, StyleCapsWidth) {
  EXPECT_EQ("--aspect-ratio: 96/96; --max-width: 96px;",
            container_.Style(96, 96));
  EXPECT_EQ("--aspect-ratio: 2000/1000; --max-width: 650px;",
            container_.Style(2000, 1000));
}

TEST_F(PictureContainerTest, RejectsUnknownDimensions) {
  GoogleString out("unchanged");
  EXPECT_FALSE(container_.Wrap(kImg, "", "", 0, 900, "", false, &out));
  EXPECT_FALSE(container_.Wrap(kImg, "", "", 1600, -1, "", false, &out));
  EXPECT_EQ("unchanged", out);
}

}  // namespace

}  // namespace edge_images
