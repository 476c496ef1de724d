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

#include "edge_images/rewriter/public/markup_rewriter.h"

#include <memory>

#include "edge_images/kernel/base/gtest.h"
#include "edge_images/kernel/base/mock_message_handler.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/html/html_tag.h"
#include "edge_images/kernel/html/html_tag_lexer.h"
#include "edge_images/rewriter/public/edge_provider.h"
#include "edge_images/rewriter/public/fake_image_metadata_source.h"
#include "edge_images/rewriter/public/feature_gate.h"
#include "edge_images/rewriter/public/provider_registry.h"
#include "edge_images/rewriter/public/rewrite_options.h"
#include "edge_images/rewriter/public/srcset_generator.h"

namespace edge_images {

namespace {

const char kSiteRoot[] = "https://site.test/";
const char kSource[] = "https://site.test/wp-content/uploads/photo.jpg";
const char kEdgeRoot[] = "https://site.test/cdn-cgi/image/";
const char kImg[] =
    "<img src=\"https://site.test/wp-content/uploads/photo.jpg\" "
    "width=\"1600\" height=\"900\" alt=\"A photo\">";

// The 650x366 variant of kSource.
const char kEdgeSrc[] =
    "https://site.test/cdn-cgi/image/dpr=1%2Cfit=cover%2Cformat=auto%2C"
    "gravity=auto%2Cheight=366%2Cquality=85%2Cwidth=650"
    "/wp-content/uploads/photo.jpg";

// Vetoes images carrying a data-builder attribute.
class BuilderVeto : public TagVetoPredicate {
 public:
  BuilderVeto() {}
  virtual ~BuilderVeto() {}

  virtual bool VetoTag(const HtmlTag& img, StringPiece html) const {
    return img.FindAttribute("data-builder") != NULL;
  }

 private:
  DISALLOW_COPY_AND_ASSIGN(BuilderVeto);
};

class MarkupRewriterTest : public testing::Test {
 protected:
  MarkupRewriterTest() : options_(&handler_), metadata_(kSiteRoot) {
    options_.set_provider_id(kProviderCloudflare);
    options_.set_max_width(650);
    options_.set_content_width(0);
  }

  // Builds the rewriter from the options as they stand.
  void Init() {
    gate_.reset(new FeatureGate(&options_));
    provider_.reset(ProviderRegistry::NewProvider(options_.provider_config()));
    srcset_generator_.reset(
        new SrcsetGenerator(&options_, provider_.get(), NULL));
    rewriter_.reset(new MarkupRewriter(&options_, gate_.get(),
                                       provider_.get(),
                                       srcset_generator_.get(), &metadata_,
                                       &handler_));
  }

  TransformStatus Rewrite(StringPiece html, ImageContext context) {
    if (rewriter_.get() == NULL) {
      Init();
    }
    return rewriter_->Rewrite(html, context, request_, &result_);
  }

  TransformStatus Rewrite(StringPiece html) {
    return Rewrite(html, kContentContext);
  }

  // Expects html to come back untouched with the given status.
  void ExpectUnchanged(StringPiece html, TransformStatus status) {
    EXPECT_EQ(status, Rewrite(html)) << html;
    EXPECT_EQ(html, result_.html);
    EXPECT_FALSE(result_.transformed);
    EXPECT_EQ(status, result_.status);
    EXPECT_TRUE(result_.container_html.empty());
  }

  // The first <img> of result_.html.
  HtmlTag OutputImg() {
    HtmlTagLexer lexer(result_.html);
    HtmlTag tag;
    while (lexer.NextTag(&tag)) {
      if (tag.name() == "img") {
        return tag;
      }
    }
    ADD_FAILURE() << "No img in " << result_.html;
    return HtmlTag();
  }

  GoogleString OutputAttribute(StringPiece name) {
    HtmlTag img = OutputImg();
    const char* value = img.AttributeValue(name);
    return (value == NULL) ? GoogleString("(absent)") : GoogleString(value);
  }

  MockMessageHandler handler_;
  RewriteOptions options_;
  FakeImageMetadataSource metadata_;
  RewriteRequest request_;
  RewriteResult result_;
  std::unique_ptr<FeatureGate> gate_;
  std::unique_ptr<EdgeProvider> provider_;
  std::unique_ptr<SrcsetGenerator> srcset_generator_;
  std::unique_ptr<MarkupRewriter> rewriter_;

 private:
  DISALLOW_COPY_AND_ASSIGN(MarkupRewriterTest);
};

TEST_F(MarkupRewriterTest, RewritesContentImage) {
  ASSERT_EQ(kTransformOk, Rewrite(kImg));
  EXPECT_TRUE(result_.transformed);
  EXPECT_EQ(kTransformOk, result_.status);
  EXPECT_TRUE(result_.container_html.empty());

  EXPECT_EQ(kEdgeSrc, OutputAttribute("src"));
  EXPECT_EQ(StrCat(kEdgeRoot, "dpr=1%2Cfit=cover%2Cformat=auto%2Cgravity=auto"
                   "%2Cheight=169%2Cquality=85%2Cwidth=300"
                   "/wp-content/uploads/photo.jpg 300w, ",
                   kEdgeSrc, " 650w"),
            OutputAttribute("srcset"));
  EXPECT_EQ("(max-width: 650px) 100vw, 650px", OutputAttribute("sizes"));
  // Layout attributes keep the source size.
  EXPECT_EQ("1600", OutputAttribute("width"));
  EXPECT_EQ("900", OutputAttribute("height"));
  EXPECT_EQ("A photo", OutputAttribute("alt"));
  EXPECT_EQ("edge-images-processed", OutputAttribute("class"));
}

TEST_F(MarkupRewriterTest, SurroundingMarkupIsKept) {
  const char kBefore[] = "<p class=\"intro\">Look: ";
  const char kAfter[] = " <!-- <img src=\"/c.jpg\"> --> nice.</p>";
  ASSERT_EQ(kTransformOk, Rewrite(StrCat(kBefore, kImg, kAfter)));
  EXPECT_TRUE(HasPrefixString(result_.html, StrCat(kBefore, "<img src=\"")));
  EXPECT_TRUE(StringCaseEndsWith(result_.html, StrCat("\">", kAfter)));
}

TEST_F(MarkupRewriterTest, OnlyFirstImageIsRewritten) {
  const char kSecond[] = "<img src=\"https://site.test/b.jpg\" width=\"10\" "
                         "height=\"10\">";
  ASSERT_EQ(kTransformOk, Rewrite(StrCat(kImg, kSecond)));
  EXPECT_TRUE(StringCaseEndsWith(result_.html, kSecond));
}

TEST_F(MarkupRewriterTest, PictureWrap) {
  options_.set_feature_enabled(RewriteOptions::kPictureWrap, true);
  request_.container_class = "hero";
  ASSERT_EQ(kTransformOk, Rewrite(StrCat("<p>", kImg, "</p>")));
  const char kOpen[] =
      "<picture class=\"edge-images-container hero\" "
      "style=\"--aspect-ratio: 1600/900; --max-width: 650px;\"><img ";
  EXPECT_TRUE(HasPrefixString(result_.container_html, kOpen))
      << result_.container_html;
  EXPECT_TRUE(StringCaseEndsWith(result_.container_html, "></picture>"));
  EXPECT_EQ(StrCat("<p>", result_.container_html, "</p>"), result_.html);
  EXPECT_EQ(kEdgeSrc, OutputAttribute("src"));
}

TEST_F(MarkupRewriterTest, AnchorMovesIntoContainer) {
  options_.set_feature_enabled(RewriteOptions::kPictureWrap, true);
  ASSERT_EQ(kTransformOk,
            Rewrite(StrCat("<p><a href=\"/full.jpg\">\n  ", kImg,
                           "\n</a></p>")));
  EXPECT_TRUE(HasPrefixString(result_.html, "<p><picture "));
  EXPECT_NE(GoogleString::npos,
            result_.html.find("\"><a href=\"/full.jpg\"><img "));
  EXPECT_TRUE(StringCaseEndsWith(result_.html, "></a></picture></p>"));
  // One anchor, not two.
  EXPECT_EQ(result_.html.find("<a "), result_.html.rfind("<a "));
}

TEST_F(MarkupRewriterTest, AnchorWithOtherContentStaysOutside) {
  options_.set_feature_enabled(RewriteOptions::kPictureWrap, true);
  ASSERT_EQ(kTransformOk,
            Rewrite(StrCat("<a href=\"/p\"><span>Caption</span>", kImg,
                           "</a>")));
  EXPECT_TRUE(HasPrefixString(result_.html,
                              "<a href=\"/p\"><span>Caption</span><picture "));
  EXPECT_TRUE(StringCaseEndsWith(result_.html, "></picture></a>"));
}

TEST_F(MarkupRewriterTest, AnchorWithoutWrapIsUntouched) {
  ASSERT_EQ(kTransformOk,
            Rewrite(StrCat("<a href=\"/p\"> ", kImg, " </a>")));
  EXPECT_TRUE(HasPrefixString(result_.html, "<a href=\"/p\"> <img "));
  EXPECT_TRUE(StringCaseEndsWith(result_.html, "\"> </a>"));
  EXPECT_TRUE(result_.container_html.empty());
}

TEST_F(MarkupRewriterTest, Idempotent) {
  ASSERT_EQ(kTransformOk, Rewrite(kImg));
  GoogleString once = result_.html;
  ExpectUnchanged(once, kTransformSkipped);

  options_.set_feature_enabled(RewriteOptions::kPictureWrap, true);
  Init();
  ASSERT_EQ(kTransformOk, Rewrite(StrCat("<a href=\"/p\">", kImg, "</a>")));
  once = result_.html;
  ExpectUnchanged(once, kTransformSkipped);
}

TEST_F(MarkupRewriterTest, Deterministic) {
  ASSERT_EQ(kTransformOk, Rewrite(kImg));
  GoogleString first = result_.html;
  ASSERT_EQ(kTransformOk, Rewrite(kImg));
  EXPECT_EQ(first, result_.html);
}

TEST_F(MarkupRewriterTest, NothingToRewrite) {
  ExpectUnchanged("", kTransformSkipped);
  ExpectUnchanged("<p>No images <b>here</b></p>", kTransformSkipped);
  ExpectUnchanged("<script>var s = '<img src=x.jpg>';</script>",
                  kTransformSkipped);
  ExpectUnchanged("<img alt=\"no source\" width=\"10\" height=\"10\">",
                  kTransformSkipped);
}

TEST_F(MarkupRewriterTest, UnsupportedSources) {
  ExpectUnchanged("<img src=\"https://site.test/logo.svg\" width=\"100\" "
                  "height=\"50\">", kUnsupportedSource);
  ExpectUnchanged("<img src=\"https://site.test/logo.SVG?v=2\">",
                  kUnsupportedSource);
  ExpectUnchanged("<img src=\"data:image/png;base64,AAAA\" width=\"1\" "
                  "height=\"1\">", kUnsupportedSource);
  ExpectUnchanged("<img src=\"https://elsewhere.test/a.jpg\" width=\"100\" "
                  "height=\"50\">", kUnsupportedSource);
  EXPECT_EQ(0, handler_.SeriousMessages());
  EXPECT_EQ(4, handler_.MessagesOfType(kInfo));
}

TEST_F(MarkupRewriterTest, AlreadyProcessed) {
  ExpectUnchanged("<img class=\"edge-images-processed\" src=\"/a.jpg\" "
                  "width=\"100\" height=\"50\">", kTransformSkipped);
}

TEST_F(MarkupRewriterTest, Exclusions) {
  options_.AddExclusion("/no-cdn/");
  ExpectUnchanged("<img src=\"https://site.test/no-cdn/a.jpg\" "
                  "width=\"100\" height=\"50\">", kTransformSkipped);
}

TEST_F(MarkupRewriterTest, Veto) {
  BuilderVeto veto;
  Init();
  rewriter_->set_tag_veto(&veto);
  ExpectUnchanged("<img data-builder=\"1\" src=\"/a.jpg\" width=\"100\" "
                  "height=\"50\">", kTransformSkipped);
  EXPECT_EQ(kTransformOk, Rewrite(kImg));

  rewriter_->set_tag_veto(NULL);
  EXPECT_EQ(kTransformOk,
            Rewrite("<img data-builder=\"1\" src=\"/a.jpg\" width=\"100\" "
                    "height=\"50\">"));
}

TEST_F(MarkupRewriterTest, GateClosed) {
  options_.set_transformation_enabled(false);
  ExpectUnchanged(kImg, kTransformSkipped);

  options_.set_transformation_enabled(true);
  options_.set_provider_id(kProviderNone);
  Init();
  ExpectUnchanged(kImg, kTransformSkipped);

  // imgix without its subdomain cannot build URLs.
  options_.set_provider_id(kProviderImgix);
  Init();
  ExpectUnchanged(kImg, kTransformSkipped);
}

TEST_F(MarkupRewriterTest, DimensionsFromImageClass) {
  metadata_.AddImage(42, "https://site.test/other-name.jpg", 1600, 900);
  ASSERT_EQ(kTransformOk,
            Rewrite("<img src=\"https://site.test/wp-content/uploads/"
                    "photo.jpg\" class=\"wp-image-42 size-full\">"));
  EXPECT_EQ(kEdgeSrc, OutputAttribute("src"));
  EXPECT_EQ("1600", OutputAttribute("width"));
  EXPECT_EQ("900", OutputAttribute("height"));
  EXPECT_EQ("wp-image-42 size-full edge-images-processed",
            OutputAttribute("class"));
}

TEST_F(MarkupRewriterTest, DimensionsFromUrl) {
  metadata_.AddImage(7, kSource, 1600, 900);
  ASSERT_EQ(kTransformOk,
            Rewrite(StrCat("<img src=\"", kSource, "\">")));
  EXPECT_EQ(kEdgeSrc, OutputAttribute("src"));
  EXPECT_EQ("1600", OutputAttribute("width"));
}

TEST_F(MarkupRewriterTest, DimensionsFromRequest) {
  metadata_.AddImage(9, "https://site.test/x.jpg", 1600, 900);
  request_.image_id = 9;
  ASSERT_EQ(kTransformOk, Rewrite(StrCat("<img src=\"", kSource, "\">")));
  EXPECT_EQ(kEdgeSrc, OutputAttribute("src"));
}

TEST_F(MarkupRewriterTest, UnknownDimensions) {
  ExpectUnchanged(StrCat("<img src=\"", kSource, "\">"), kInvalidDimensions);
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));

  // A caller-supplied width is enough for src, but not for a srcset.
  request_.args.set_width(400);
  ASSERT_EQ(kTransformOk, Rewrite(StrCat("<img src=\"", kSource, "\">")));
  EXPECT_EQ(StrCat(kEdgeRoot, "dpr=1%2Cfit=cover%2Cformat=auto%2Cgravity=auto"
                   "%2Cquality=85%2Cwidth=400/wp-content/uploads/photo.jpg"),
            OutputAttribute("src"));
  EXPECT_EQ("(absent)", OutputAttribute("srcset"));
  EXPECT_EQ("(absent)", OutputAttribute("width"));
}

TEST_F(MarkupRewriterTest, TransformAttributesAreConsumed) {
  ASSERT_EQ(kTransformOk,
            Rewrite("<img src=\"/wp-content/uploads/photo.jpg\" fit=\"contain\""
                    " q=\"70\" data-id=\"3\" width=\"1600\" height=\"900\">"));
  GoogleString src = OutputAttribute("src");
  EXPECT_NE(GoogleString::npos, src.find("fit=contain")) << src;
  EXPECT_NE(GoogleString::npos, src.find("quality=70")) << src;
  EXPECT_EQ("(absent)", OutputAttribute("fit"));
  EXPECT_EQ("(absent)", OutputAttribute("q"));
  EXPECT_EQ("3", OutputAttribute("data-id"));
}

TEST_F(MarkupRewriterTest, TransformedSourceIsRecovered) {
  ASSERT_EQ(kTransformOk,
            Rewrite("<img src=\"https://site.test/cdn-cgi/image/width=300,"
                    "quality=80/wp-content/uploads/photo-300x169.jpg\" "
                    "width=\"1600\" height=\"900\">"));
  EXPECT_EQ(kEdgeSrc, OutputAttribute("src"));
}

TEST_F(MarkupRewriterTest, ContentWidthConstraint) {
  options_.set_content_width(600);
  ASSERT_EQ(kTransformOk, Rewrite(kImg));
  EXPECT_NE(GoogleString::npos,
            OutputAttribute("src").find("height=338%2Cquality=85%2Cwidth=600"));

  ASSERT_EQ(kTransformOk,
            Rewrite("<img class=\"alignfull\" src=\"/wp-content/uploads/"
                    "photo.jpg\" width=\"1600\" height=\"900\">"));
  EXPECT_NE(GoogleString::npos,
            OutputAttribute("src").find("height=366%2Cquality=85%2Cwidth=650"));

  ASSERT_EQ(kTransformOk,
            Rewrite(StrCat("<figure class=\"wp-block-image alignwide\">",
                           kImg, "</figure>")));
  EXPECT_NE(GoogleString::npos,
            OutputAttribute("src").find("height=366%2Cquality=85%2Cwidth=650"));

  // Block images are never held to the content column.
  ASSERT_EQ(kTransformOk, Rewrite(kImg, kBlockContext));
  EXPECT_NE(GoogleString::npos,
            OutputAttribute("src").find("height=366%2Cquality=85%2Cwidth=650"));
}

TEST_F(MarkupRewriterTest, Avatar) {
  options_.set_feature_enabled(RewriteOptions::kPictureWrap, true);
  ASSERT_EQ(kTransformOk,
            Rewrite("<img src=\"/avatars/me.jpg\" width=\"96\" "
                    "height=\"96\">", kAvatarContext));
  EXPECT_EQ("/cdn-cgi/image/dpr=2%2Cfit=cover%2Cformat=auto%2Cgravity=auto%2C"
            "height=96%2Cquality=85%2Csharpen=1%2Cwidth=96/avatars/me.jpg 2x",
            OutputAttribute("srcset"));
  EXPECT_NE(GoogleString::npos,
            result_.container_html.find(
                "class=\"edge-images-container avatar-picture\""));

  options_.set_feature_enabled(RewriteOptions::kAvatars, false);
  const char kAvatar[] =
      "<img src=\"/avatars/me.jpg\" width=\"96\" height=\"96\">";
  EXPECT_EQ(kTransformSkipped, Rewrite(kAvatar, kAvatarContext));
  EXPECT_EQ(kAvatar, result_.html);
  EXPECT_FALSE(result_.transformed);
}

TEST_F(MarkupRewriterTest, StripSizeSuffix) {
  GoogleString out;
  ASSERT_TRUE(MarkupRewriter::StripSizeSuffix(
      "https://site.test/a/photo-300x169.jpg", &out));
  EXPECT_EQ("https://site.test/a/photo.jpg", out);
  ASSERT_TRUE(MarkupRewriter::StripSizeSuffix("/a/b-1024x768.JPEG", &out));
  EXPECT_EQ("/a/b.JPEG", out);
  EXPECT_FALSE(MarkupRewriter::StripSizeSuffix("/a/photo.jpg", &out));
  EXPECT_FALSE(MarkupRewriter::StripSizeSuffix("/a/photo-300x169.jpg?v=1",
                                               &out));
  EXPECT_FALSE(MarkupRewriter::StripSizeSuffix("/a/photo-300.jpg", &out));
}

TEST_F(MarkupRewriterTest, ParseImageIdentity) {
  int64 id = 0;
  ASSERT_TRUE(MarkupRewriter::ParseImageIdentity("a wp-image-123 b", &id));
  EXPECT_EQ(123, id);
  EXPECT_FALSE(MarkupRewriter::ParseImageIdentity("wp-image-", &id));
  EXPECT_FALSE(MarkupRewriter::ParseImageIdentity("size-full", &id));
}

TEST_F(MarkupRewriterTest, FullWidthClasses) {
  EXPECT_TRUE(MarkupRewriter::IsFullWidthClass("wp-block alignfull"));
  EXPECT_TRUE(MarkupRewriter::IsFullWidthClass("AlignWide"));
  EXPECT_TRUE(MarkupRewriter::IsFullWidthClass("full-width"));
  EXPECT_TRUE(MarkupRewriter::IsFullWidthClass("width-full"));
  EXPECT_TRUE(MarkupRewriter::IsFullWidthClass("\twidth-full\n"));
  EXPECT_FALSE(MarkupRewriter::IsFullWidthClass("aligncenter"));
  EXPECT_FALSE(MarkupRewriter::IsFullWidthClass(""));
  // Whole class names only.
  EXPECT_FALSE(MarkupRewriter::IsFullWidthClass("not-alignwide"));
  EXPECT_FALSE(MarkupRewriter::IsFullWidthClass("full-width-banner-x"));
  EXPECT_FALSE(MarkupRewriter::IsFullWidthClass("alignfullx wp-block"));
}

TEST_F(MarkupRewriterTest, StateNames) {
  EXPECT_STREQ("LocateImgTag",
               MarkupRewriter::StateName(MarkupRewriter::kLocateImgTag));
  EXPECT_STREQ("WrapInContainer",
               MarkupRewriter::StateName(MarkupRewriter::kWrapInContainer));
}

}  // namespace

}  // namespace edge_images
