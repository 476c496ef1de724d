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

#include <algorithm>
#include <cmath>
#include <set>

#include "edge_images/kernel/base/string_util.h"
#include "edge_images/rewriter/public/edge_provider.h"
#include "edge_images/rewriter/public/image_ref.h"
#include "edge_images/rewriter/public/rewrite_options.h"
#include "edge_images/rewriter/public/transform_args.h"
#include "edge_images/rewriter/public/transform_args_resolver.h"
#include "edge_images/rewriter/public/transform_cache.h"

namespace edge_images {

const int SrcsetGenerator::kMinSrcsetWidth;
const int SrcsetGenerator::kMaxSrcsetWidth;
const int SrcsetGenerator::kMinWidthForSmallestCandidate;
const double SrcsetGenerator::kWidthMultipliers[] = {
  0.25, 0.5, 1, 1.5, 2, 2.5
};
const int SrcsetGenerator::kNumWidthMultipliers =
    arraysize(SrcsetGenerator::kWidthMultipliers);

namespace {

const char kFixedLabel[] = "srcset-fixed";
const char kResponsiveLabel[] = "srcset";

// Runs the provider for a cache miss.
class BuildUrlFunction : public TransformCache::ComputeFunction {
 public:
  BuildUrlFunction(const EdgeProvider* provider, const ImageRef& image,
                   const TransformArgs& args)
      : provider_(provider),
        image_(image),
        args_(args),
        status_(kTransformOk) {
  }
  virtual ~BuildUrlFunction() {}

  virtual bool Compute(GoogleString* value) {
    status_ = provider_->BuildUrl(image_, args_, value);
    return status_ == kTransformOk;
  }

  TransformStatus status() const { return status_; }

 private:
  const EdgeProvider* provider_;
  const ImageRef& image_;
  const TransformArgs& args_;
  TransformStatus status_;

  DISALLOW_COPY_AND_ASSIGN(BuildUrlFunction);
};

}  // namespace

SrcsetGenerator::SrcsetGenerator(const RewriteOptions* options,
                                 const EdgeProvider* provider,
                                 TransformCache* cache)
    : options_(options),
      provider_(provider),
      cache_(cache) {
  const ProviderConfig& config = provider_->config();
  key_prefix_ = StrCat(provider_->name(), " ", config.rewrite_domain, " ",
                       config.subdomain, " ", config.service_url);
}

SrcsetGenerator::~SrcsetGenerator() {
}

TransformStatus SrcsetGenerator::BuildUrl(const ImageRef& image,
                                          const TransformArgs& args,
                                          StringPiece context_label,
                                          GoogleString* url) const {
  BuildUrlFunction build(provider_, image, args);
  GoogleString result;
  bool ok;
  if (cache_ == NULL) {
    ok = build.Compute(&result);
  } else {
    TransformCache::KeyParts key(image.source_url(), args.CanonicalString(),
                                 StrCat(key_prefix_, "/", context_label));
    ok = cache_->GetOrCompute(key, &build, &result);
  }
  if (!ok) {
    // A remembered failure carries no status; providers only fail for
    // missing configuration.
    return (build.status() == kTransformOk) ? kProviderMisconfigured
                                            : build.status();
  }
  url->swap(result);
  return kTransformOk;
}

void SrcsetGenerator::CandidateWidths(int ceiling,
                                      std::vector<int>* widths) const {
  widths->clear();
  if (ceiling <= 0) {
    return;
  }
  std::set<int> pool;
  pool.insert(ceiling);
  const std::vector<int>& breakpoints = options_->breakpoints();
  if (!breakpoints.empty()) {
    for (int i = 0, n = breakpoints.size(); i < n; ++i) {
      if (breakpoints[i] > 0) {
        pool.insert(std::min(breakpoints[i], ceiling));
      }
    }
  } else {
    if (ceiling >= kMinWidthForSmallestCandidate) {
      pool.insert(std::min(static_cast<int>(kMinSrcsetWidth), ceiling));
    }
    int upper = std::min(ceiling, static_cast<int>(kMaxSrcsetWidth));
    for (int i = 0; i < kNumWidthMultipliers; ++i) {
      int width = static_cast<int>(
          std::floor(ceiling * kWidthMultipliers[i] + 0.5));
      width = std::min(width, upper);
      if (width >= kMinSrcsetWidth) {
        pool.insert(width);
      }
    }
  }

  // Walk down from the ceiling, dropping any width whose 2x is offered.
  std::vector<int> kept;
  for (std::set<int>::reverse_iterator p = pool.rbegin(); p != pool.rend();
       ++p) {
    if (std::find(kept.begin(), kept.end(), 2 * *p) == kept.end()) {
      kept.push_back(*p);
    }
  }
  widths->assign(kept.rbegin(), kept.rend());
}

TransformStatus SrcsetGenerator::Generate(const ImageRef& image,
                                          const TransformArgs& base,
                                          StringPiece sizes_hint,
                                          bool fixed_context,
                                          SrcsetResult* out) const {
  out->Clear();
  if (!image.has_intrinsic_dimensions()) {
    return kTransformOk;
  }
  int ceiling = std::min(image.intrinsic_width(), options_->max_width());
  if (base.has_width()) {
    ceiling = std::min(ceiling, base.width());
  }
  if (ceiling <= 0) {
    return kInvalidDimensions;
  }

  if (fixed_context) {
    // Fixed images render at exactly one size; only the high-density
    // variant adds anything over src.
    TransformArgs args(base);
    if (!args.has_width()) {
      args.set_width(ceiling);
      args.set_height(TransformArgsResolver::ScaleDimension(
          ceiling, image.intrinsic_height(), image.intrinsic_width()));
    }
    args.set_dpr(2.0);
    GoogleString url;
    TransformStatus status = BuildUrl(image, args, kFixedLabel, &url);
    if (status != kTransformOk) {
      return status;
    }
    out->candidates.push_back(SrcsetCandidate(url, "2x"));
    out->srcset = StrCat(url, " 2x");
    out->sizes = GoogleString(sizes_hint);
    out->ceiling = args.width();
    return kTransformOk;
  }

  std::vector<int> widths;
  CandidateWidths(ceiling, &widths);
  for (int i = 0, n = widths.size(); i < n; ++i) {
    TransformArgs args(base);
    args.set_width(widths[i]);
    args.set_height(TransformArgsResolver::ScaleDimension(
        widths[i], image.intrinsic_height(), image.intrinsic_width()));
    GoogleString url;
    TransformStatus status = BuildUrl(image, args, kResponsiveLabel, &url);
    if (status != kTransformOk) {
      out->Clear();
      return status;
    }
    if (!out->candidates.empty() && out->candidates.back().url == url) {
      continue;
    }
    out->candidates.push_back(
        SrcsetCandidate(url, StrCat(widths[i], "w")));
  }
  for (int i = 0, n = out->candidates.size(); i < n; ++i) {
    if (i != 0) {
      StrAppend(&out->srcset, ", ");
    }
    StrAppend(&out->srcset, out->candidates[i].url, " ",
              out->candidates[i].descriptor);
  }
  if (!sizes_hint.empty()) {
    out->sizes = GoogleString(sizes_hint);
  } else {
    out->sizes = StrCat("(max-width: ", ceiling, "px) 100vw, ", ceiling,
                        "px");
  }
  out->ceiling = ceiling;
  return kTransformOk;
}

}  // namespace edge_images
