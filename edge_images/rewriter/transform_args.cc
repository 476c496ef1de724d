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

#include "edge_images/rewriter/public/transform_args.h"

#include <algorithm>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

namespace {

struct FitEntry {
  TransformArgs::Fit fit;
  const char* name;
};

const FitEntry kFitNames[] = {
  { TransformArgs::kFitCover, "cover" },
  { TransformArgs::kFitContain, "contain" },
  { TransformArgs::kFitPad, "pad" },
  { TransformArgs::kFitScaleDown, "scale-down" },
  { TransformArgs::kFitCrop, "crop" },
};

struct FormatEntry {
  TransformArgs::Format format;
  const char* name;
};

const FormatEntry kFormatNames[] = {
  { TransformArgs::kFormatAuto, "auto" },
  { TransformArgs::kFormatWebp, "webp" },
  { TransformArgs::kFormatAvif, "avif" },
  { TransformArgs::kFormatJpeg, "jpeg" },
  { TransformArgs::kFormatPng, "png" },
  { TransformArgs::kFormatGif, "gif" },
};

struct GravityEntry {
  TransformArgs::Gravity gravity;
  const char* name;
};

const GravityEntry kGravityNames[] = {
  { TransformArgs::kGravityAuto, "auto" },
  { TransformArgs::kGravityCenter, "center" },
  { TransformArgs::kGravityNorth, "north" },
  { TransformArgs::kGravitySouth, "south" },
  { TransformArgs::kGravityEast, "east" },
  { TransformArgs::kGravityWest, "west" },
  { TransformArgs::kGravityLeft, "left" },
  { TransformArgs::kGravityRight, "right" },
};

// Knob names, with the aliases accepted on tags, mapped to the canonical
// name.
struct KnobAlias {
  const char* alias;
  const char* name;
};

const KnobAlias kKnobAliases[] = {
  { "w", "width" },
  { "h", "height" },
  { "q", "quality" },
  { "f", "format" },
  { "g", "gravity" },
  { "width", "width" },
  { "height", "height" },
  { "quality", "quality" },
  { "format", "format" },
  { "gravity", "gravity" },
  { "fit", "fit" },
  { "sharpen", "sharpen" },
  { "dpr", "dpr" },
  { "blur", "blur" },
  { "brightness", "brightness" },
  { "contrast", "contrast" },
};

const char* CanonicalKnobName(StringPiece name) {
  for (int i = 0, n = arraysize(kKnobAliases); i < n; ++i) {
    if (StringCaseEqual(name, kKnobAliases[i].alias)) {
      return kKnobAliases[i].name;
    }
  }
  return NULL;
}

int ClampInt(int value, int min_value, int max_value) {
  return std::min(std::max(value, min_value), max_value);
}

}  // namespace

const int TransformArgs::kMinQuality;
const int TransformArgs::kMaxQuality;
const int TransformArgs::kMaxSharpen;
const int TransformArgs::kMaxBlur;
const int TransformArgs::kMaxBrightness;
const int TransformArgs::kMaxContrast;

TransformArgs::TransformArgs() {
}

TransformArgs::~TransformArgs() {
}

bool TransformArgs::ParseFit(StringPiece name, Fit* fit) {
  name = TrimWhitespace(name);
  for (int i = 0, n = arraysize(kFitNames); i < n; ++i) {
    if (StringCaseEqual(name, kFitNames[i].name)) {
      *fit = kFitNames[i].fit;
      return true;
    }
  }
  return false;
}

bool TransformArgs::ParseFormat(StringPiece name, Format* format) {
  name = TrimWhitespace(name);
  if (StringCaseEqual(name, "jpg")) {
    *format = kFormatJpeg;
    return true;
  }
  for (int i = 0, n = arraysize(kFormatNames); i < n; ++i) {
    if (StringCaseEqual(name, kFormatNames[i].name)) {
      *format = kFormatNames[i].format;
      return true;
    }
  }
  return false;
}

bool TransformArgs::ParseGravity(StringPiece name, Gravity* gravity) {
  name = TrimWhitespace(name);
  for (int i = 0, n = arraysize(kGravityNames); i < n; ++i) {
    if (StringCaseEqual(name, kGravityNames[i].name)) {
      *gravity = kGravityNames[i].gravity;
      return true;
    }
  }
  return false;
}

const char* TransformArgs::FitName(Fit fit) {
  for (int i = 0, n = arraysize(kFitNames); i < n; ++i) {
    if (kFitNames[i].fit == fit) {
      return kFitNames[i].name;
    }
  }
  return "cover";
}

const char* TransformArgs::FormatName(Format format) {
  for (int i = 0, n = arraysize(kFormatNames); i < n; ++i) {
    if (kFormatNames[i].format == format) {
      return kFormatNames[i].name;
    }
  }
  return "auto";
}

const char* TransformArgs::GravityName(Gravity gravity) {
  for (int i = 0, n = arraysize(kGravityNames); i < n; ++i) {
    if (kGravityNames[i].gravity == gravity) {
      return kGravityNames[i].name;
    }
  }
  return "auto";
}

bool TransformArgs::IsKnobName(StringPiece name) {
  return CanonicalKnobName(name) != NULL;
}

bool TransformArgs::SetFromName(StringPiece name, StringPiece value) {
  const char* knob = CanonicalKnobName(name);
  if (knob == NULL) {
    return false;
  }
  StringPiece knob_name(knob);
  value = TrimWhitespace(value);
  int int_value = 0;
  if (knob_name == "fit") {
    Fit fit;
    if (!ParseFit(value, &fit)) {
      return false;
    }
    set_fit(fit);
  } else if (knob_name == "format") {
    Format format;
    if (!ParseFormat(value, &format)) {
      return false;
    }
    set_format(format);
  } else if (knob_name == "gravity") {
    Gravity gravity;
    if (!ParseGravity(value, &gravity)) {
      return false;
    }
    set_gravity(gravity);
  } else if (knob_name == "dpr") {
    double dpr;
    if (!StringToDouble(value, &dpr) || dpr <= 0) {
      return false;
    }
    set_dpr(dpr);
  } else if (!StringToInt(value, &int_value)) {
    return false;
  } else if (knob_name == "width") {
    set_width(int_value);
  } else if (knob_name == "height") {
    set_height(int_value);
  } else if (knob_name == "quality") {
    set_quality(int_value);
  } else if (knob_name == "sharpen") {
    set_sharpen(int_value);
  } else if (knob_name == "blur") {
    set_blur(int_value);
  } else if (knob_name == "brightness") {
    set_brightness(int_value);
  } else if (knob_name == "contrast") {
    set_contrast(int_value);
  } else {
    return false;
  }
  return true;
}

void TransformArgs::MergeDefaultsFrom(const TransformArgs& defaults) {
  width_.MergeDefault(defaults.width_);
  height_.MergeDefault(defaults.height_);
  fit_.MergeDefault(defaults.fit_);
  format_.MergeDefault(defaults.format_);
  quality_.MergeDefault(defaults.quality_);
  gravity_.MergeDefault(defaults.gravity_);
  sharpen_.MergeDefault(defaults.sharpen_);
  dpr_.MergeDefault(defaults.dpr_);
  blur_.MergeDefault(defaults.blur_);
  brightness_.MergeDefault(defaults.brightness_);
  contrast_.MergeDefault(defaults.contrast_);
}

void TransformArgs::MergeOverridesFrom(const TransformArgs& overrides) {
  width_.MergeOverride(overrides.width_);
  height_.MergeOverride(overrides.height_);
  fit_.MergeOverride(overrides.fit_);
  format_.MergeOverride(overrides.format_);
  quality_.MergeOverride(overrides.quality_);
  gravity_.MergeOverride(overrides.gravity_);
  sharpen_.MergeOverride(overrides.sharpen_);
  dpr_.MergeOverride(overrides.dpr_);
  blur_.MergeOverride(overrides.blur_);
  brightness_.MergeOverride(overrides.brightness_);
  contrast_.MergeOverride(overrides.contrast_);
}

void TransformArgs::Clamp() {
  if (has_width() && width() <= 0) {
    width_.clear();
  }
  if (has_height() && height() <= 0) {
    height_.clear();
  }
  if (has_dpr() && !(dpr_.value() > 0)) {
    dpr_.clear();
  }
  if (has_quality()) {
    set_quality(ClampInt(quality(), kMinQuality, kMaxQuality));
  }
  if (has_sharpen()) {
    set_sharpen(ClampInt(sharpen(), 0, kMaxSharpen));
  }
  if (has_blur()) {
    set_blur(ClampInt(blur(), 0, kMaxBlur));
  }
  if (has_brightness()) {
    set_brightness(ClampInt(brightness(), -kMaxBrightness, kMaxBrightness));
  }
  if (has_contrast()) {
    set_contrast(ClampInt(contrast(), -kMaxContrast, kMaxContrast));
  }
}

GoogleString TransformArgs::CanonicalString() const {
  // Keep the keys in sorted order.
  StringVector pairs;
  if (has_blur()) {
    pairs.push_back(StrCat("blur=", IntegerToString(blur())));
  }
  if (has_brightness()) {
    pairs.push_back(StrCat("brightness=", IntegerToString(brightness())));
  }
  if (has_contrast()) {
    pairs.push_back(StrCat("contrast=", IntegerToString(contrast())));
  }
  if (has_dpr()) {
    pairs.push_back(StrCat("dpr=", DoubleToString(dpr())));
  }
  if (has_fit()) {
    pairs.push_back(StrCat("fit=", FitName(fit())));
  }
  if (has_format()) {
    pairs.push_back(StrCat("format=", FormatName(format())));
  }
  if (has_gravity()) {
    pairs.push_back(StrCat("gravity=", GravityName(gravity())));
  }
  if (has_height()) {
    pairs.push_back(StrCat("height=", IntegerToString(height())));
  }
  if (has_quality()) {
    pairs.push_back(StrCat("quality=", IntegerToString(quality())));
  }
  if (has_sharpen()) {
    pairs.push_back(StrCat("sharpen=", IntegerToString(sharpen())));
  }
  if (has_width()) {
    pairs.push_back(StrCat("width=", IntegerToString(width())));
  }
  return JoinCollection(pairs, "&");
}

}  // namespace edge_images
