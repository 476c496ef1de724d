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

#ifndef EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_ARGS_H_
#define EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_ARGS_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// The transform intent for one image URL.  Every knob is optional; a knob
// that was never set is left to the provider's own default.  Instances are
// plain values: merging defaults copies rather than mutating shared state.
class TransformArgs {
 public:
  enum Fit {
    kFitCover,
    kFitContain,
    kFitPad,
    kFitScaleDown,
    kFitCrop,
  };

  enum Format {
    kFormatAuto,
    kFormatWebp,
    kFormatAvif,
    kFormatJpeg,
    kFormatPng,
    kFormatGif,
  };

  enum Gravity {
    kGravityAuto,
    kGravityCenter,
    kGravityNorth,
    kGravitySouth,
    kGravityEast,
    kGravityWest,
    kGravityLeft,
    kGravityRight,
  };

  // Ranges enforced by Clamp().
  static const int kMinQuality = 1;
  static const int kMaxQuality = 100;
  static const int kMaxSharpen = 10;
  static const int kMaxBlur = 250;
  static const int kMaxBrightness = 100;
  static const int kMaxContrast = 100;

  TransformArgs();
  ~TransformArgs();

  static bool ParseFit(StringPiece name, Fit* fit);
  static bool ParseFormat(StringPiece name, Format* format);
  static bool ParseGravity(StringPiece name, Gravity* gravity);
  static const char* FitName(Fit fit);
  static const char* FormatName(Format format);
  static const char* GravityName(Gravity gravity);

  bool has_width() const { return width_.was_set(); }
  int width() const { return width_.value(); }
  void set_width(int x) { width_.set(x); }
  void clear_width() { width_.clear(); }

  bool has_height() const { return height_.was_set(); }
  int height() const { return height_.value(); }
  void set_height(int x) { height_.set(x); }
  void clear_height() { height_.clear(); }

  bool has_fit() const { return fit_.was_set(); }
  Fit fit() const { return fit_.value(); }
  void set_fit(Fit x) { fit_.set(x); }

  bool has_format() const { return format_.was_set(); }
  Format format() const { return format_.value(); }
  void set_format(Format x) { format_.set(x); }

  bool has_quality() const { return quality_.was_set(); }
  int quality() const { return quality_.value(); }
  void set_quality(int x) { quality_.set(x); }

  bool has_gravity() const { return gravity_.was_set(); }
  Gravity gravity() const { return gravity_.value(); }
  void set_gravity(Gravity x) { gravity_.set(x); }

  bool has_sharpen() const { return sharpen_.was_set(); }
  int sharpen() const { return sharpen_.value(); }
  void set_sharpen(int x) { sharpen_.set(x); }

  // Device pixel ratio; 1 when unset.
  bool has_dpr() const { return dpr_.was_set(); }
  double dpr() const { return dpr_.was_set() ? dpr_.value() : 1.0; }
  void set_dpr(double x) { dpr_.set(x); }
  void clear_dpr() { dpr_.clear(); }

  bool has_blur() const { return blur_.was_set(); }
  int blur() const { return blur_.value(); }
  void set_blur(int x) { blur_.set(x); }

  bool has_brightness() const { return brightness_.was_set(); }
  int brightness() const { return brightness_.value(); }
  void set_brightness(int x) { brightness_.set(x); }

  bool has_contrast() const { return contrast_.was_set(); }
  int contrast() const { return contrast_.value(); }
  void set_contrast(int x) { contrast_.set(x); }

  // Sets a knob from its name and string value, as found in transform
  // attributes on a tag.  Accepts the long names and the aliases w, h, q, f
  // and g.  Returns false for unknown names or unparsable values, leaving
  // this unchanged.
  bool SetFromName(StringPiece name, StringPiece value);

  // Is name one of the knob names or aliases SetFromName accepts?
  static bool IsKnobName(StringPiece name);

  // Every knob that is unset here takes the value from defaults.
  void MergeDefaultsFrom(const TransformArgs& defaults);

  // Every knob set in overrides replaces the value here.
  void MergeOverridesFrom(const TransformArgs& overrides);

  // Enforces ranges: non-positive width, height and dpr are cleared; the
  // other numeric knobs are clamped into their ranges.
  void Clamp();

  // "key=value" pairs of the set knobs in sorted key order joined with
  // '&'.  Stable across calls and instances; used in cache keys.
  GoogleString CanonicalString() const;

  bool Equals(const TransformArgs& other) const {
    return CanonicalString() == other.CanonicalString();
  }

 private:
  template<class T> class Knob {
   public:
    Knob() : value_(), was_set_(false) {}
    const T& value() const { return value_; }
    bool was_set() const { return was_set_; }
    void set(const T& x) {
      value_ = x;
      was_set_ = true;
    }
    void clear() {
      value_ = T();
      was_set_ = false;
    }
    void MergeDefault(const Knob& other) {
      if (!was_set_ && other.was_set_) {
        set(other.value_);
      }
    }
    void MergeOverride(const Knob& other) {
      if (other.was_set_) {
        set(other.value_);
      }
    }

   private:
    T value_;
    bool was_set_;
  };

  Knob<int> width_;
  Knob<int> height_;
  Knob<Fit> fit_;
  Knob<Format> format_;
  Knob<int> quality_;
  Knob<Gravity> gravity_;
  Knob<int> sharpen_;
  Knob<double> dpr_;
  Knob<int> blur_;
  Knob<int> brightness_;
  Knob<int> contrast_;

  // Copy and assign OK.
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_REWRITER_PUBLIC_TRANSFORM_ARGS_H_
