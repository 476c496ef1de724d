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

#ifndef EDGE_IMAGES_KERNEL_HTML_HTML_TAG_H_
#define EDGE_IMAGES_KERNEL_HTML_HTML_TAG_H_

#include <vector>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// One start or end tag found in an HTML fragment, with its attributes in
// source order.  Attribute values are kept exactly as written (no entity
// decoding) so that untouched attributes serialize back byte-for-byte.
class HtmlTag {
 public:
  enum QuoteStyle {
    kNoQuote,
    kDoubleQuote,
    kSingleQuote,
  };

  class Attribute {
   public:
    Attribute(StringPiece name, StringPiece value, bool has_value,
              QuoteStyle quote)
        : name_(name.data(), name.size()),
          value_(value.data(), value.size()),
          has_value_(has_value),
          quote_(quote) {
    }

    const GoogleString& name() const { return name_; }
    const GoogleString& value() const { return value_; }
    bool has_value() const { return has_value_; }
    QuoteStyle quote() const { return quote_; }

    void set_value(StringPiece value) {
      value_.assign(value.data(), value.size());
      has_value_ = true;
      quote_ = kDoubleQuote;
    }

   private:
    GoogleString name_;
    GoogleString value_;
    bool has_value_;
    QuoteStyle quote_;
  };

  HtmlTag();
  ~HtmlTag();

  void Clear();

  // Tag names are stored lower-cased.
  const GoogleString& name() const { return name_; }
  void set_name(StringPiece name);

  bool is_close_tag() const { return is_close_tag_; }
  void set_is_close_tag(bool x) { is_close_tag_ = x; }

  // True for "<img ... />".
  bool is_self_closing() const { return is_self_closing_; }
  void set_is_self_closing(bool x) { is_self_closing_ = x; }

  // Byte offsets of the '<' and one past the '>' in the lexed input.
  int begin() const { return begin_; }
  int end() const { return end_; }
  void set_range(int begin, int end) {
    begin_ = begin;
    end_ = end;
  }

  int num_attributes() const { return attributes_.size(); }
  const Attribute& attribute(int i) const { return attributes_[i]; }

  // Looks up an attribute by case-insensitive name, returning NULL if the
  // tag does not carry it.
  const Attribute* FindAttribute(StringPiece name) const;

  // Returns the value of the named attribute, or NULL if the attribute is
  // absent or has no value (e.g. <img ismap>).
  const char* AttributeValue(StringPiece name) const;

  // Appends an attribute as found by the lexer.
  void AddAttribute(StringPiece name, StringPiece value, bool has_value,
                    QuoteStyle quote);

  // Replaces the value of an existing attribute, keeping its position, or
  // appends a new double-quoted attribute.
  void SetAttribute(StringPiece name, StringPiece value);

  // Removes every attribute with the given name.  Returns false if none
  // was present.
  bool DeleteAttribute(StringPiece name);

  // Class-list helpers on the "class" attribute.  AddClass is a no-op if
  // the class is already present.
  bool HasClass(StringPiece class_name) const;
  void AddClass(StringPiece class_name);

  // Serializes the tag.  Values containing the quote character in use are
  // re-quoted with double quotes and &quot; escaping.
  GoogleString ToString() const;

 private:
  GoogleString name_;
  std::vector<Attribute> attributes_;
  bool is_close_tag_;
  bool is_self_closing_;
  int begin_;
  int end_;

  // Copy and assign OK.
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_HTML_HTML_TAG_H_
