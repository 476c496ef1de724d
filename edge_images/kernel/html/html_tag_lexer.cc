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

#include "edge_images/kernel/html/html_tag_lexer.h"

#include <cctype>

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/html/html_tag.h"

namespace edge_images {

namespace {

// Elements whose content is not markup.  Tags inside them are not
// reported.
const char* const kLiteralTags[] = {
  "script", "style", "textarea", "title",
};

bool IsLiteralTag(StringPiece name) {
  for (int i = 0, n = arraysize(kLiteralTags); i < n; ++i) {
    if (name == kLiteralTags[i]) {
      return true;
    }
  }
  return false;
}

}  // namespace

HtmlTagLexer::HtmlTagLexer(StringPiece html)
    : html_(html),
      position_(0),
      state_(TAG),
      tag_(NULL),
      attr_quote_(HtmlTag::kNoQuote),
      has_attr_value_(false) {
}

HtmlTagLexer::~HtmlTagLexer() {
}

bool HtmlTagLexer::NextTag(HtmlTag* tag) {
  const int size = html_.size();
  while (position_ < size) {
    StringPiece::size_type lt = html_.find('<', position_);
    if (lt == StringPiece::npos) {
      position_ = size;
      return false;
    }
    int start = static_cast<int>(lt);
    if ((start + 1 < size) &&
        ((html_[start + 1] == '!') || (html_[start + 1] == '?'))) {
      position_ = SkipMarkupDeclaration(start);
      continue;
    }
    if (ParseTag(start, tag)) {
      position_ = tag->end();
      if (!tag->is_close_tag() && !tag->is_self_closing() &&
          IsLiteralTag(tag->name())) {
        position_ = FindLiteralClose(tag->name(), position_);
      }
      return true;
    }
    // Not a tag: the '<' is text.
    position_ = start + 1;
  }
  return false;
}

bool HtmlTagLexer::ParseTag(int start, HtmlTag* tag) {
  tag->Clear();
  tag_ = tag;
  state_ = TAG;
  token_.clear();
  attr_name_.clear();
  attr_value_.clear();
  attr_quote_ = HtmlTag::kNoQuote;
  has_attr_value_ = false;

  const int size = html_.size();
  for (int i = start + 1; i < size; ++i) {
    char c = html_[i];
    switch (state_) {
      case TAG:                  EvalTag(c);                          break;
      case TAG_OPEN:             EvalTagOpen(c);                      break;
      case TAG_CLOSE:            EvalTagClose(c);                     break;
      case TAG_CLOSE_TERMINATE:  EvalTagClose(c);                     break;
      case TAG_BRIEF_CLOSE:      EvalTagBriefClose(c);                break;
      case TAG_ATTRIBUTE:        EvalAttribute(c);                    break;
      case TAG_ATTR_NAME:        EvalAttrName(c);                     break;
      case TAG_ATTR_NAME_SPACE:  EvalAttrName(c);                     break;
      case TAG_ATTR_EQ:          EvalAttrEq(c);                       break;
      case TAG_ATTR_VAL:         EvalAttrVal(c, i);                   break;
      case TAG_ATTR_VALDQ:       EvalAttrValQuoted(c, '"');           break;
      case TAG_ATTR_VALSQ:       EvalAttrValQuoted(c, '\'');          break;
      case TAG_DONE:
      case TAG_ERROR:
        break;
    }
    if (state_ == TAG_DONE) {
      tag->set_range(start, i + 1);
      tag_ = NULL;
      return true;
    }
    if (state_ == TAG_ERROR) {
      break;
    }
  }
  // Unterminated or malformed.
  tag_ = NULL;
  return false;
}

// Browsers appear to only allow letters for first char in tag name.
bool HtmlTagLexer::IsLegalTagFirstChar(char c) {
  return isalpha(static_cast<unsigned char>(c));
}

bool HtmlTagLexer::IsLegalTagChar(char c) {
  return (isalnum(static_cast<unsigned char>(c)) || (c == '-') ||
          (c == '_') || (c == ':'));
}

bool HtmlTagLexer::IsLegalAttrNameChar(char c) {
  return ((c != '=') && (c != '>') && (c != '/') && !IsHtmlSpace(c));
}

// Handle the case where "<" was recently parsed.
void HtmlTagLexer::EvalTag(char c) {
  if (c == '/') {
    tag_->set_is_close_tag(true);
    state_ = TAG_CLOSE;
  } else if (IsLegalTagFirstChar(c)) {
    state_ = TAG_OPEN;
    token_ += c;
  } else {
    state_ = TAG_ERROR;
  }
}

// Handle the case where "<x" was recently parsed.  We stay in this state
// as long as we keep seeing legal tag characters.
void HtmlTagLexer::EvalTagOpen(char c) {
  if (IsLegalTagChar(c)) {
    token_ += c;
  } else if (c == '>') {
    FinishTag(false);
  } else if (c == '/') {
    state_ = TAG_BRIEF_CLOSE;
  } else if (IsHtmlSpace(c)) {
    state_ = TAG_ATTRIBUTE;
  } else {
    state_ = TAG_ERROR;
  }
}

// Handle "</" and "</x ".  Anything between the name and the '>' of a
// close tag is ignored.
void HtmlTagLexer::EvalTagClose(char c) {
  if (c == '>') {
    if (token_.empty()) {
      state_ = TAG_ERROR;
    } else {
      FinishTag(false);
    }
  } else if (state_ == TAG_CLOSE_TERMINATE) {
    // "</a b>": ignore b.
  } else if (token_.empty() ? IsLegalTagFirstChar(c) : IsLegalTagChar(c)) {
    token_ += c;
  } else if (IsHtmlSpace(c) && !token_.empty()) {
    state_ = TAG_CLOSE_TERMINATE;
  } else {
    state_ = TAG_ERROR;
  }
}

// Handle the case where "<x /" or "<x y /" was recently parsed.  Anything
// but '>' means the "/" was junk inside the tag.
void HtmlTagLexer::EvalTagBriefClose(char c) {
  if (c == '>') {
    FinishTag(true);
  } else {
    state_ = TAG_ATTRIBUTE;
    EvalAttribute(c);
  }
}

void HtmlTagLexer::EvalAttribute(char c) {
  if (c == '>') {
    FinishTag(false);
  } else if (c == '/') {
    state_ = TAG_BRIEF_CLOSE;
  } else if (IsLegalAttrNameChar(c)) {
    attr_name_ += c;
    state_ = TAG_ATTR_NAME;
  }
  // Whitespace and a stray '=' are skipped.
}

// "<x y" or "<x y ".
void HtmlTagLexer::EvalAttrName(char c) {
  if (c == '=') {
    state_ = TAG_ATTR_EQ;
    has_attr_value_ = true;
  } else if (IsHtmlSpace(c)) {
    state_ = TAG_ATTR_NAME_SPACE;
  } else if (c == '>') {
    MakeAttribute(false);
    FinishTag(false);
  } else if (c == '/') {
    MakeAttribute(false);
    state_ = TAG_BRIEF_CLOSE;
  } else if (state_ == TAG_ATTR_NAME_SPACE) {
    // "<x y z".  Now that we see the 'z', we need to finish 'y' as an
    // attribute, then queue up 'z' as the start of a new attribute.
    MakeAttribute(false);
    attr_name_ += c;
    state_ = TAG_ATTR_NAME;
  } else {
    attr_name_ += c;
  }
}

void HtmlTagLexer::EvalAttrEq(char c) {
  if (c == '"') {
    attr_quote_ = HtmlTag::kDoubleQuote;
    state_ = TAG_ATTR_VALDQ;
  } else if (c == '\'') {
    attr_quote_ = HtmlTag::kSingleQuote;
    state_ = TAG_ATTR_VALSQ;
  } else if (IsHtmlSpace(c)) {
    // ignore -- spaces are allowed between "=" and the value
  } else if (c == '>') {
    MakeAttribute(true);
    FinishTag(false);
  } else {
    attr_quote_ = HtmlTag::kNoQuote;
    state_ = TAG_ATTR_VAL;
    attr_value_ += c;
  }
}

// Unquoted values run to whitespace or '>'.  A '/' is part of the value
// (<a href=/search>) unless it immediately precedes the '>'.
void HtmlTagLexer::EvalAttrVal(char c, int index) {
  if (IsHtmlSpace(c)) {
    MakeAttribute(true);
  } else if (c == '>') {
    MakeAttribute(true);
    FinishTag(false);
  } else if ((c == '/') && (index + 1 < static_cast<int>(html_.size())) &&
             (html_[index + 1] == '>')) {
    MakeAttribute(true);
    state_ = TAG_BRIEF_CLOSE;
  } else {
    attr_value_ += c;
  }
}

void HtmlTagLexer::EvalAttrValQuoted(char c, char quote) {
  if (c == quote) {
    MakeAttribute(true);
  } else {
    attr_value_ += c;
  }
}

void HtmlTagLexer::MakeAttribute(bool has_value) {
  tag_->AddAttribute(attr_name_, attr_value_, has_value,
                     has_value ? attr_quote_ : HtmlTag::kNoQuote);
  attr_name_.clear();
  attr_value_.clear();
  attr_quote_ = HtmlTag::kNoQuote;
  has_attr_value_ = false;
  state_ = TAG_ATTRIBUTE;
}

void HtmlTagLexer::FinishTag(bool self_closing) {
  tag_->set_name(token_);
  tag_->set_is_self_closing(self_closing && !tag_->is_close_tag());
  state_ = TAG_DONE;
}

int HtmlTagLexer::SkipMarkupDeclaration(int start) const {
  const int size = html_.size();
  StringPiece rest = html_.substr(start);
  StringPiece::size_type end;
  int skip;
  if (HasPrefixString(rest, "<!--")) {
    end = rest.find("-->", 4);
    skip = 3;
  } else {
    end = rest.find('>');
    skip = 1;
  }
  if (end == StringPiece::npos) {
    return size;
  }
  return start + static_cast<int>(end) + skip;
}

int HtmlTagLexer::FindLiteralClose(StringPiece name, int start) const {
  GoogleString close_prefix = StrCat("</", name);
  size_t pos = FindIgnoreCase(html_.substr(start), close_prefix);
  if (pos == StringPiece::npos) {
    return html_.size();
  }
  return start + static_cast<int>(pos);
}

}  // namespace edge_images
