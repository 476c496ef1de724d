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

#ifndef EDGE_IMAGES_KERNEL_HTML_HTML_TAG_LEXER_H_
#define EDGE_IMAGES_KERNEL_HTML_HTML_TAG_LEXER_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "edge_images/kernel/html/html_tag.h"

namespace edge_images {

// Walks an HTML fragment one tag at a time.  Text, comments, directives
// and the bodies of literal elements (script, style, textarea) are
// skipped.  There is no tree: callers see start and end tags in source
// order along with their byte ranges, and splice replacements into the
// original text themselves.
//
// Malformed tags are passed over as text, as browsers do.
class HtmlTagLexer {
 public:
  // Does not copy html; it must outlive the lexer.
  explicit HtmlTagLexer(StringPiece html);
  ~HtmlTagLexer();

  // Finds the next tag at or after the current position.  Returns false
  // when the input is exhausted.
  bool NextTag(HtmlTag* tag);

  // Current byte offset into the input.
  int position() const { return position_; }

 private:
  enum State {
    TAG,                   // "<"
    TAG_CLOSE,             // "</"
    TAG_CLOSE_TERMINATE,   // "</x "
    TAG_OPEN,              // "<x"
    TAG_BRIEF_CLOSE,       // "<x /"
    TAG_ATTRIBUTE,         // "<x "
    TAG_ATTR_NAME,         // "<x y"
    TAG_ATTR_NAME_SPACE,   // "<x y "
    TAG_ATTR_EQ,           // "<x y="
    TAG_ATTR_VAL,          // "<x y=x"
    TAG_ATTR_VALDQ,        // '<x y="'
    TAG_ATTR_VALSQ,        // "<x y='"
    TAG_DONE,
    TAG_ERROR,
  };

  // Lexes a single tag whose '<' is at offset start.  Returns false if
  // the text there is not a well-formed tag.
  bool ParseTag(int start, HtmlTag* tag);

  void EvalTag(char c);
  void EvalTagOpen(char c);
  void EvalTagClose(char c);
  void EvalTagBriefClose(char c);
  void EvalAttribute(char c);
  void EvalAttrName(char c);
  void EvalAttrEq(char c);
  void EvalAttrVal(char c, int index);
  void EvalAttrValQuoted(char c, char quote);

  void MakeAttribute(bool has_value);
  void FinishTag(bool self_closing);

  static bool IsLegalTagFirstChar(char c);
  static bool IsLegalTagChar(char c);
  static bool IsLegalAttrNameChar(char c);

  // Skips "<!-- ... -->" or "<!...>" / "<?...>" starting at start,
  // returning the offset after it.
  int SkipMarkupDeclaration(int start) const;

  // Returns the offset of the "</name" that terminates a literal element
  // whose body starts at start, or the input size.
  int FindLiteralClose(StringPiece name, int start) const;

  StringPiece html_;
  int position_;

  // Per-tag lexing state.
  State state_;
  HtmlTag* tag_;
  GoogleString token_;
  GoogleString attr_name_;
  GoogleString attr_value_;
  HtmlTag::QuoteStyle attr_quote_;
  bool has_attr_value_;

  DISALLOW_COPY_AND_ASSIGN(HtmlTagLexer);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_HTML_HTML_TAG_LEXER_H_
