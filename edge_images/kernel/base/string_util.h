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

#ifndef EDGE_IMAGES_KERNEL_BASE_STRING_UTIL_H_
#define EDGE_IMAGES_KERNEL_BASE_STRING_UTIL_H_

#include <cctype>
#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"

namespace edge_images {

typedef absl::string_view StringPiece;

typedef std::vector<GoogleString> StringVector;
typedef std::vector<StringPiece> StringPieceVector;
typedef std::set<GoogleString> StringSet;
typedef std::map<GoogleString, GoogleString> StringStringMap;

using absl::StrAppend;
using absl::StrCat;

inline GoogleString IntegerToString(int i) {
  return absl::StrCat(i);
}

inline GoogleString Integer64ToString(int64 i) {
  return absl::StrCat(i);
}

// Parses a decimal integer.  Leading and trailing whitespace is rejected,
// as is any trailing garbage.
bool StringToInt(StringPiece in, int* out);
bool StringToInt64(StringPiece in, int64* out);
bool StringToDouble(StringPiece in, double* out);

// Formats a double the way srcset and CSS want to see it: shortest
// round-trippable form, no trailing zeros ("1.5", "2", "0.25").
GoogleString DoubleToString(double value);

// Splits sp on any character in separators.  When omit_empty_strings is
// set, consecutive separators do not produce empty components.
void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings);

bool HasPrefixString(StringPiece str, StringPiece prefix);

void LowerString(GoogleString* str);

// Replaces all occurrences of substring in *s.  Returns the number of
// replacements made.
int GlobalReplaceSubstring(StringPiece substring, StringPiece replacement,
                           GoogleString* s);

// Returns the index of the first case-insensitive match of needle in
// haystack, or StringPiece::npos.
size_t FindIgnoreCase(StringPiece haystack, StringPiece needle);

inline char LowerChar(char c) {
  return static_cast<char>(tolower(static_cast<unsigned char>(c)));
}

// HTML5 space characters.
inline bool IsHtmlSpace(char c) {
  return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') ||
      (c == '\f');
}

inline bool IsAsciiDigit(char c) {
  return (c >= '0') && (c <= '9');
}

// Removes leading and trailing HTML whitespace.  Returns true if anything
// was removed.
bool TrimWhitespace(StringPiece* str);

inline StringPiece TrimWhitespace(StringPiece str) {
  TrimWhitespace(&str);
  return str;
}

bool StringCaseEqual(StringPiece s1, StringPiece s2);
bool StringCaseStartsWith(StringPiece str, StringPiece prefix);
bool StringCaseEndsWith(StringPiece str, StringPiece suffix);

inline const char* BoolToString(bool b) {
  return (b ? "true" : "false");
}

// Parses the usual spellings of a boolean setting: true/false, on/off,
// yes/no, 1/0.
bool StringToBool(StringPiece in, bool* out);

template<class C>
GoogleString JoinCollection(const C& collection, StringPiece sep) {
  return absl::StrJoin(collection, sep);
}

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_STRING_UTIL_H_
