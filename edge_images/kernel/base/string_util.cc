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

#include "edge_images/kernel/base/string_util.h"

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"

namespace edge_images {

namespace {

// absl::SimpleAtoi tolerates surrounding whitespace; the attribute and
// option values we parse must be bare numbers.
bool IsBareToken(StringPiece in) {
  return !in.empty() && !IsHtmlSpace(in.front()) && !IsHtmlSpace(in.back());
}

}  // namespace

bool StringToInt(StringPiece in, int* out) {
  return IsBareToken(in) && absl::SimpleAtoi(in, out);
}

bool StringToInt64(StringPiece in, int64* out) {
  int64_t value;
  if (!IsBareToken(in) || !absl::SimpleAtoi(in, &value)) {
    return false;
  }
  *out = value;
  return true;
}

bool StringToDouble(StringPiece in, double* out) {
  return IsBareToken(in) && absl::SimpleAtod(in, out);
}

GoogleString DoubleToString(double value) {
  return absl::StrFormat("%.16g", value);
}

void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings) {
  size_t prev_pos = 0;
  size_t pos = 0;
  while ((pos = sp.find_first_of(separators, pos)) != StringPiece::npos) {
    if (!omit_empty_strings || (pos > prev_pos)) {
      components->push_back(sp.substr(prev_pos, pos - prev_pos));
    }
    ++pos;
    prev_pos = pos;
  }
  if (!omit_empty_strings || (prev_pos < sp.size())) {
    components->push_back(sp.substr(prev_pos));
  }
}

bool HasPrefixString(StringPiece str, StringPiece prefix) {
  return absl::StartsWith(str, prefix);
}

void LowerString(GoogleString* str) {
  absl::AsciiStrToLower(str);
}

int GlobalReplaceSubstring(StringPiece substring, StringPiece replacement,
                           GoogleString* s) {
  if (s->empty() || substring.empty()) {
    return 0;
  }
  return absl::StrReplaceAll({{substring, replacement}}, s);
}

size_t FindIgnoreCase(StringPiece haystack, StringPiece needle) {
  StringPiece::const_iterator found = std::search(
      haystack.begin(), haystack.end(), needle.begin(), needle.end(),
      [](char a, char b) { return LowerChar(a) == LowerChar(b); });
  if (found == haystack.end() && !needle.empty()) {
    return StringPiece::npos;
  }
  return found - haystack.begin();
}

bool TrimWhitespace(StringPiece* str) {
  size_t size = str->size();
  size_t trim = 0;
  while (trim != size && IsHtmlSpace((*str)[trim])) {
    ++trim;
  }
  str->remove_prefix(trim);
  size_t trailing = 0;
  while (trailing != str->size() &&
         IsHtmlSpace((*str)[str->size() - trailing - 1])) {
    ++trailing;
  }
  str->remove_suffix(trailing);
  return (trim + trailing) > 0;
}

bool StringCaseEqual(StringPiece s1, StringPiece s2) {
  return absl::EqualsIgnoreCase(s1, s2);
}

bool StringCaseStartsWith(StringPiece str, StringPiece prefix) {
  return absl::StartsWithIgnoreCase(str, prefix);
}

bool StringCaseEndsWith(StringPiece str, StringPiece suffix) {
  return absl::EndsWithIgnoreCase(str, suffix);
}

bool StringToBool(StringPiece in, bool* out) {
  StringPiece value = TrimWhitespace(in);
  if (StringCaseEqual(value, "true") || StringCaseEqual(value, "on") ||
      StringCaseEqual(value, "yes") || (value == "1")) {
    *out = true;
    return true;
  }
  if (StringCaseEqual(value, "false") || StringCaseEqual(value, "off") ||
      StringCaseEqual(value, "no") || (value == "0")) {
    *out = false;
    return true;
  }
  return false;
}

}  // namespace edge_images
