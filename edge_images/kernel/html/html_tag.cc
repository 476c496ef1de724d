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

#include "edge_images/kernel/html/html_tag.h"

#include <vector>

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

namespace {

const char kClassAttribute[] = "class";

}  // namespace

HtmlTag::HtmlTag() {
  Clear();
}

HtmlTag::~HtmlTag() {
}

void HtmlTag::Clear() {
  name_.clear();
  attributes_.clear();
  is_close_tag_ = false;
  is_self_closing_ = false;
  begin_ = 0;
  end_ = 0;
}

void HtmlTag::set_name(StringPiece name) {
  name_.assign(name.data(), name.size());
  LowerString(&name_);
}

const HtmlTag::Attribute* HtmlTag::FindAttribute(StringPiece name) const {
  for (int i = 0, n = attributes_.size(); i < n; ++i) {
    if (StringCaseEqual(attributes_[i].name(), name)) {
      return &attributes_[i];
    }
  }
  return NULL;
}

const char* HtmlTag::AttributeValue(StringPiece name) const {
  const Attribute* attribute = FindAttribute(name);
  if (attribute == NULL || !attribute->has_value()) {
    return NULL;
  }
  return attribute->value().c_str();
}

void HtmlTag::AddAttribute(StringPiece name, StringPiece value,
                           bool has_value, QuoteStyle quote) {
  attributes_.push_back(Attribute(name, value, has_value, quote));
}

void HtmlTag::SetAttribute(StringPiece name, StringPiece value) {
  for (int i = 0, n = attributes_.size(); i < n; ++i) {
    if (StringCaseEqual(attributes_[i].name(), name)) {
      attributes_[i].set_value(value);
      return;
    }
  }
  attributes_.push_back(Attribute(name, value, true, kDoubleQuote));
}

bool HtmlTag::DeleteAttribute(StringPiece name) {
  bool deleted = false;
  std::vector<Attribute>::iterator p = attributes_.begin();
  while (p != attributes_.end()) {
    if (StringCaseEqual(p->name(), name)) {
      p = attributes_.erase(p);
      deleted = true;
    } else {
      ++p;
    }
  }
  return deleted;
}

bool HtmlTag::HasClass(StringPiece class_name) const {
  const char* classes = AttributeValue(kClassAttribute);
  if (classes == NULL) {
    return false;
  }
  StringPieceVector names;
  SplitStringPieceToVector(classes, " \t\n\r\f", &names, true);
  for (int i = 0, n = names.size(); i < n; ++i) {
    if (names[i] == class_name) {
      return true;
    }
  }
  return false;
}

void HtmlTag::AddClass(StringPiece class_name) {
  if (HasClass(class_name)) {
    return;
  }
  const char* classes = AttributeValue(kClassAttribute);
  GoogleString new_classes;
  if (classes != NULL) {
    StringPiece existing = TrimWhitespace(StringPiece(classes));
    if (!existing.empty()) {
      new_classes = StrCat(existing, " ");
    }
  }
  StrAppend(&new_classes, class_name);
  SetAttribute(kClassAttribute, new_classes);
}

GoogleString HtmlTag::ToString() const {
  GoogleString out("<");
  if (is_close_tag_) {
    StrAppend(&out, "/", name_, ">");
    return out;
  }
  out += name_;
  for (int i = 0, n = attributes_.size(); i < n; ++i) {
    const Attribute& attribute = attributes_[i];
    StrAppend(&out, " ", attribute.name());
    if (!attribute.has_value()) {
      continue;
    }
    const GoogleString& value = attribute.value();
    switch (attribute.quote()) {
      case kNoQuote:
        StrAppend(&out, "=", value);
        break;
      case kSingleQuote:
        if (value.find('\'') == GoogleString::npos) {
          StrAppend(&out, "='", value, "'");
          break;
        }
        // Fall through to double quotes.
      case kDoubleQuote: {
        GoogleString escaped(value);
        GlobalReplaceSubstring("\"", "&quot;", &escaped);
        StrAppend(&out, "=\"", escaped, "\"");
        break;
      }
    }
  }
  out += is_self_closing_ ? " />" : ">";
  return out;
}

}  // namespace edge_images
