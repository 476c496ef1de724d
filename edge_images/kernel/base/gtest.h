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

#ifndef EDGE_IMAGES_KERNEL_BASE_GTEST_H_
#define EDGE_IMAGES_KERNEL_BASE_GTEST_H_

#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

// EXPECT_HAS_SUBSTR and EXPECT_HAS_SUBSTR_NE allow a simple way to search
// for a substring.  Work on StringPiece, char* and GoogleString.
#define EXPECT_HAS_SUBSTR(needle, haystack)              \
  EXPECT_THAT(GoogleString(haystack),                   \
              ::testing::HasSubstr(GoogleString(needle)))

#define EXPECT_HAS_SUBSTR_NE(needle, haystack)                           \
  EXPECT_THAT(GoogleString(haystack),                                   \
              ::testing::Not(::testing::HasSubstr(GoogleString(needle))))

#endif  // EDGE_IMAGES_KERNEL_BASE_GTEST_H_
