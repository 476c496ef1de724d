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

#ifndef EDGE_IMAGES_KERNEL_BASE_TIMER_H_
#define EDGE_IMAGES_KERNEL_BASE_TIMER_H_

#include "edge_images/kernel/base/basictypes.h"

namespace edge_images {

// Timer interface, made virtual so it can be mocked for tests.
class Timer {
 public:
  // Note: it's important that these stay compile-time constants, to
  // avoid weird init order surprises.
  static const int64 kSecondUs = 1000 * 1000;
  static const int64 kSecondMs = 1000;
  static const int64 kMinuteMs = 60 * kSecondMs;
  static const int64 kHourMs = 60 * kMinuteMs;
  static const int64 kDayMs = 24 * kHourMs;

  virtual ~Timer();

  // Returns number of microseconds since 1970.
  virtual int64 NowUs() const = 0;

  // Returns number of milliseconds since 1970.
  int64 NowMs() const { return NowUs() / 1000; }
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_TIMER_H_
