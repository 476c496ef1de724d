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

#include "edge_images/kernel/base/timer.h"

namespace edge_images {

const int64 Timer::kSecondUs;
const int64 Timer::kSecondMs;
const int64 Timer::kMinuteMs;
const int64 Timer::kHourMs;
const int64 Timer::kDayMs;

Timer::~Timer() {
}

}  // namespace edge_images
