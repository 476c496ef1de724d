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

#include "edge_images/kernel/base/posix_timer.h"

#include <sys/time.h>

#include "edge_images/kernel/base/basictypes.h"

namespace edge_images {

PosixTimer::~PosixTimer() {
}

int64 PosixTimer::NowUs() const {
  struct timeval tv;
  // gettimeofday only fails for a bad tv pointer.
  gettimeofday(&tv, NULL);
  return (static_cast<int64>(tv.tv_sec) * 1000000) + tv.tv_usec;
}

}  // namespace edge_images
