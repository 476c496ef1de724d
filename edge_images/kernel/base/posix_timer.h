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

#ifndef EDGE_IMAGES_KERNEL_BASE_POSIX_TIMER_H_
#define EDGE_IMAGES_KERNEL_BASE_POSIX_TIMER_H_

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/timer.h"

namespace edge_images {

class PosixTimer : public Timer {
 public:
  PosixTimer() {}
  virtual ~PosixTimer();

  virtual int64 NowUs() const;

 private:
  DISALLOW_COPY_AND_ASSIGN(PosixTimer);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_POSIX_TIMER_H_
