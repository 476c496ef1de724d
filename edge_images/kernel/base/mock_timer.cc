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

#include "edge_images/kernel/base/mock_timer.h"

#include "edge_images/kernel/base/basictypes.h"

namespace edge_images {

const int64 MockTimer::kApr_5_2010_ms = 1270493486000LL;

MockTimer::MockTimer(int64 time_ms)
    : time_us_(1000 * time_ms),
      next_delta_(0) {
}

MockTimer::~MockTimer() {
}

void MockTimer::SetTimeUs(int64 new_time_us) {
  absl::MutexLock lock(&mutex_);
  if (time_us_ < new_time_us) {
    time_us_ = new_time_us;
  }
}

void MockTimer::AdvanceUs(int64 delta_us) {
  absl::MutexLock lock(&mutex_);
  time_us_ += delta_us;
}

void MockTimer::SetTimeDeltaUs(int64 delta_us) {
  absl::MutexLock lock(&mutex_);
  deltas_us_.push_back(delta_us);
}

int64 MockTimer::NowUs() const {
  absl::MutexLock lock(&mutex_);
  if (next_delta_ < deltas_us_.size()) {
    time_us_ += deltas_us_[next_delta_++];
  }
  return time_us_;
}

}  // namespace edge_images
