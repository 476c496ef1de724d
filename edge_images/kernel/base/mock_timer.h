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

#ifndef EDGE_IMAGES_KERNEL_BASE_MOCK_TIMER_H_
#define EDGE_IMAGES_KERNEL_BASE_MOCK_TIMER_H_

#include <vector>

#include "absl/synchronization/mutex.h"
#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/timer.h"

namespace edge_images {

class MockTimer : public Timer {
 public:
  // A useful recent time-constant for testing.
  static const int64 kApr_5_2010_ms;

  explicit MockTimer(int64 time_ms);
  virtual ~MockTimer();

  // Sets the time as in microseconds.  Time never moves backward.
  void SetTimeUs(int64 new_time_us);
  void SetTimeMs(int64 new_time_ms) { SetTimeUs(1000 * new_time_ms); }

  // Advance forward time by the specified number of microseconds.
  void AdvanceUs(int64 delta_us);

  // Advance time, in milliseconds.
  void AdvanceMs(int64 delta_ms) { AdvanceUs(1000 * delta_ms); }

  // Queues a time advance applied by the next call to NowUs/NowMs.  Queued
  // deltas are consumed one per call, in order.
  void SetTimeDeltaUs(int64 delta_us);
  void SetTimeDeltaMs(int64 delta_ms) { SetTimeDeltaUs(1000 * delta_ms); }

  virtual int64 NowUs() const;

 private:
  mutable absl::Mutex mutex_;
  mutable int64 time_us_ ABSL_GUARDED_BY(mutex_);
  std::vector<int64> deltas_us_ ABSL_GUARDED_BY(mutex_);
  mutable size_t next_delta_ ABSL_GUARDED_BY(mutex_);

  DISALLOW_COPY_AND_ASSIGN(MockTimer);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_MOCK_TIMER_H_
