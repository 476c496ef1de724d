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

#include "edge_images/kernel/base/cache_interface.h"

namespace edge_images {

CacheInterface::~CacheInterface() {
}

CacheInterface::Callback::~Callback() {
}

const char* CacheInterface::KeyStateName(KeyState state) {
  switch (state) {
    case kAvailable:
      return "available";
    case kNotFound:
      return "not_found";
    case kOverload:
      return "overload";
    case kNetworkError:
      return "network_error";
    case kTimeout:
      return "timeout";
  }
  return "unknown";
}

void CacheInterface::ValidateAndReportResult(const GoogleString& key,
                                             KeyState state,
                                             Callback* callback) {
  if (!callback->ValidateCandidate(key, state)) {
    state = kNotFound;
  }
  callback->Done(state);
}

}  // namespace edge_images
