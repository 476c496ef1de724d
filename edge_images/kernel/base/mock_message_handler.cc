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

#include "edge_images/kernel/base/mock_message_handler.h"

#include <map>
#include <utility>

#include "edge_images/kernel/base/message_handler.h"
#include "edge_images/kernel/base/string.h"

namespace edge_images {

MockMessageHandler::MockMessageHandler() {
}

MockMessageHandler::~MockMessageHandler() {
}

void MockMessageHandler::MessageSImpl(MessageType type,
                                      const GoogleString& message) {
  absl::MutexLock hold_mutex(&mutex_);
  if (ShouldRecordMessage(message)) {
    StrAppend(&buffer_, MessageTypeToString(type), ": ", message, "\n");
  }
  ++message_counts_[type];
}

void MockMessageHandler::FileMessageSImpl(MessageType type,
                                          const char* filename, int line,
                                          const GoogleString& message) {
  absl::MutexLock hold_mutex(&mutex_);
  if (ShouldRecordMessage(message)) {
    StrAppend(&buffer_, MessageTypeToString(type), ": ", filename, ":",
              IntegerToString(line), ": ", message, "\n");
  }
  ++message_counts_[type];
}

int MockMessageHandler::MessagesOfType(MessageType type) const {
  absl::MutexLock hold_mutex(&mutex_);
  return MessagesOfTypeImpl(type);
}

int MockMessageHandler::MessagesOfTypeImpl(MessageType type) const {
  MessageCountMap::const_iterator i = message_counts_.find(type);
  if (i != message_counts_.end()) {
    return i->second;
  } else {
    return 0;
  }
}

int MockMessageHandler::TotalMessages() const {
  absl::MutexLock hold_mutex(&mutex_);
  return TotalMessagesImpl();
}

int MockMessageHandler::TotalMessagesImpl() const {
  int total = 0;
  for (MessageCountMap::const_iterator i = message_counts_.begin();
       i != message_counts_.end(); ++i) {
    total += i->second;
  }
  return total;
}

int MockMessageHandler::SeriousMessages() const {
  absl::MutexLock hold_mutex(&mutex_);
  return TotalMessagesImpl() - MessagesOfTypeImpl(kInfo);
}

GoogleString MockMessageHandler::messages() const {
  absl::MutexLock hold_mutex(&mutex_);
  return buffer_;
}

void MockMessageHandler::AddPatternToSkipPrinting(StringPiece pattern) {
  absl::MutexLock hold_mutex(&mutex_);
  patterns_to_skip_.push_back(GoogleString(pattern));
}

bool MockMessageHandler::ShouldRecordMessage(StringPiece msg) const {
  for (int i = 0, n = patterns_to_skip_.size(); i < n; ++i) {
    if (msg.find(patterns_to_skip_[i]) != StringPiece::npos) {
      return false;
    }
  }
  return true;
}

}  // namespace edge_images
