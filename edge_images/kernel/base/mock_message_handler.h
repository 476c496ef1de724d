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

#ifndef EDGE_IMAGES_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_
#define EDGE_IMAGES_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_

#include <map>

#include "absl/synchronization/mutex.h"
#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/message_handler.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

namespace edge_images {

// A message handler to use in testcases that keeps track of the number of
// messages output, to validate diagnostics.  Thread-safe.
class MockMessageHandler : public MessageHandler {
 public:
  MockMessageHandler();
  virtual ~MockMessageHandler();

  // Returns number of messages of given type issued.
  int MessagesOfType(MessageType type) const;

  // Returns total number of messages issued.
  int TotalMessages() const;

  // Returns number of messages of severity higher than info.
  int SeriousMessages() const;

  // Every message received, one per line, in the order received.
  GoogleString messages() const;

  // Messages containing any of the added patterns (sub-strings) are not
  // recorded in messages(), but are still counted.
  void AddPatternToSkipPrinting(StringPiece pattern);

 protected:
  virtual void MessageSImpl(MessageType type, const GoogleString& message);
  virtual void FileMessageSImpl(MessageType type, const char* filename,
                                int line, const GoogleString& message);

 private:
  typedef std::map<MessageType, int> MessageCountMap;

  bool ShouldRecordMessage(StringPiece msg) const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  int TotalMessagesImpl() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  int MessagesOfTypeImpl(MessageType type) const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  MessageCountMap message_counts_ ABSL_GUARDED_BY(mutex_);
  StringVector patterns_to_skip_ ABSL_GUARDED_BY(mutex_);
  GoogleString buffer_ ABSL_GUARDED_BY(mutex_);

  DISALLOW_COPY_AND_ASSIGN(MockMessageHandler);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_
