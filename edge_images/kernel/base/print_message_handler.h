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

#ifndef EDGE_IMAGES_KERNEL_BASE_PRINT_MESSAGE_HANDLER_H_
#define EDGE_IMAGES_KERNEL_BASE_PRINT_MESSAGE_HANDLER_H_

#include <cstdio>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/message_handler.h"
#include "edge_images/kernel/base/string.h"

namespace edge_images {

// A message handler that writes one annotated line per message to a stdio
// stream:  "[Warning] file.cc:12: message".
class PrintMessageHandler : public MessageHandler {
 public:
  // Writes to stderr.
  PrintMessageHandler();
  // Does not take ownership of file.
  explicit PrintMessageHandler(FILE* file);
  virtual ~PrintMessageHandler();

 protected:
  virtual void MessageSImpl(MessageType type, const GoogleString& message);
  virtual void FileMessageSImpl(MessageType type, const char* filename,
                                int line, const GoogleString& message);

 private:
  FILE* file_;

  DISALLOW_COPY_AND_ASSIGN(PrintMessageHandler);
};

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_PRINT_MESSAGE_HANDLER_H_
