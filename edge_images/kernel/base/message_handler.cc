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

#include "edge_images/kernel/base/message_handler.h"

#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace edge_images {

MessageHandler::MessageHandler() : min_message_type_(kInfo) {
}

MessageHandler::~MessageHandler() {
}

const char* MessageHandler::MessageTypeToString(const MessageType type) const {
  // No 'default:' so that the compiler can tell us when we are missing an
  // enum value.
  switch (type) {
    case kInfo:
      return "Info";
    case kWarning:
      return "Warning";
    case kError:
      return "Error";
    case kFatal:
      return "Fatal";
  }
  return "Invalid";
}

MessageType MessageHandler::StringToMessageType(StringPiece msg) {
  if (StringCaseEqual(msg, "Warning")) {
    return kWarning;
  } else if (StringCaseEqual(msg, "Error")) {
    return kError;
  } else if (StringCaseEqual(msg, "Fatal")) {
    return kFatal;
  }
  return kInfo;
}

void MessageHandler::Message(MessageType type, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  MessageV(type, msg, args);
  va_end(args);
}

void MessageHandler::MessageV(MessageType type, const char* msg, va_list args) {
  if (type >= min_message_type_) {
    MessageVImpl(type, msg, args);
  }
}

void MessageHandler::FileMessage(MessageType type, const char* file, int line,
                                 const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(type, file, line, msg, args);
  va_end(args);
}

void MessageHandler::FileMessageV(MessageType type, const char* filename,
                                  int line, const char* msg, va_list args) {
  if (type >= min_message_type_) {
    FileMessageVImpl(type, filename, line, msg, args);
  }
}

void MessageHandler::Check(bool condition, const char* msg, ...) {
  if (!condition) {
    va_list args;
    va_start(args, msg);
    MessageV(kFatal, msg, args);
    va_end(args);
  }
}

void MessageHandler::Info(const char* file, int line, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kInfo, file, line, msg, args);
  va_end(args);
}

void MessageHandler::Warning(const char* file, int line, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kWarning, file, line, msg, args);
  va_end(args);
}

void MessageHandler::Error(const char* file, int line, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kError, file, line, msg, args);
  va_end(args);
}

void MessageHandler::FatalError(
    const char* file, int line, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kFatal, file, line, msg, args);
  va_end(args);
}

void MessageHandler::MessageS(MessageType type, const GoogleString& message) {
  if (type >= min_message_type_) {
    MessageSImpl(type, message);
  }
}

void MessageHandler::FileMessageS(MessageType type, const char* filename,
                                  int line, const GoogleString& message) {
  if (type >= min_message_type_) {
    FileMessageSImpl(type, filename, line, message);
  }
}

void MessageHandler::MessageVImpl(MessageType type, const char* msg,
                                  va_list args) {
  GoogleString buffer;
  FormatTo(&buffer, msg, args);
  MessageSImpl(type, buffer);
}

void MessageHandler::FileMessageVImpl(MessageType type, const char* filename,
                                      int line, const char* msg,
                                      va_list args) {
  GoogleString buffer;
  FormatTo(&buffer, msg, args);
  FileMessageSImpl(type, filename, line, buffer);
}

void MessageHandler::FormatTo(GoogleString* buffer, const char* msg,
                              va_list args) {
  va_list measure;
  va_copy(measure, args);
  int size = vsnprintf(NULL, 0, msg, measure);
  va_end(measure);
  if (size <= 0) {
    return;
  }
  size_t old_size = buffer->size();
  buffer->resize(old_size + size + 1);
  vsnprintf(&(*buffer)[old_size], size + 1, msg, args);
  buffer->resize(old_size + size);
}

NullMessageHandler::~NullMessageHandler() {
}

void NullMessageHandler::MessageSImpl(MessageType type,
                                      const GoogleString& message) {
}

void NullMessageHandler::FileMessageSImpl(MessageType type,
                                          const char* filename, int line,
                                          const GoogleString& message) {
}

}  // namespace edge_images
