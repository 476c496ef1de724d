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

#ifndef EDGE_IMAGES_KERNEL_BASE_MESSAGE_HANDLER_H_
#define EDGE_IMAGES_KERNEL_BASE_MESSAGE_HANDLER_H_

#include <cstdarg>

#include "edge_images/kernel/base/basictypes.h"
#include "edge_images/kernel/base/string.h"
#include "edge_images/kernel/base/string_util.h"

#if defined(__GNUC__)
#define EDGE_IMAGES_PRINTF_FORMAT(x, y) __attribute__((format(printf, x, y)))
#else
#define EDGE_IMAGES_PRINTF_FORMAT(x, y)
#endif

namespace edge_images {

enum MessageType {
  kInfo,
  kWarning,
  kError,
  kFatal
};

// Destination for all diagnostics the engine produces.  The engine never
// throws; every failure it recovers from is reported here instead.
class MessageHandler {
 public:
  MessageHandler();
  virtual ~MessageHandler();

  // String representation for MessageType.
  const char* MessageTypeToString(const MessageType type) const;

  // Convert string to MessageType.  Unknown strings map to kInfo.
  static MessageType StringToMessageType(StringPiece msg);

  // Specify the minimum message type. Lower message types will not be
  // logged.
  void set_min_message_type(MessageType min) { min_message_type_ = min; }
  MessageType min_message_type() const { return min_message_type_; }

  // Log an info, warning, error or fatal error message.
  void Message(MessageType type, const char* msg, ...)
      EDGE_IMAGES_PRINTF_FORMAT(3, 4);
  void MessageV(MessageType type, const char* msg, va_list args);

  // Log a message with a filename and line number attached.
  void FileMessage(MessageType type, const char* filename, int line,
                   const char* msg, ...) EDGE_IMAGES_PRINTF_FORMAT(5, 6);
  void FileMessageV(MessageType type, const char* filename, int line,
                    const char* msg, va_list args);

  // Conditional errors.
  void Check(bool condition, const char* msg, ...)
      EDGE_IMAGES_PRINTF_FORMAT(3, 4);

  void Info(const char* filename, int line, const char* msg, ...)
      EDGE_IMAGES_PRINTF_FORMAT(4, 5);
  void Warning(const char* filename, int line, const char* msg, ...)
      EDGE_IMAGES_PRINTF_FORMAT(4, 5);
  void Error(const char* filename, int line, const char* msg, ...)
      EDGE_IMAGES_PRINTF_FORMAT(4, 5);
  void FatalError(const char* filename, int line, const char* msg, ...)
      EDGE_IMAGES_PRINTF_FORMAT(4, 5);

  // Unformatted messaging.
  void MessageS(MessageType type, const GoogleString& message);
  void FileMessageS(MessageType type, const char* filename, int line,
                    const GoogleString& message);

 protected:
  // These have default implementations in terms of MessageSImpl and
  // FileMessageSImpl; formatting happens once, at the top of the stack.
  virtual void MessageVImpl(MessageType type, const char* msg,
                            va_list args);
  virtual void FileMessageVImpl(MessageType type, const char* filename,
                                int line, const char* msg, va_list args);

  virtual void MessageSImpl(MessageType type, const GoogleString& message) = 0;
  virtual void FileMessageSImpl(
      MessageType type, const char* filename, int line,
      const GoogleString& message) = 0;

  // FormatTo appends to *buffer.
  void FormatTo(GoogleString* buffer, const char* msg, va_list args);

 private:
  MessageType min_message_type_;

  DISALLOW_COPY_AND_ASSIGN(MessageHandler);
};

// Drops every message.  Useful as a default when the caller does not care.
class NullMessageHandler : public MessageHandler {
 public:
  NullMessageHandler() {}
  virtual ~NullMessageHandler();

 protected:
  virtual void MessageSImpl(MessageType type, const GoogleString& message);
  virtual void FileMessageSImpl(MessageType type, const char* filename,
                                int line, const GoogleString& message);

 private:
  DISALLOW_COPY_AND_ASSIGN(NullMessageHandler);
};

// Macros for logging messages.
#define EI_LOG_INFO(handler, ...) \
    (handler)->Info(__FILE__, __LINE__, __VA_ARGS__)
#define EI_LOG_WARN(handler, ...) \
    (handler)->Warning(__FILE__, __LINE__, __VA_ARGS__)
#define EI_LOG_ERROR(handler, ...) \
    (handler)->Error(__FILE__, __LINE__, __VA_ARGS__)
#define EI_LOG_FATAL(handler, ...) \
    (handler)->FatalError(__FILE__, __LINE__, __VA_ARGS__)

#ifndef NDEBUG
#define EI_LOG_DFATAL(handler, ...) \
    EI_LOG_FATAL(handler, __VA_ARGS__)
#else
#define EI_LOG_DFATAL(handler, ...) \
    EI_LOG_ERROR(handler, __VA_ARGS__)
#endif  // NDEBUG

// Macros for logging debugging messages. They expand to no-ops in opt-mode
// builds.
#ifndef NDEBUG
#define EI_DLOG_INFO(handler, ...) \
    EI_LOG_INFO(handler, __VA_ARGS__)
#define EI_DLOG_WARN(handler, ...) \
    EI_LOG_WARN(handler, __VA_ARGS__)
#else
inline void NoOpMacroPlaceholder() {}

#define EI_DLOG_INFO(handler, ...) ::edge_images::NoOpMacroPlaceholder()
#define EI_DLOG_WARN(handler, ...) ::edge_images::NoOpMacroPlaceholder()
#endif  // NDEBUG

}  // namespace edge_images

#endif  // EDGE_IMAGES_KERNEL_BASE_MESSAGE_HANDLER_H_
