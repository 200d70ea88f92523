/*
 * Copyright 2019 Google LLC
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

#ifndef RMB_COMMON_LOGGING_H_
#define RMB_COMMON_LOGGING_H_

#include <ctime>
#include <stdexcept>
#include <string>
#include "common/common.h"
#include "common/message.h"
#include "common/platform.h"

#if RMB_BREAK_ON_ASSERT
#define RMB_BREAK() DebugBreak()
#define RMB_ASSERT_HELPER(x, file, line, expression)            \
do {                                                            \
  if (!(x)) {                                                   \
    if (IsDebuggerPresent()) {                                  \
      RMB_BREAK();                                              \
    } else {                                                    \
      throw rmb::AssertException(file, line, expression);       \
    }                                                           \
  }                                                             \
} while (0)
#else  // RMB_BREAK_ON_ASSERT
#define RMB_BREAK() ((void)0)
#define RMB_ASSERT_HELPER(x, file, line, expression)            \
do {                                                            \
  if (!(x)) {                                                   \
    throw rmb::AssertException(file, line, expression);         \
  }                                                             \
} while (0)
#endif  // RMB_BREAK_ON_ASSERT

#define RMB_ASSERT(x) RMB_ASSERT_HELPER(x, __FILE__, __LINE__, #x)

// Asserts that should only occur due to logic bugs.
#define RMB_ASSERT_LOGIC(x) RMB_ASSERT(x)

namespace rmb {
enum What : uint8_t {
#define RMB_MSG(severity, id, format) \
  RMB_##severity##_##id,
#include "messages.inl"  // NOLINT: Multiple inclusion.
  RMB_WHAT_COUNT
};
#undef RMB_MSG
#undef RMB_MSG0
#undef RMB_MSG1
#undef RMB_MSG2
#undef RMB_MSG3

extern const WhatInfo kWhatInfos[RMB_WHAT_COUNT];

template <What kWhat> struct LoggerT;

#define RMB_MSG0(severity, id, format)                             \
  template <> struct LoggerT<RMB_##severity##_##id> {              \
    static Message Get() {                                         \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[RMB_##severity##_##id], "");                 \
    }                                                              \
  };
#define RMB_MSG1(severity, id, format,                             \
                 T0, v0)                                           \
  template <> struct LoggerT<RMB_##severity##_##id> {              \
    static Message Get(T0 v0) {                                    \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[RMB_##severity##_##id], "",                  \
          v0);                                                     \
    }                                                              \
  };
#define RMB_MSG2(severity, id, format,                             \
                 T0, v0, T1, v1)                                   \
  template <> struct LoggerT<RMB_##severity##_##id> {              \
    static Message Get(T0 v0, T1 v1) {                             \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[RMB_##severity##_##id], "",                  \
          v0, v1);                                                 \
    }                                                              \
  };
#define RMB_MSG3(severity, id, format,                             \
                 T0, v0, T1, v1, T2, v2)                           \
  template <> struct LoggerT<RMB_##severity##_##id> {              \
    static Message Get(T0 v0, T1 v1, T2 v2) {                      \
      return Message::ConstructFormatted(                          \
          &kWhatInfos[RMB_##severity##_##id], "",                  \
          v0, v1, v2);                                             \
    }                                                              \
  };
#include "messages.inl"  // NOLINT: Multiple inclusion.
#undef RMB_MSG
#undef RMB_MSG0
#undef RMB_MSG1
#undef RMB_MSG2
#undef RMB_MSG3

template <What kWhat, typename... Ts>
inline Message GetMessage(const char* path, Ts... args) {
  Message message = LoggerT<kWhat>::Get(args...);
  message.path = path ? path : "";
  return message;
}

template <What kWhat, typename... Ts>
inline void Log(Logger* logger, const char* path, Ts... args) {
  Message message = LoggerT<kWhat>::Get(args...);
  message.path = path && path[0] ? path : logger->GetName();
  logger->Add(message);
}

template <What kWhat, typename... Ts>
inline void LogOnce(
    OnceLogger* once_logger, const char* footer, const char* name, Ts... args) {
  once_logger->Add(footer, name, LoggerT<kWhat>::Get(args...));
}

class AssertException : public std::runtime_error {
 public:
  AssertException(const char* file, int line, const char* expression);
  const char* GetFile() const { return file_; }
  int GetLine() const { return line_; }
  const char* GetExpression() const { return expression_; }
 private:
  const char* file_;
  int line_;
  const char* expression_;
};

// Fatal conversion failure. Carries the formatted table message so callers
// can forward it to a Logger unchanged.
class ConvertError : public std::runtime_error {
 public:
  explicit ConvertError(const Message& message);
  const Message& GetMessage() const { return message_; }
  What GetWhat() const;
 private:
  Message message_;
};

// Not exactly one parentless bone.
class AmbiguousHierarchyError : public ConvertError {
 public:
  using ConvertError::ConvertError;
};

// The sole parentless bone already carries the root motion bone name.
class AlreadyProcessedError : public ConvertError {
 public:
  using ConvertError::ConvertError;
};

class UnknownBoneError : public ConvertError {
 public:
  using ConvertError::ConvertError;
};

class MissingArmatureError : public ConvertError {
 public:
  using ConvertError::ConvertError;
};

class ImportError : public ConvertError {
 public:
  using ConvertError::ConvertError;
};

class ExportError : public ConvertError {
 public:
  using ConvertError::ConvertError;
};

// Throws Error constructed from the kWhat message.
template <typename Error, What kWhat, typename... Ts>
void ThrowError(Ts... args) {
  throw Error(GetMessage<kWhat>("", args...));
}

template <typename T>
T CheckHelper(T x, const char* file, int line, const char* expression) {
  RMB_ASSERT_HELPER(x, file, line, expression);
  return x;
}

// Like RMB_ASSERT, except the expression is always evaluated and it returns the
// result of the expression.
#define RMB_VERIFY(x) rmb::CheckHelper(x, __FILE__, __LINE__, #x)

// Simple utility to profile timing in a local function scope and output to the
// log.
class ProfileSentry {
 public:
  explicit ProfileSentry(const char* label, bool enable = true);
  ~ProfileSentry();
 private:
  const char* label_;
  std::clock_t time_begin_;
};

}  // namespace rmb
#endif  // RMB_COMMON_LOGGING_H_
