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

#ifndef RMB_COMMON_MESSAGE_H_
#define RMB_COMMON_MESSAGE_H_

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rmb {
enum Severity : uint8_t {
  kSeverityNone,
  kSeverityWarning,
  kSeverityError,
  kSeverityCount
};

struct WhatInfo {
  Severity severity;
  const char* name;
  const char* format;
};

struct Message {
  const WhatInfo* what_info;
  std::string path;
  std::string text;

  std::string ToString(bool add_severity_prefix = true,
                       bool add_what_suffix = true) const;

  Severity GetSeverity() const { return what_info->severity; }

  void AssignFormattedV(
      const WhatInfo* what_info, const char* path, va_list args);

  static Message ConstructFormatted(
      const WhatInfo* what_info, const char* path, ...) {
    Message message;
    va_list args;
    va_start(args, path);
    message.AssignFormattedV(what_info, path, args);
    va_end(args);
    return message;
  }

  static size_t CountErrors(const std::vector<Message>& messages);
};

// Print messages to stdout/stderr, and return the number of errors.
size_t PrintMessages(
    const Message* messages, size_t message_count,
    const char* line_prefix = "", FILE* output_file = nullptr);

// Abstract interface used to log messages.
class Logger {
 public:
  virtual ~Logger() {}
  virtual void Add(const Message& message) = 0;
  virtual size_t GetErrorCount() const = 0;

  // Push/pop the name of the current asset being converted, used to provide
  // additional context in messages.
  void PushName(const std::string& name) { names_.push_back(name); }
  void PopName() { names_.pop_back(); }

  // Get the current asset name, if any.
  const std::string& GetName() const {
    return names_.empty() ? empty_name_ : names_.back();
  }

  // Push/Pop asset name within a local function scope.
  struct NameSentry {
    Logger* logger;
    NameSentry(Logger* logger, const std::string& name) : logger(logger) {
      logger->PushName(name);
    }
    ~NameSentry() { logger->PopName(); }
  };

 private:
  std::string empty_name_;
  std::vector<std::string> names_;
};

// Logger that prints to stdout or a file.
class PrintLogger : public Logger {
 public:
  explicit PrintLogger(
      const char* line_prefix = "", FILE* output_file = nullptr)
      : line_prefix_(line_prefix), output_file_(output_file), error_count_(0) {}

  void SetLinePrefix(const std::string& line_prefix) {
    line_prefix_ = line_prefix;
  }

  void Add(const Message& message) override {
    PrintMessages(&message, 1, line_prefix_.c_str(), output_file_);
    if (message.GetSeverity() == kSeverityError) {
      ++error_count_;
    }
  }

  size_t GetErrorCount() const override {
    return error_count_;
  }

 private:
  std::string line_prefix_;
  FILE* output_file_;
  size_t error_count_;
};

// Logger that stores messages in a vector.
class VectorLogger : public Logger {
 public:
  void Add(const Message& message) override {
    messages_.push_back(message);
  }

  size_t GetErrorCount() const override {
    return Message::CountErrors(messages_);
  }

  void Clear() {
    messages_.clear();
  }

  const std::vector<Message>& GetMessages() const {
    return messages_;
  }

 private:
  std::vector<Message> messages_;
};

// Utility used to merge similar messages, listing the names of the objects
// they apply to.
class OnceLogger {
 public:
  OnceLogger() : logger_(nullptr) {}

  Logger* GetLogger() const { return logger_; }
  void Reset(Logger* logger);
  void Add(const char* footer, const char* name, const Message& message);
  void Flush();

 private:
  struct Value {
    std::string footer;
    std::set<std::string> names;
  };
  struct MessageHasher {
    std::size_t operator()(const Message& k) const {
      return std::hash<std::string>()(k.text);
    }
  };
  struct MessageEqual {
    bool operator()(const Message& a, const Message& b) const {
      return a.what_info == b.what_info && a.text == b.text;
    }
  };
  using Map = std::unordered_map<Message, Value, MessageHasher, MessageEqual>;
  using Entry = Map::value_type;
  Logger* logger_;
  Map map_;
  std::vector<const Entry*> entries_;
};
}  // namespace rmb

#endif  // RMB_COMMON_MESSAGE_H_
