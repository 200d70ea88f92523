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

#include "common/message.h"

#include <algorithm>
#include <cstdio>
#include "common/common.h"

namespace rmb {
std::string Message::ToString(
    bool add_severity_prefix, bool add_what_suffix) const {
  std::string str;
  if (add_severity_prefix) {
    static const char* const kSeverityText[] = {
        "",           // kSeverityNone
        "Warning: ",  // kSeverityWarning
        "ERROR: ",    // kSeverityError
    };
    static_assert(RMB_ARRAY_SIZE(kSeverityText) == kSeverityCount, "");
    str += kSeverityText[what_info->severity];
  }
  if (!path.empty()) {
    str += path;
    str += ": ";
  }
  str += text;
  if (add_what_suffix) {
    str += " [";
    str += what_info->name;
    str += "]";
  }
  return str;
}

void Message::AssignFormattedV(
    const WhatInfo* what_info, const char* path, va_list args) {
  // Args cannot be reused in GCC, so copy it for the second call to vsnprintf.
  va_list args_copy;
  va_copy(args_copy, args);

  this->what_info = what_info;
  this->path = path ? path : "";
  const int len = std::vsnprintf(nullptr, 0, what_info->format, args);
  if (len > 0) {
    text.resize(static_cast<size_t>(len));
    std::vsnprintf(&text[0], len + 1, what_info->format, args_copy);
  } else {
    text.clear();
  }

  va_end(args_copy);
}

size_t Message::CountErrors(const std::vector<Message>& messages) {
  size_t error_count = 0;
  for (const Message& message : messages) {
    if (message.GetSeverity() == kSeverityError) {
      ++error_count;
    }
  }
  return error_count;
}

size_t PrintMessages(
    const Message* messages, size_t message_count,
    const char* line_prefix, FILE* output_file) {
  size_t error_count = 0;
  for (size_t i = 0; i != message_count; ++i) {
    const Message& message = messages[i];
    const Severity severity = message.GetSeverity();
    const bool is_warning = severity == kSeverityWarning;
    const bool is_error = severity == kSeverityError;
    if (is_error) {
      ++error_count;
    }
    FILE* const target =
        output_file ? output_file : (is_warning || is_error ? stderr : stdout);
    fprintf(target, "%s%s\n", line_prefix, message.ToString().c_str());
  }
  return error_count;
}

void OnceLogger::Reset(Logger* logger) {
  logger_ = logger;
  map_.clear();
  entries_.clear();
}

void OnceLogger::Add(
    const char* footer, const char* name, const Message& message) {
  const auto insert_result = map_.insert(std::make_pair(message, Value()));

  // Add new entries to the ordered set.
  if (insert_result.second) {
    entries_.push_back(&*insert_result.first);
  }

  Value& value = insert_result.first->second;
  value.footer = footer;
  if (name && name[0]) {
    value.names.insert(name);
  }
}

void OnceLogger::Flush() {
  static constexpr size_t kOnceNameMax = 3;

  for (const Entry* const entry : entries_) {
    const Message& key = entry->first;
    const Value& value = entry->second;

    const size_t name_count = value.names.size();
    if (name_count == 0) {
      logger_->Add(key);
      continue;
    }

    Message message = key;
    message.text += value.footer;

    // When truncated, show one less than the maximum so the ellipsis counts as
    // an entry.
    const size_t name_shown = name_count <= kOnceNameMax
                                  ? name_count
                                  : std::min(name_count, kOnceNameMax - 1);
    size_t name_i = 0;
    for (const std::string& name : value.names) {
      if (name_i == name_shown) {
        break;
      }
      if (name_i != 0) {
        message.text += ", ";
      }
      message.text += name;
      ++name_i;
    }
    const size_t name_hidden = name_count - name_shown;
    if (name_hidden > 0) {
      message.text += ", ...(plus ";
      message.text += std::to_string(name_hidden);
      message.text += " more)";
    }

    logger_->Add(message);
  }

  Reset(logger_);
}
}  // namespace rmb
