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

#ifndef RMB_COMMON_COMMON_UTIL_H_
#define RMB_COMMON_COMMON_UTIL_H_

#include <string.h>
#include <string>
#include "common/common.h"

namespace rmb {
// Return std::vector data, or null if the vector is empty.
template <typename Vector>
inline const typename Vector::value_type* GetDataOrNull(const Vector& v) {
  return v.empty() ? nullptr : v.data();
}

inline bool IsPathSeparator(char c) {
  return c == '/' || c == '\\';
}

inline std::string TrimWhitespace(const std::string& text) {
  static const char* const kWhitespace = " \t\r\n\f\v";
  const size_t begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) {
    return std::string();
  }
  const size_t end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

inline const char* GetFileName(const std::string& path) {
  const size_t last_slash_pos = path.find_last_of("\\/");
  return last_slash_pos == std::string::npos
             ? path.c_str()
             : path.c_str() + last_slash_pos + 1;
}

inline std::string GetFileDirectory(const std::string& path) {
  const size_t last_slash_pos = path.find_last_of("\\/");
  return last_slash_pos == std::string::npos
             ? std::string()
             : std::string(path.c_str(), last_slash_pos);
}

// Returns the path with its file extension removed, if any. Dots in directory
// names and leading dots in file names are not extensions.
inline std::string RemoveFileExtension(const std::string& path) {
  const size_t name_pos = GetFileName(path) - path.c_str();
  const size_t last_dot_pos = path.rfind('.');
  if (last_dot_pos == std::string::npos || last_dot_pos <= name_pos) {
    return path;
  }
  return path.substr(0, last_dot_pos);
}

// File name without directory or extension.
inline std::string GetFileStem(const std::string& path) {
  return RemoveFileExtension(GetFileName(path));
}

inline std::string StripTrailingSeparators(const std::string& path) {
  size_t len = path.length();
  while (len > 1 && IsPathSeparator(path[len - 1])) {
    --len;
  }
  return path.substr(0, len);
}

// Returns the last non-empty segment of a directory path.
inline std::string GetLastPathSegment(const std::string& path) {
  return GetFileName(StripTrailingSeparators(path));
}

inline std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) {
    return name;
  }
  const std::string base = StripTrailingSeparators(dir);
  return IsPathSeparator(base.back()) ? base + name : base + "/" + name;
}
}  // namespace rmb

#endif  // RMB_COMMON_COMMON_UTIL_H_
