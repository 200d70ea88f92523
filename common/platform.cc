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

#include "common/platform.h"

#include <stdlib.h>

#ifndef _MSC_VER
#include <sys/stat.h>
#endif  // _MSC_VER

namespace rmb {
bool DirectoryExists(const char* path) {
#ifdef _MSC_VER
  const DWORD attr = GetFileAttributesA(path);
  return attr != INVALID_FILE_ATTRIBUTES && (attr & FILE_ATTRIBUTE_DIRECTORY);
#else  // _MSC_VER
  struct stat st;
  return stat(path, &st) == 0 && S_ISDIR(st.st_mode);
#endif  // _MSC_VER
}

bool MakeDirectory(const char* path) {
#ifdef _MSC_VER
  CreateDirectoryA(path, NULL);
#else  // _MSC_VER
  mkdir(path, 0777);
#endif  // _MSC_VER
  // Another process may have created it concurrently, so check existence
  // rather than the result.
  return DirectoryExists(path);
}

bool FileExists(const char* path) {
#ifdef _MSC_VER
  const DWORD attr = GetFileAttributesA(path);
  return attr != INVALID_FILE_ATTRIBUTES && !(attr & FILE_ATTRIBUTE_DIRECTORY);
#else  // _MSC_VER
  struct stat st;
  return stat(path, &st) == 0 && S_ISREG(st.st_mode);
#endif  // _MSC_VER
}

std::string GetAbsolutePath(const char* path) {
  if (!FileExists(path)) {
    return std::string();
  }
#ifdef _MSC_VER
  char full_path[_MAX_PATH];
  return _fullpath(full_path, path, sizeof(full_path)) ? full_path : "";
#else  // _MSC_VER
  char* const full_path = realpath(path, nullptr);
  const std::string path_str = full_path ? full_path : "";
  if (full_path) {
    free(full_path);
  }
  return path_str;
#endif  // _MSC_VER
}
}  // namespace rmb
