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

#ifndef RMB_COMMON_DISK_UTIL_H_
#define RMB_COMMON_DISK_UTIL_H_

#include <stdio.h>
#include <string>
#include <vector>

namespace rmb {
// Creates a directory (including any necessary ancestors). Returns false if it
// doesn't exist afterwards. Directories created are appended to
// 'out_created_dirs', if set, in the order they were created.
bool DiskCreateDirectory(const std::string& dir,
                         std::vector<std::string>* out_created_dirs = nullptr);

// Write a whole binary file to disk.
bool DiskWriteBinary(const std::string& dst_path,
                     const void* data, size_t size);

// Read a whole binary file from disk.
bool DiskReadBinary(const std::string& src_path, std::vector<uint8_t>* out_data);

bool DiskCopyFile(const std::string& src_path, const std::string& dst_path);

struct DiskFileSentry {
  FILE* fp;

  DiskFileSentry() : fp(nullptr) {}

  DiskFileSentry(const char* path, const char* mode) : fp(nullptr) {
    Open(path, mode);
  }

  ~DiskFileSentry() {
    Close();
  }

  DiskFileSentry(const DiskFileSentry&) = delete;
  DiskFileSentry& operator=(const DiskFileSentry&) = delete;

  void Close() {
    if (fp) {
      fclose(fp);
      fp = nullptr;
    }
  }

  bool Open(const char* path, const char* mode) {
    Close();
    fp = fopen(path, mode);
    return fp != nullptr;
  }
};
}  // namespace rmb

#endif  // RMB_COMMON_DISK_UTIL_H_
