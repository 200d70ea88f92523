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

#include "common/disk_util.h"

#include <stdint.h>
#include "common/common_util.h"
#include "common/platform.h"

namespace rmb {
namespace {
// Length of the longest existing directory prefix of 'dir', including its
// trailing separator.
size_t GetLengthOfExistingDirectory(const std::string& dir) {
  for (size_t len = dir.length(); len > 0; --len) {
    len = dir.find_last_of("\\/", len);
    if (len == std::string::npos) {
      return 0;
    }
    const std::string prefix = dir.substr(0, len);
    if (!prefix.empty() && DirectoryExists(prefix.c_str())) {
      return len + 1;
    }
    if (len == 0) {
      return 0;
    }
  }
  return 0;
}
}  // namespace

bool DiskCreateDirectory(const std::string& dir,
                         std::vector<std::string>* out_created_dirs) {
  const std::string path = StripTrailingSeparators(dir);
  if (path.empty() || DirectoryExists(path.c_str())) {
    return true;
  }
  // Terminate with a separator so the last segment is handled like the rest.
  const std::string file_path = path + "/";
  size_t pos = GetLengthOfExistingDirectory(path);
  for (;;) {
    pos = file_path.find_first_of("\\/", pos == 0 ? 1 : pos);
    if (pos == std::string::npos) {
      break;
    }
    std::string sub_dir = file_path.substr(0, pos);
    ++pos;
    if (sub_dir.empty() || IsPathSeparator(sub_dir.back()) ||
        DirectoryExists(sub_dir.c_str())) {
      continue;
    }
    if (!MakeDirectory(sub_dir.c_str())) {
      return false;
    }
    if (out_created_dirs) {
      out_created_dirs->emplace_back(std::move(sub_dir));
    }
  }
  return DirectoryExists(path.c_str());
}

bool DiskWriteBinary(const std::string& dst_path,
                     const void* data, size_t size) {
  DiskFileSentry file(dst_path.c_str(), "wb");
  return file.fp && fwrite(data, 1, size, file.fp) == size;
}

bool DiskReadBinary(const std::string& src_path,
                    std::vector<uint8_t>* out_data) {
  DiskFileSentry file(src_path.c_str(), "rb");
  if (!file.fp) {
    return false;
  }
  out_data->clear();
  uint8_t buffer[16 * 1024];
  for (;;) {
    const size_t read_size = fread(buffer, 1, sizeof(buffer), file.fp);
    out_data->insert(out_data->end(), buffer, buffer + read_size);
    if (read_size < sizeof(buffer)) {
      return ferror(file.fp) == 0;
    }
  }
}

bool DiskCopyFile(const std::string& src_path, const std::string& dst_path) {
  std::vector<uint8_t> data;
  if (!DiskReadBinary(src_path, &data)) {
    return false;
  }
  return DiskWriteBinary(dst_path, GetDataOrNull(data), data.size());
}
}  // namespace rmb
