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

#include "convert/output_path.h"

#include "common/common_util.h"
#include "common/config.h"
#include "common/disk_util.h"
#include "common/logging.h"

namespace rmb {
const char* GetAssetSubdirectory(AssetType type) {
  return type == kAssetActor ? kActorDirName : kMotionDirName;
}

std::string MakeInterchangeFileName(const std::string& file_name,
                                    const char* extension) {
  return RemoveFileExtension(TrimWhitespace(file_name)) + "." + extension;
}

std::string GetExportDirectory(const std::string& output_dir, AssetType type,
                               bool append_subdir) {
  const std::string trimmed = TrimWhitespace(output_dir);
  const std::string dir =
      trimmed.empty() ? std::string(".") : StripTrailingSeparators(trimmed);
  if (!append_subdir) {
    return dir;
  }
  const char* const subdir = GetAssetSubdirectory(type);
  if (GetLastPathSegment(dir) == subdir) {
    return dir;
  }
  return JoinPath(dir, subdir);
}

std::string ResolveOutputPath(const std::string& file_name,
                              const std::string& output_dir, AssetType type,
                              bool append_subdir, const char* extension,
                              Logger* logger) {
  if (TrimWhitespace(file_name).empty()) {
    return std::string();
  }
  const std::string dir = GetExportDirectory(output_dir, type, append_subdir);
  if (!DiskCreateDirectory(dir)) {
    Log<RMB_WARN_CREATE_DIRECTORY>(logger, "", dir.c_str());
    return std::string();
  }
  return JoinPath(dir, MakeInterchangeFileName(file_name, extension));
}
}  // namespace rmb
