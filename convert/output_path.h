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

#ifndef RMB_CONVERT_OUTPUT_PATH_H_
#define RMB_CONVERT_OUTPUT_PATH_H_

#include <string>
#include "common/message.h"
#include "process/asset_classifier.h"

namespace rmb {
// kActorDirName or kMotionDirName.
const char* GetAssetSubdirectory(AssetType type);

// Replaces any extension of 'file_name' with 'extension' (given without the
// dot).
std::string MakeInterchangeFileName(const std::string& file_name,
                                    const char* extension);

// Directory an asset is exported to. An empty 'output_dir' means the current
// directory. The asset's subdirectory is appended if requested, unless
// 'output_dir' already ends with it.
std::string GetExportDirectory(const std::string& output_dir, AssetType type,
                               bool append_subdir);

// Returns the path to export to, creating its directory if necessary.
// Returns an empty string if the rig shouldn't be exported: if 'file_name' is
// blank, or if the directory can't be created (which is logged as a warning).
std::string ResolveOutputPath(const std::string& file_name,
                              const std::string& output_dir, AssetType type,
                              bool append_subdir, const char* extension,
                              Logger* logger);
}  // namespace rmb

#endif  // RMB_CONVERT_OUTPUT_PATH_H_
