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

#ifndef RMB_CONVERT_ARGS_H_
#define RMB_CONVERT_ARGS_H_

#include <string>
#include <vector>
#include "common/config.h"
#include "common/logging.h"
#include "convert/settings_store.h"

struct Args {
  // Defaults, with flags that aren't persisted applied.
  rmb::ConvertSettings settings;
  // Persisted flags given on the command line. These take precedence over the
  // asset directory's settings file.
  rmb::SettingsStore overrides;
  // Read and write the settings file in each source's directory.
  bool use_config = true;
  // Extension of the exported files.
  std::string format = "usda";
  std::vector<std::string> sources;
};

bool ParseArgs(
    int argc, const char* const* argv, Args* out_args, rmb::Logger* logger);

#endif  // RMB_CONVERT_ARGS_H_
