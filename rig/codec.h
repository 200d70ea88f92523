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

#ifndef RMB_RIG_CODEC_H_
#define RMB_RIG_CODEC_H_

#include <string>
#include "common/config.h"
#include "common/message.h"
#include "rig/scene.h"

namespace rmb {
enum PathMode : uint8_t {
  // Leave texture references as they are.
  kPathModeAuto,
  // Copy referenced textures next to the exported file.
  kPathModeCopy,
  kPathModeCount
};

struct ExportOptions {
  Axis forward_axis = kExportForwardAxis;
  Axis up_axis = kExportUpAxis;
  PathMode path_mode = kPathModeCopy;
};

// Interchange file format used to move rigs between the authoring host and the
// target engine.
class InterchangeCodec {
 public:
  virtual ~InterchangeCodec() {}

  // File extension written on export, without the dot.
  virtual const char* GetExtension() const = 0;

  // Adds the payload at 'path' to 'scene'. Failures are logged and return
  // false.
  virtual bool Import(const std::string& path, Scene* scene,
                      Logger* logger) = 0;

  // Writes the rig and animation in 'scene' to 'path'. Failures are logged and
  // return false.
  virtual bool Export(const Scene& scene, const std::string& path,
                      const ExportOptions& options, Logger* logger) = 0;
};
}  // namespace rmb

#endif  // RMB_RIG_CODEC_H_
