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

#ifndef RMB_CONVERT_CONVERT_CONTEXT_H_
#define RMB_CONVERT_CONVERT_CONTEXT_H_

#include <memory>
#include <string>
#include "common/config.h"
#include "common/logging.h"
#include "process/asset_classifier.h"
#include "process/diagnostics.h"
#include "rig/codec.h"
#include "rig/scene.h"

namespace rmb {
struct ConvertContext {
  ConvertSettings settings;
  Scene* scene;
  InterchangeCodec* codec;
  Logger* logger;

  // File to import before converting. If empty, the scene is converted as is.
  std::string src_path;

  ObjectId armature;
  AssetType asset_type;

  // Export path and directory. Empty if the rig isn't exported.
  std::string output_path;
  std::string output_dir;

  // Null unless diagnostics were requested and the file could be opened.
  std::unique_ptr<CsvDiagnosticSink> diagnostics;

  void Reset(const ConvertSettings& settings, Scene* scene,
             InterchangeCodec* codec, Logger* logger) {
    this->settings = settings;
    this->settings.Normalize();
    this->scene = scene;
    this->codec = codec;
    this->logger = logger;
    src_path.clear();
    armature = kNoObject;
    asset_type = kAssetActor;
    output_path.clear();
    output_dir.clear();
    diagnostics.reset();
  }
};
}  // namespace rmb

#endif  // RMB_CONVERT_CONVERT_CONTEXT_H_
