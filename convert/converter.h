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

#ifndef RMB_CONVERT_CONVERTER_H_
#define RMB_CONVERT_CONVERTER_H_

#include <functional>
#include <string>
#include "common/config.h"
#include "common/logging.h"
#include "convert/convert_context.h"
#include "rig/codec.h"
#include "rig/scene.h"

namespace rmb {
enum StatusTag : uint8_t {
  kStatusDefault,
  kStatusWarning,
  kStatusDone,
  kStatusTagCount
};
const char* GetStatusTagName(StatusTag tag);

struct ConvertStatus {
  std::string message;
  StatusTag tag = kStatusDefault;
};

// Converts the armature in a scene one stage at a time, so a host can report
// progress (or stop) between stages.
// * Fatal errors are thrown as ConvertError. Stages already run stay
//   committed to the scene, and no later stage runs: Next returns false from
//   then on.
// * Stopping early leaves the scene as the last completed stage left it.
class Converter {
 public:
  Converter(const ConvertSettings& settings, Scene* scene,
            InterchangeCodec* codec, Logger* logger);

  // Imports 'path' into the scene before converting, replacing animations and
  // images left by earlier imports.
  void SetSource(const std::string& path);

  // Runs the next stage and sets 'out_status' to its outcome. Returns false
  // when there are no more stages.
  bool Next(ConvertStatus* out_status);

  // Runs the remaining stages, passing each status to 'on_status' if set.
  void RunToCompletion(
      const std::function<void(const ConvertStatus&)>& on_status = nullptr);

  // True once every stage has run or a stage has thrown.
  bool IsDone() const { return stage_ == kStageCount; }
  const ConvertSettings& GetSettings() const { return cc_.settings; }
  ObjectId GetArmature() const { return cc_.armature; }
  AssetType GetAssetType() const { return cc_.asset_type; }
  const std::string& GetOutputPath() const { return cc_.output_path; }

 private:
  enum Stage : uint8_t {
    kStageBegin,
    kStageImport,
    kStageFindArmature,
    kStageGuard,
    kStageClassify,
    kStageResolvePath,
    kStageSynthesize,
    kStageRig,
    kStageExport,
    kStageTextures,
    kStageComplete,
    kStageCount
  };

  ConvertContext cc_;
  Stage stage_;

  // Each returns false if the stage doesn't apply and produces no status.
  bool RunStage(Stage stage, ConvertStatus* out_status);
  bool Import(ConvertStatus* out_status);
  void ResolvePath(ConvertStatus* out_status);
  void BakeMotion();
  bool ExtractTextures(ConvertStatus* out_status);
};
}  // namespace rmb

#endif  // RMB_CONVERT_CONVERTER_H_
