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

#include "common/config.h"

#include "common/common_util.h"

namespace rmb {
const char* const kDefaultHipBoneName = "Hips";
const char* const kDefaultRootBoneName = "root";
const char* const kActorDirName = "Actor";
const char* const kMotionDirName = "Motions";
const char* const kTexturesDirName = "textures";
const char* const kSettingsFileName = "rmb-config.json";
const char* const kDiagnosticsSuffix = "_root_motion.csv";

const ConvertSettings ConvertSettings::kDefault;

const char* GetAxisName(Axis axis) {
  static const char* const kNames[] = {
      "X",   // kAxisX
      "Y",   // kAxisY
      "Z",   // kAxisZ
      "-X",  // kAxisNegX
      "-Y",  // kAxisNegY
      "-Z",  // kAxisNegZ
  };
  static_assert(RMB_ARRAY_SIZE(kNames) == kAxisCount, "");
  return axis < kAxisCount ? kNames[axis] : "?";
}

GfVec3d GetAxisVector(Axis axis) {
  switch (axis) {
    case kAxisX: return GfVec3d(1.0, 0.0, 0.0);
    case kAxisY: return GfVec3d(0.0, 1.0, 0.0);
    case kAxisZ: return GfVec3d(0.0, 0.0, 1.0);
    case kAxisNegX: return GfVec3d(-1.0, 0.0, 0.0);
    case kAxisNegY: return GfVec3d(0.0, -1.0, 0.0);
    case kAxisNegZ: return GfVec3d(0.0, 0.0, -1.0);
    default: return GfVec3d(0.0);
  }
}

void ConvertSettings::Normalize() {
  hip_bone_name = TrimWhitespace(hip_bone_name);
  if (hip_bone_name.empty()) {
    hip_bone_name = kDefaultHipBoneName;
  }
  root_bone_name = TrimWhitespace(root_bone_name);
  if (root_bone_name.empty()) {
    root_bone_name = kDefaultRootBoneName;
  }
  if (!(animation_sample_rate > 0.0) || !std::isfinite(animation_sample_rate)) {
    animation_sample_rate = kDefaultAnimationSampleRate;
  }
  file_name = TrimWhitespace(file_name);
  output_dir = TrimWhitespace(output_dir);
  armature_name = TrimWhitespace(armature_name);
}
}  // namespace rmb
