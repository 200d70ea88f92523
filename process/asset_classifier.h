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

#ifndef RMB_PROCESS_ASSET_CLASSIFIER_H_
#define RMB_PROCESS_ASSET_CLASSIFIER_H_

#include "rig/scene.h"

namespace rmb {
enum AssetType : uint8_t {
  // Rig with skinned geometry.
  kAssetActor,
  // Animation-only rig.
  kAssetMotion,
  kAssetTypeCount
};
const char* GetAssetTypeName(AssetType type);

// An armature is an Actor if any of its direct children is a mesh.
AssetType ClassifyAsset(const Scene& scene, ObjectId armature);
}  // namespace rmb

#endif  // RMB_PROCESS_ASSET_CLASSIFIER_H_
