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

#include "process/asset_classifier.h"

namespace rmb {
const char* GetAssetTypeName(AssetType type) {
  static const char* const kNames[] = {
      "Actor",   // kAssetActor
      "Motion",  // kAssetMotion
  };
  static_assert(RMB_ARRAY_SIZE(kNames) == kAssetTypeCount, "");
  return type < kAssetTypeCount ? kNames[type] : "?";
}

AssetType ClassifyAsset(const Scene& scene, ObjectId armature) {
  for (const ObjectId child : scene.GetObjectChildren(armature)) {
    if (scene.GetObjectType(child) == kObjectMesh) {
      return kAssetActor;
    }
  }
  return kAssetMotion;
}
}  // namespace rmb
