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

#ifndef RMB_PROCESS_ROOT_BONE_H_
#define RMB_PROCESS_ROOT_BONE_H_

#include <string>
#include "rig/scene.h"

namespace rmb {
// Tail of the root bone, sized so its displayed length is independent of the
// armature's object scale.
GfVec3d GetRootBoneTail(double object_scale);

// Creates a parentless bone named 'root_name' and moves the parentless bone
// 'hip_name' under it, returning the new bone's index. The hip keeps its local
// rest matrix and its subtree.
// * Everything is validated before the scene is touched: throws
//   UnknownBoneError if the hip doesn't exist, and ConvertError if the hip has
//   a parent or 'root_name' is taken.
// * If reparenting fails, the new bone is removed before the error propagates.
size_t SynthesizeRootBone(Scene* scene, ObjectId armature,
                          const std::string& hip_name,
                          const std::string& root_name, double object_scale);
}  // namespace rmb

#endif  // RMB_PROCESS_ROOT_BONE_H_
