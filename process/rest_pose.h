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

#ifndef RMB_PROCESS_REST_POSE_H_
#define RMB_PROCESS_REST_POSE_H_

#include "rig/scene.h"

namespace rmb {
// Folds the armature object's rotation into its rest data so its neutral
// orientation becomes the identity rotation, leaving world placement
// unchanged.
// * The armature transform O = S*R*T becomes S*T, and the parentless bones'
//   rest matrices and keys, and the armature's child objects, absorb
//   C = S*R*S^-1.
// * Switches the scene to kModeObject; rest data can't be rewritten while
//   topology is being edited.
void NormalizeRestPose(Scene* scene, ObjectId armature);
}  // namespace rmb

#endif  // RMB_PROCESS_REST_POSE_H_
