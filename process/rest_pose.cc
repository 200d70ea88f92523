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

#include "process/rest_pose.h"

#include "common/config.h"
#include "process/math.h"

namespace rmb {
void NormalizeRestPose(Scene* scene, ObjectId armature) {
  scene->SetMode(kModeObject);

  const GfMatrix4d object_mat = scene->GetObjectTransform(armature);
  GfMatrix4d scale_mat, rot_mat, translate_mat;
  if (!FactorTransform(object_mat, &scale_mat, &rot_mat, &translate_mat)) {
    // Degenerate transform has no orientation to fold.
    return;
  }
  if (NearlyEqual(rot_mat, GfMatrix4d(1.0), kTransformTol * kTransformTol)) {
    return;
  }
  const GfMatrix4d correction = scale_mat * rot_mat * scale_mat.GetInverse();

  const Skeleton& skeleton = scene->GetSkeleton(armature);
  const std::vector<size_t> roots = skeleton.GetRootBones();
  std::vector<std::string> root_names;
  for (const size_t root : roots) {
    root_names.push_back(skeleton.GetBone(root).name);
    scene->SetBoneRest(
        armature, root, skeleton.GetBone(root).rest * correction);
  }

  const AnimationClip* const clip = scene->GetAnimation(armature);
  if (clip) {
    AnimationClip corrected = *clip;
    for (const std::string& name : root_names) {
      corrected.TransformTrack(name, correction);
    }
    scene->SetAnimation(armature, corrected);
  }

  for (const ObjectId child : scene->GetObjectChildren(armature)) {
    scene->SetObjectTransform(
        child, scene->GetObjectTransform(child) * correction);
  }

  scene->SetObjectTransform(armature, scale_mat * translate_mat);
}
}  // namespace rmb
