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

#include "process/root_bone.h"

#include <cmath>
#include "common/config.h"
#include "common/logging.h"

namespace rmb {
namespace {
// Removes a newly created bone on scope exit unless dismissed.
class NewBoneSentry {
 public:
  NewBoneSentry(Scene* scene, ObjectId armature, size_t bone)
      : scene_(scene), armature_(armature), bone_(bone) {}
  ~NewBoneSentry() {
    if (scene_) {
      // Nothing is parented to the bone yet, so removal only fails if the
      // host has already discarded it.
      static_cast<void>(scene_->RemoveBone(armature_, bone_));
    }
  }
  NewBoneSentry(const NewBoneSentry&) = delete;
  NewBoneSentry& operator=(const NewBoneSentry&) = delete;

  void Dismiss() { scene_ = nullptr; }

 private:
  Scene* scene_;
  ObjectId armature_;
  size_t bone_;
};
}  // namespace

GfVec3d GetRootBoneTail(double object_scale) {
  const double scale =
      std::isfinite(object_scale) && std::abs(object_scale) > kScaleMin
          ? std::abs(object_scale)
          : 1.0;
  return GetAxisVector(kGroundForwardAxis) * (kRootBoneLength / scale);
}

size_t SynthesizeRootBone(Scene* scene, ObjectId armature,
                          const std::string& hip_name,
                          const std::string& root_name, double object_scale) {
  {
    const Skeleton& skeleton = scene->GetSkeleton(armature);
    const size_t hip = skeleton.FindBone(hip_name);
    if (hip == kNoBone) {
      ThrowError<UnknownBoneError, RMB_ERROR_UNKNOWN_BONE>(hip_name.c_str());
    }
    if (skeleton.GetBone(hip).parent != kNoBone) {
      ThrowError<ConvertError, RMB_ERROR_HIP_NOT_ROOT>(hip_name.c_str());
    }
    if (skeleton.FindBone(root_name) != kNoBone) {
      ThrowError<ConvertError, RMB_ERROR_BONE_EXISTS>(root_name.c_str());
    }
  }

  EditModeSentry edit_mode_sentry(scene);
  const size_t root = scene->CreateBone(
      armature, root_name, kNoBone, GetRootBoneTail(object_scale));
  if (root == kNoBone) {
    ThrowError<ConvertError, RMB_ERROR_CREATE_BONE>(root_name.c_str());
  }

  NewBoneSentry new_bone_sentry(scene, armature, root);

  // Creating a bone appends it, so the hip index is unchanged.
  const size_t hip = scene->GetSkeleton(armature).FindBone(hip_name);
  if (!scene->SetBoneParent(armature, hip, root)) {
    ThrowError<ConvertError, RMB_ERROR_REPARENT>(
        hip_name.c_str(), root_name.c_str());
  }
  new_bone_sentry.Dismiss();
  return root;
}
}  // namespace rmb
