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

#ifndef RMB_RIG_SKELETON_H_
#define RMB_RIG_SKELETON_H_

#include <string>
#include <unordered_map>
#include <vector>
#include "common/common.h"

namespace rmb {
using PXR_NS::GfMatrix4d;
using PXR_NS::GfVec3d;

// Index value for "no bone", used for parentless bones and failed lookups.
constexpr size_t kNoBone = static_cast<size_t>(-1);

struct Bone {
  std::string name;
  size_t parent = kNoBone;
  std::vector<size_t> children;

  // Rest transform relative to the parent bone, or to the armature for
  // parentless bones.
  GfMatrix4d rest = GfMatrix4d(1.0);

  // Tail position in the bone's own space. Only affects display length.
  GfVec3d tail = GfVec3d(0.0, 1.0, 0.0);
};

// Tree of bones stored as an arena. Bones are addressed by index; adding a
// bone never moves existing bones, and removing one shifts the indices above
// it down by one.
class Skeleton {
 public:
  size_t GetBoneCount() const { return bones_.size(); }
  bool IsEmpty() const { return bones_.empty(); }
  const Bone& GetBone(size_t bone_index) const { return bones_[bone_index]; }
  const std::vector<Bone>& GetBones() const { return bones_; }

  // Returns kNoBone if no bone has this name.
  size_t FindBone(const std::string& name) const;

  std::vector<size_t> GetRootBones() const;

  // Appends a bone. Returns kNoBone if the name is empty or already used, or
  // the parent is invalid.
  size_t AddBone(const std::string& name, size_t parent,
                 const GfMatrix4d& rest, const GfVec3d& tail);

  // Moves 'bone_index' (and its subtree) under 'parent', or makes it parentless
  // if parent is kNoBone. The bone's rest matrix is kept as-is, so it becomes
  // relative to the new parent. Returns false if this would form a cycle.
  bool SetParent(size_t bone_index, size_t parent);

  // Removes a childless bone.
  bool RemoveBone(size_t bone_index);

  void SetRest(size_t bone_index, const GfMatrix4d& rest);

  // Rest transform relative to the armature.
  GfMatrix4d GetRestWorld(size_t bone_index) const;

  // True if 'ancestor' is 'bone_index' or one of its parents.
  bool IsAncestor(size_t ancestor, size_t bone_index) const;

  // Bone indices ordered so every parent precedes its children, visiting
  // children in order.
  std::vector<size_t> GetTopologicalOrder() const;

  // Slash-separated names from the bone's root down to the bone.
  std::string GetBonePath(size_t bone_index) const;

 private:
  std::vector<Bone> bones_;
  std::unordered_map<std::string, size_t> name_map_;

  void RebuildNameMap();
};
}  // namespace rmb

#endif  // RMB_RIG_SKELETON_H_
