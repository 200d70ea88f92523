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

#include "rig/skeleton.h"

#include <algorithm>
#include "common/logging.h"

namespace rmb {
size_t Skeleton::FindBone(const std::string& name) const {
  const auto found = name_map_.find(name);
  return found == name_map_.end() ? kNoBone : found->second;
}

std::vector<size_t> Skeleton::GetRootBones() const {
  std::vector<size_t> roots;
  for (size_t bone_index = 0; bone_index != bones_.size(); ++bone_index) {
    if (bones_[bone_index].parent == kNoBone) {
      roots.push_back(bone_index);
    }
  }
  return roots;
}

size_t Skeleton::AddBone(const std::string& name, size_t parent,
                         const GfMatrix4d& rest, const GfVec3d& tail) {
  if (name.empty() || FindBone(name) != kNoBone) {
    return kNoBone;
  }
  if (parent != kNoBone && parent >= bones_.size()) {
    return kNoBone;
  }
  const size_t bone_index = bones_.size();
  Bone bone;
  bone.name = name;
  bone.parent = parent;
  bone.rest = rest;
  bone.tail = tail;
  bones_.push_back(std::move(bone));
  if (parent != kNoBone) {
    bones_[parent].children.push_back(bone_index);
  }
  name_map_[name] = bone_index;
  return bone_index;
}

bool Skeleton::SetParent(size_t bone_index, size_t parent) {
  RMB_ASSERT_LOGIC(bone_index < bones_.size());
  if (parent != kNoBone) {
    if (parent >= bones_.size() || IsAncestor(bone_index, parent)) {
      return false;
    }
  }
  Bone& bone = bones_[bone_index];
  if (bone.parent == parent) {
    return true;
  }
  if (bone.parent != kNoBone) {
    std::vector<size_t>& siblings = bones_[bone.parent].children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), bone_index),
                   siblings.end());
  }
  bone.parent = parent;
  if (parent != kNoBone) {
    bones_[parent].children.push_back(bone_index);
  }
  return true;
}

bool Skeleton::RemoveBone(size_t bone_index) {
  if (bone_index >= bones_.size() || !bones_[bone_index].children.empty()) {
    return false;
  }
  const size_t parent = bones_[bone_index].parent;
  if (parent != kNoBone) {
    std::vector<size_t>& siblings = bones_[parent].children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), bone_index),
                   siblings.end());
  }
  bones_.erase(bones_.begin() + bone_index);

  // Shift references to bones above the removed one.
  const auto shift = [bone_index](size_t i) {
    return i != kNoBone && i > bone_index ? i - 1 : i;
  };
  for (Bone& bone : bones_) {
    bone.parent = shift(bone.parent);
    for (size_t& child : bone.children) {
      child = shift(child);
    }
  }
  RebuildNameMap();
  return true;
}

void Skeleton::SetRest(size_t bone_index, const GfMatrix4d& rest) {
  RMB_ASSERT_LOGIC(bone_index < bones_.size());
  bones_[bone_index].rest = rest;
}

GfMatrix4d Skeleton::GetRestWorld(size_t bone_index) const {
  GfMatrix4d world(1.0);
  for (size_t i = bone_index; i != kNoBone; i = bones_[i].parent) {
    world = world * bones_[i].rest;
  }
  return world;
}

bool Skeleton::IsAncestor(size_t ancestor, size_t bone_index) const {
  // The depth bound guards against corrupt parent links.
  size_t depth = 0;
  for (size_t i = bone_index; i != kNoBone && depth <= bones_.size();
       i = bones_[i].parent, ++depth) {
    if (i == ancestor) {
      return true;
    }
  }
  return false;
}

std::vector<size_t> Skeleton::GetTopologicalOrder() const {
  std::vector<size_t> order;
  order.reserve(bones_.size());
  std::vector<size_t> stack;
  const std::vector<size_t> roots = GetRootBones();
  for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
    stack.push_back(*it);
  }
  while (!stack.empty()) {
    const size_t bone_index = stack.back();
    stack.pop_back();
    order.push_back(bone_index);
    const std::vector<size_t>& children = bones_[bone_index].children;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back(*it);
    }
  }
  return order;
}

std::string Skeleton::GetBonePath(size_t bone_index) const {
  std::string path = bones_[bone_index].name;
  for (size_t i = bones_[bone_index].parent; i != kNoBone;
       i = bones_[i].parent) {
    path = bones_[i].name + "/" + path;
  }
  return path;
}

void Skeleton::RebuildNameMap() {
  name_map_.clear();
  for (size_t bone_index = 0; bone_index != bones_.size(); ++bone_index) {
    name_map_[bones_[bone_index].name] = bone_index;
  }
}
}  // namespace rmb
