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

#include "rig/memory_scene.h"

#include "common/disk_util.h"
#include "common/logging.h"

namespace rmb {
MemoryScene::MemoryScene()
    : mode_(kModeObject),
      frame_rate_(30.0),
      frame_start_(0.0),
      frame_end_(0.0),
      edit_enter_count_(0) {}

std::vector<ObjectId> MemoryScene::GetObjects() const {
  std::vector<ObjectId> ids(objects_.size());
  for (ObjectId id = 0; id != objects_.size(); ++id) {
    ids[id] = id;
  }
  return ids;
}

ObjectType MemoryScene::GetObjectType(ObjectId id) const {
  return GetObject(id).type;
}

const std::string& MemoryScene::GetObjectName(ObjectId id) const {
  return GetObject(id).name;
}

ObjectId MemoryScene::GetObjectParent(ObjectId id) const {
  return GetObject(id).parent;
}

std::vector<ObjectId> MemoryScene::GetObjectChildren(ObjectId id) const {
  return GetObject(id).children;
}

GfMatrix4d MemoryScene::GetObjectTransform(ObjectId id) const {
  return GetObject(id).transform;
}

void MemoryScene::SetObjectTransform(ObjectId id, const GfMatrix4d& mat) {
  RMB_ASSERT_LOGIC(id < objects_.size());
  objects_[id].transform = mat;
}

const Skeleton& MemoryScene::GetSkeleton(ObjectId armature) const {
  return GetArmatureObject(armature).skeleton;
}

void MemoryScene::SetBoneRest(ObjectId armature, size_t bone_index,
                              const GfMatrix4d& rest) {
  // Rest data is only stable outside of topology editing.
  RMB_ASSERT_LOGIC(mode_ != kModeEdit);
  GetArmatureObject(armature).skeleton.SetRest(bone_index, rest);
}

size_t MemoryScene::CreateBone(ObjectId armature, const std::string& name,
                               size_t parent, const GfVec3d& tail) {
  RMB_ASSERT_LOGIC(mode_ == kModeEdit);
  return GetArmatureObject(armature).skeleton.AddBone(
      name, parent, GfMatrix4d(1.0), tail);
}

bool MemoryScene::SetBoneParent(ObjectId armature, size_t bone_index,
                                size_t parent) {
  RMB_ASSERT_LOGIC(mode_ == kModeEdit);
  Skeleton& skeleton = GetArmatureObject(armature).skeleton;
  if (bone_index >= skeleton.GetBoneCount()) {
    return false;
  }
  return skeleton.SetParent(bone_index, parent);
}

bool MemoryScene::RemoveBone(ObjectId armature, size_t bone_index) {
  RMB_ASSERT_LOGIC(mode_ == kModeEdit);
  Object& object = GetArmatureObject(armature);
  if (bone_index >= object.skeleton.GetBoneCount()) {
    return false;
  }
  const std::string name = object.skeleton.GetBone(bone_index).name;
  if (!object.skeleton.RemoveBone(bone_index)) {
    return false;
  }
  if (object.animation) {
    object.animation->RemoveTrack(name);
  }
  return true;
}

void MemoryScene::SetMode(InteractionMode mode) {
  RMB_ASSERT_LOGIC(mode < kModeCount);
  if (mode == kModeEdit && mode_ != kModeEdit) {
    ++edit_enter_count_;
  }
  mode_ = mode;
}

const AnimationClip* MemoryScene::GetAnimation(ObjectId armature) const {
  return GetArmatureObject(armature).animation.get();
}

void MemoryScene::SetAnimation(ObjectId armature, const AnimationClip& clip) {
  RMB_ASSERT_LOGIC(mode_ != kModeEdit);
  GetArmatureObject(armature).animation.reset(new AnimationClip(clip));
}

void MemoryScene::GetFrameRange(double* out_start, double* out_end) const {
  *out_start = frame_start_;
  *out_end = frame_end_;
}

void MemoryScene::SetFrameRange(double start, double end) {
  frame_start_ = start;
  frame_end_ = end;
}

const ImageResource& MemoryScene::GetImage(size_t image_index) const {
  RMB_ASSERT_LOGIC(image_index < images_.size());
  return images_[image_index];
}

void MemoryScene::SetImagePath(size_t image_index, const std::string& path) {
  RMB_ASSERT_LOGIC(image_index < images_.size());
  images_[image_index].file_path = path;
}

bool MemoryScene::SaveImage(size_t image_index) {
  RMB_ASSERT_LOGIC(image_index < images_.size());
  const ImageResource& image = images_[image_index];
  if (!image.HasData() || image.file_path.empty()) {
    return false;
  }
  return DiskWriteBinary(image.file_path, image.data.data(), image.data.size());
}

size_t MemoryScene::ClearAnimations() {
  size_t count = 0;
  for (Object& object : objects_) {
    if (object.animation) {
      object.animation.reset();
      ++count;
    }
  }
  return count;
}

size_t MemoryScene::ClearImages() {
  const size_t count = images_.size();
  images_.clear();
  return count;
}

ObjectId MemoryScene::AddObject(const std::string& name, ObjectType type,
                                ObjectId parent, const GfMatrix4d& transform) {
  RMB_ASSERT_LOGIC(type < kObjectTypeCount);
  RMB_ASSERT_LOGIC(parent == kNoObject || parent < objects_.size());
  const ObjectId id = objects_.size();
  objects_.emplace_back();
  Object& object = objects_.back();
  object.name = name;
  object.type = type;
  object.parent = parent;
  object.transform = transform;
  if (parent != kNoObject) {
    objects_[parent].children.push_back(id);
  }
  return id;
}

void MemoryScene::SetSkeleton(ObjectId armature, const Skeleton& skeleton) {
  GetArmatureObject(armature).skeleton = skeleton;
}

size_t MemoryScene::AddImage(const ImageResource& image) {
  images_.push_back(image);
  return images_.size() - 1;
}

const MemoryScene::Object& MemoryScene::GetObject(ObjectId id) const {
  RMB_ASSERT_LOGIC(id < objects_.size());
  return objects_[id];
}

MemoryScene::Object& MemoryScene::GetArmatureObject(ObjectId armature) {
  RMB_ASSERT_LOGIC(armature < objects_.size());
  Object& object = objects_[armature];
  RMB_ASSERT_LOGIC(object.type == kObjectArmature);
  return object;
}

const MemoryScene::Object& MemoryScene::GetArmatureObject(
    ObjectId armature) const {
  RMB_ASSERT_LOGIC(armature < objects_.size());
  const Object& object = objects_[armature];
  RMB_ASSERT_LOGIC(object.type == kObjectArmature);
  return object;
}
}  // namespace rmb
