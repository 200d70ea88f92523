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

#ifndef RMB_RIG_MEMORY_SCENE_H_
#define RMB_RIG_MEMORY_SCENE_H_

#include <memory>
#include <string>
#include <vector>
#include "rig/scene.h"

namespace rmb {
// Scene held entirely in memory. This is the host the command-line tool
// imports into, and the fixture used by tests.
class MemoryScene : public Scene {
 public:
  MemoryScene();

  std::vector<ObjectId> GetObjects() const override;
  ObjectType GetObjectType(ObjectId id) const override;
  const std::string& GetObjectName(ObjectId id) const override;
  ObjectId GetObjectParent(ObjectId id) const override;
  std::vector<ObjectId> GetObjectChildren(ObjectId id) const override;
  GfMatrix4d GetObjectTransform(ObjectId id) const override;
  void SetObjectTransform(ObjectId id, const GfMatrix4d& mat) override;

  const Skeleton& GetSkeleton(ObjectId armature) const override;
  void SetBoneRest(ObjectId armature, size_t bone_index,
                   const GfMatrix4d& rest) override;

  size_t CreateBone(ObjectId armature, const std::string& name,
                    size_t parent, const GfVec3d& tail) override;
  bool SetBoneParent(ObjectId armature, size_t bone_index,
                     size_t parent) override;
  bool RemoveBone(ObjectId armature, size_t bone_index) override;

  InteractionMode GetMode() const override { return mode_; }
  void SetMode(InteractionMode mode) override;

  const AnimationClip* GetAnimation(ObjectId armature) const override;
  void SetAnimation(ObjectId armature, const AnimationClip& clip) override;

  double GetFrameRate() const override { return frame_rate_; }
  void SetFrameRate(double frame_rate) override { frame_rate_ = frame_rate; }
  void GetFrameRange(double* out_start, double* out_end) const override;
  void SetFrameRange(double start, double end) override;

  size_t GetImageCount() const override { return images_.size(); }
  const ImageResource& GetImage(size_t image_index) const override;
  void SetImagePath(size_t image_index, const std::string& path) override;
  bool SaveImage(size_t image_index) override;

  size_t ClearAnimations() override;
  size_t ClearImages() override;

  ObjectId AddObject(const std::string& name, ObjectType type,
                     ObjectId parent, const GfMatrix4d& transform) override;
  void SetSkeleton(ObjectId armature, const Skeleton& skeleton) override;
  size_t AddImage(const ImageResource& image) override;

  const std::string& GetSourcePath() const override { return source_path_; }
  void SetSourcePath(const std::string& path) override {
    source_path_ = path;
  }

  // Number of mode switches into kModeEdit, for verifying edit scopes.
  size_t GetEditModeEnterCount() const { return edit_enter_count_; }

 private:
  struct Object {
    std::string name;
    ObjectType type;
    ObjectId parent;
    std::vector<ObjectId> children;
    GfMatrix4d transform;
    Skeleton skeleton;
    std::unique_ptr<AnimationClip> animation;
  };

  std::vector<Object> objects_;
  std::vector<ImageResource> images_;
  InteractionMode mode_;
  double frame_rate_;
  double frame_start_;
  double frame_end_;
  size_t edit_enter_count_;
  std::string source_path_;

  const Object& GetObject(ObjectId id) const;
  Object& GetArmatureObject(ObjectId armature);
  const Object& GetArmatureObject(ObjectId armature) const;
};
}  // namespace rmb

#endif  // RMB_RIG_MEMORY_SCENE_H_
