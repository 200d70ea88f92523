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

#ifndef RMB_RIG_SCENE_H_
#define RMB_RIG_SCENE_H_

#include <string>
#include <vector>
#include "common/common.h"
#include "rig/animation_clip.h"
#include "rig/skeleton.h"

namespace rmb {
using PXR_NS::GfMatrix4d;
using PXR_NS::GfVec3d;

using ObjectId = size_t;
constexpr ObjectId kNoObject = static_cast<ObjectId>(-1);

enum ObjectType : uint8_t {
  kObjectArmature,
  kObjectMesh,
  kObjectEmpty,
  kObjectTypeCount
};

// Host interaction mode. Bone topology can only change in kModeEdit.
enum InteractionMode : uint8_t {
  kModeObject,
  kModePose,
  kModeEdit,
  kModeCount
};

struct ImageResource {
  std::string name;
  // Backing file the image is saved to.
  std::string file_path;
  // Embedded pixel data. Images without data only reference their file.
  std::vector<uint8_t> data;

  bool HasData() const { return !data.empty(); }
};

// Host scene graph that stores objects, bones, keyframes and images. The
// conversion pipeline reaches the host only through this interface.
// * A scene is single-writer: one conversion owns it at a time, and nothing
//   else may mutate it concurrently.
class Scene {
 public:
  virtual ~Scene() {}

  // Objects.
  virtual std::vector<ObjectId> GetObjects() const = 0;
  virtual ObjectType GetObjectType(ObjectId id) const = 0;
  virtual const std::string& GetObjectName(ObjectId id) const = 0;
  virtual ObjectId GetObjectParent(ObjectId id) const = 0;
  virtual std::vector<ObjectId> GetObjectChildren(ObjectId id) const = 0;
  virtual GfMatrix4d GetObjectTransform(ObjectId id) const = 0;
  virtual void SetObjectTransform(ObjectId id, const GfMatrix4d& mat) = 0;

  // Bones of an armature object.
  virtual const Skeleton& GetSkeleton(ObjectId armature) const = 0;
  virtual void SetBoneRest(ObjectId armature, size_t bone_index,
                           const GfMatrix4d& rest) = 0;

  // Topology changes. These are only valid in kModeEdit.
  virtual size_t CreateBone(ObjectId armature, const std::string& name,
                            size_t parent, const GfVec3d& tail) = 0;
  virtual bool SetBoneParent(ObjectId armature, size_t bone_index,
                             size_t parent) = 0;
  virtual bool RemoveBone(ObjectId armature, size_t bone_index) = 0;

  virtual InteractionMode GetMode() const = 0;
  virtual void SetMode(InteractionMode mode) = 0;

  // Animation. Returns null if the armature isn't animated.
  virtual const AnimationClip* GetAnimation(ObjectId armature) const = 0;
  // Commits keyframes for every bone in 'clip', replacing prior keys.
  virtual void SetAnimation(ObjectId armature, const AnimationClip& clip) = 0;

  virtual double GetFrameRate() const = 0;
  virtual void SetFrameRate(double frame_rate) = 0;
  virtual void GetFrameRange(double* out_start, double* out_end) const = 0;
  virtual void SetFrameRange(double start, double end) = 0;

  // Images.
  virtual size_t GetImageCount() const = 0;
  virtual const ImageResource& GetImage(size_t image_index) const = 0;
  virtual void SetImagePath(size_t image_index, const std::string& path) = 0;
  // Writes image data to its current file path.
  virtual bool SaveImage(size_t image_index) = 0;

  // Drop animation and image records cached by earlier imports. Return the
  // number removed.
  virtual size_t ClearAnimations() = 0;
  virtual size_t ClearImages() = 0;

  // Population, used by importers.
  virtual ObjectId AddObject(const std::string& name, ObjectType type,
                             ObjectId parent, const GfMatrix4d& transform) = 0;
  virtual void SetSkeleton(ObjectId armature, const Skeleton& skeleton) = 0;
  virtual size_t AddImage(const ImageResource& image) = 0;

  // Layer or file the scene was imported from, if any. Codecs use it to carry
  // data the scene doesn't model (such as mesh geometry) through to export.
  virtual const std::string& GetSourcePath() const = 0;
  virtual void SetSourcePath(const std::string& path) = 0;
};

// Returns the first armature with the given name, or the first armature if
// 'name' is empty.
ObjectId FindArmature(const Scene& scene, const std::string& name);

// Enters kModeEdit for the lifetime of a local function scope, returning to
// kModeObject on exit.
class EditModeSentry {
 public:
  explicit EditModeSentry(Scene* scene) : scene_(scene) {
    scene_->SetMode(kModeEdit);
  }
  ~EditModeSentry() {
    scene_->SetMode(kModeObject);
  }
  EditModeSentry(const EditModeSentry&) = delete;
  EditModeSentry& operator=(const EditModeSentry&) = delete;

 private:
  Scene* scene_;
};
}  // namespace rmb

#endif  // RMB_RIG_SCENE_H_
