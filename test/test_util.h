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

#ifndef RMB_TEST_TEST_UTIL_H_
#define RMB_TEST_TEST_UTIL_H_

#include <functional>
#include <string>
#include <vector>
#include "common/common_util.h"
#include "common/disk_util.h"
#include "common/logging.h"
#include "gtest/gtest.h"
#include "process/math.h"
#include "rig/codec.h"
#include "rig/memory_scene.h"

namespace rmb {
namespace test {
// Codec that records calls instead of touching files. Imports run 'on_import'
// to populate the scene.
class FakeCodec : public InterchangeCodec {
 public:
  const char* GetExtension() const override { return "fbx"; }

  bool Import(const std::string& path, Scene* scene, Logger* logger) override {
    imported.push_back(path);
    if (!import_succeeds) {
      return false;
    }
    if (on_import) {
      on_import(scene);
    }
    return true;
  }

  bool Export(const Scene& scene, const std::string& path,
              const ExportOptions& options, Logger* logger) override {
    exported.push_back(path);
    last_options = options;
    return export_succeeds;
  }

  bool import_succeeds = true;
  bool export_succeeds = true;
  std::function<void(Scene*)> on_import;
  std::vector<std::string> imported;
  std::vector<std::string> exported;
  ExportOptions last_options;
};

inline GfMatrix4d MakeTranslate(double x, double y, double z) {
  GfMatrix4d mat(1.0);
  mat.SetTranslate(GfVec3d(x, y, z));
  return mat;
}

// Rotation about the up axis, followed by a translation.
inline GfMatrix4d MakeYawTranslate(double yaw_degrees, const GfVec3d& t) {
  GfMatrix4d mat(1.0);
  mat.SetRotate(GfRotation(GfVec3d(0.0, 0.0, 1.0), yaw_degrees));
  mat.SetTranslateOnly(t);
  return mat;
}

// Hips at 1m above the ground, with a spine and two legs:
//   Hips
//   +-- Spine
//   +-- LeftLeg
//   +-- RightLeg
inline Skeleton MakeBipedSkeleton() {
  Skeleton skeleton;
  const GfVec3d tail(0.0, 0.0, 0.2);
  const size_t hips =
      skeleton.AddBone("Hips", kNoBone, MakeTranslate(0.0, 0.0, 1.0), tail);
  skeleton.AddBone("Spine", hips, MakeTranslate(0.0, 0.0, 0.3), tail);
  skeleton.AddBone("LeftLeg", hips, MakeTranslate(0.1, 0.0, -0.1), -tail);
  skeleton.AddBone("RightLeg", hips, MakeTranslate(-0.1, 0.0, -0.1), -tail);
  return skeleton;
}

inline ObjectId AddBipedArmature(MemoryScene* scene,
                                 const GfMatrix4d& object_mat = GfMatrix4d(1.0),
                                 const std::string& name = "Armature") {
  const ObjectId armature =
      scene->AddObject(name, kObjectArmature, kNoObject, object_mat);
  scene->SetSkeleton(armature, MakeBipedSkeleton());
  return armature;
}

// Walk cycle keyed once per frame over 'frame_count' frames. The hips travel
// along ground-forward at 'speed' meters per second while turning at
// 'turn_rate' degrees per second and bobbing vertically. The spine sways.
inline AnimationClip MakeWalkClip(double frame_rate, size_t frame_count,
                                  double speed = 1.0, double turn_rate = 30.0) {
  AnimationClip::Track hips;
  AnimationClip::Track spine;
  for (size_t frame = 0; frame <= frame_count; ++frame) {
    const double t = static_cast<double>(frame) / frame_rate;
    const double yaw = turn_rate * t;
    const GfVec3d position(0.2 * t, -speed * t, 1.0);
    hips.push_back({static_cast<double>(frame),
                    MakeYawTranslate(yaw, position)});
    GfMatrix4d sway(1.0);
    sway.SetRotate(GfRotation(GfVec3d(1.0, 0.0, 0.0), 5.0 * t));
    sway.SetTranslateOnly(GfVec3d(0.0, 0.0, 0.3));
    spine.push_back({static_cast<double>(frame), sway});
  }
  AnimationClip clip("Walk", frame_rate);
  clip.SetTrack("Hips", hips);
  clip.SetTrack("Spine", spine);
  return clip;
}

// Adds a walk to the armature and matches the scene's frame rate and range.
inline void AddWalk(MemoryScene* scene, ObjectId armature, double frame_rate,
                    size_t frame_count) {
  const AnimationClip clip = MakeWalkClip(frame_rate, frame_count);
  scene->SetAnimation(armature, clip);
  scene->SetFrameRate(frame_rate);
  scene->SetFrameRange(0.0, static_cast<double>(frame_count));
}

inline bool HasMessage(const VectorLogger& logger, What what) {
  for (const Message& message : logger.GetMessages()) {
    if (message.what_info == &kWhatInfos[what]) {
      return true;
    }
  }
  return false;
}

// Empty directory under the test temp directory, unique to 'name'.
inline std::string MakeTestDir(const std::string& name) {
  const std::string dir = JoinPath(::testing::TempDir(), "rmb_" + name);
  EXPECT_TRUE(DiskCreateDirectory(dir));
  return dir;
}

inline std::string ReadTextFile(const std::string& path) {
  std::vector<uint8_t> data;
  if (!DiskReadBinary(path, &data)) {
    return std::string();
  }
  return std::string(data.begin(), data.end());
}
}  // namespace test
}  // namespace rmb

#endif  // RMB_TEST_TEST_UTIL_H_
