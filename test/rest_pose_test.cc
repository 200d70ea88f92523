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

#include "gtest/gtest.h"
#include "process/root_bone.h"
#include "test/test_util.h"

namespace rmb {
namespace {
using test::AddBipedArmature;
using test::MakeTranslate;

// Typical placement of a rig imported from a Y-up package: centimeter scale,
// stood up by a quarter turn about X.
GfMatrix4d MakeImportedObjectTransform() {
  GfMatrix4d scale(1.0);
  scale.SetScale(0.01);
  GfMatrix4d rotate(1.0);
  rotate.SetRotate(GfRotation(GfVec3d(1.0, 0.0, 0.0), 90.0));
  return scale * rotate * MakeTranslate(1.0, 2.0, 3.0);
}

TEST(RestPoseTest, FoldsObjectRotationIntoRig) {
  MemoryScene scene;
  const GfMatrix4d object_mat = MakeImportedObjectTransform();
  const ObjectId armature = AddBipedArmature(&scene, object_mat);
  const ObjectId body = scene.AddObject("Body", kObjectMesh, armature,
                                        MakeTranslate(0.0, 0.0, 0.5));
  SynthesizeRootBone(&scene, armature, "Hips", "root",
                     GetUniformScale(object_mat));

  // Record placement of every bone and the mesh in scene space.
  const Skeleton before = scene.GetSkeleton(armature);
  std::vector<GfMatrix4d> bone_worlds;
  for (size_t i = 0; i != before.GetBoneCount(); ++i) {
    bone_worlds.push_back(before.GetRestWorld(i) * object_mat);
  }
  const GfMatrix4d body_world = scene.GetObjectTransform(body) * object_mat;

  NormalizeRestPose(&scene, armature);

  // The object keeps its scale and location but loses its rotation.
  const GfMatrix4d new_object_mat = scene.GetObjectTransform(armature);
  GfMatrix4d scale_mat, rot_mat, translate_mat;
  ASSERT_TRUE(
      FactorTransform(new_object_mat, &scale_mat, &rot_mat, &translate_mat));
  EXPECT_TRUE(NearlyEqual(rot_mat, GfMatrix4d(1.0), 1e-9));
  EXPECT_NEAR(GetUniformScale(new_object_mat), 0.01, 1e-12);
  EXPECT_TRUE(NearlyEqual(new_object_mat.ExtractTranslation(),
                          GfVec3d(1.0, 2.0, 3.0), 1e-12));

  // Nothing moves in scene space.
  const Skeleton& after = scene.GetSkeleton(armature);
  for (size_t i = 0; i != after.GetBoneCount(); ++i) {
    EXPECT_TRUE(NearlyEqual(after.GetRestWorld(i) * new_object_mat,
                            bone_worlds[i], kTransformTol))
        << after.GetBone(i).name;
  }
  EXPECT_TRUE(NearlyEqual(scene.GetObjectTransform(body) * new_object_mat,
                          body_world, kTransformTol));

  // Only the top bone absorbs the rotation.
  EXPECT_EQ(after.GetBone(after.FindBone("Hips")).rest,
            MakeTranslate(0.0, 0.0, 1.0));
}

TEST(RestPoseTest, CorrectsTopBoneKeys) {
  MemoryScene scene;
  const GfMatrix4d object_mat = MakeImportedObjectTransform();
  const ObjectId armature = AddBipedArmature(&scene, object_mat);
  SynthesizeRootBone(&scene, armature, "Hips", "root", 1.0);
  AnimationClip clip("Pose", 30.0);
  const GfMatrix4d key = MakeTranslate(0.0, -2.0, 0.0);
  clip.SetTrack("root", {{0.0, key}});
  scene.SetAnimation(armature, clip);

  NormalizeRestPose(&scene, armature);

  const AnimationClip* const corrected = scene.GetAnimation(armature);
  ASSERT_NE(corrected, nullptr);
  const GfMatrix4d& new_key = corrected->FindTrack("root")->front().local;
  EXPECT_TRUE(NearlyEqual(new_key * scene.GetObjectTransform(armature),
                          key * object_mat, kTransformTol));
}

TEST(RestPoseTest, UnrotatedObjectIsUnchanged) {
  MemoryScene scene;
  GfMatrix4d object_mat(1.0);
  object_mat.SetScale(2.0);
  object_mat.SetTranslateOnly(GfVec3d(4.0, 0.0, 0.0));
  const ObjectId armature = AddBipedArmature(&scene, object_mat);
  NormalizeRestPose(&scene, armature);
  EXPECT_EQ(scene.GetObjectTransform(armature), object_mat);
  EXPECT_EQ(scene.GetSkeleton(armature).GetBone(0).rest,
            MakeTranslate(0.0, 0.0, 1.0));
}
}  // namespace
}  // namespace rmb
