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

#include "usd/usd_codec.h"

#include <stdio.h>
#include "convert/converter.h"
#include "gtest/gtest.h"
#include "test/test_util.h"
#include "usd/usd_util.h"

namespace rmb {
namespace {
// Two-joint skeleton walking 1m along -Y over one second at 24 fps.
const char kWalkUsda[] = R"(#usda 1.0
(
    defaultPrim = "Armature"
    endTimeCode = 24
    startTimeCode = 0
    timeCodesPerSecond = 24
    upAxis = "Z"
)

def SkelRoot "Armature"
{
    def Skeleton "Skeleton"
    {
        uniform token[] joints = ["Hips", "Hips/Spine"]
        uniform matrix4d[] restTransforms = [( (1, 0, 0, 0), (0, 1, 0, 0), (0, 0, 1, 0), (0, 0, 1, 1) ), ( (1, 0, 0, 0), (0, 1, 0, 0), (0, 0, 1, 0), (0, 0, 0.3, 1) )]
        uniform matrix4d[] bindTransforms = [( (1, 0, 0, 0), (0, 1, 0, 0), (0, 0, 1, 0), (0, 0, 1, 1) ), ( (1, 0, 0, 0), (0, 1, 0, 0), (0, 0, 1, 0), (0, 0, 1.3, 1) )]
        rel skel:animationSource = </Armature/Skeleton/Walk>

        def SkelAnimation "Walk"
        {
            uniform token[] joints = ["Hips"]
            float3[] translations.timeSamples = {
                0: [(0, 0, 1)],
                24: [(0, -1, 1)],
            }
            quatf[] rotations.timeSamples = {
                0: [(1, 0, 0, 0)],
                24: [(1, 0, 0, 0)],
            }
            half3[] scales = [(1, 1, 1)]
        }
    }
}
)";

class UsdCodecTest : public ::testing::Test {
 protected:
  void SetUp() override {
    VectorLogger logger;
    if (!RegisterPlugins("", &logger)) {
      GTEST_SKIP() << "USD plugins unavailable.";
    }
  }

  static std::string WriteWalk(const std::string& dir) {
    const std::string path = JoinPath(dir, "walk_src.usda");
    EXPECT_TRUE(DiskWriteBinary(path, kWalkUsda, sizeof(kWalkUsda) - 1));
    return path;
  }
};

TEST_F(UsdCodecTest, ImportsSkeletonAndAnimation) {
  const std::string dir = test::MakeTestDir("usd_codec_import");
  const std::string path = WriteWalk(dir);
  MemoryScene scene;
  UsdCodec codec;
  VectorLogger logger;
  ASSERT_TRUE(codec.Import(path, &scene, &logger));

  const ObjectId armature = FindArmature(scene, "");
  ASSERT_NE(armature, kNoObject);
  EXPECT_EQ(scene.GetObjectName(armature), "Armature");
  const Skeleton& skeleton = scene.GetSkeleton(armature);
  ASSERT_EQ(skeleton.GetBoneCount(), 2u);
  const size_t hips = skeleton.FindBone("Hips");
  const size_t spine = skeleton.FindBone("Spine");
  ASSERT_NE(hips, kNoBone);
  ASSERT_NE(spine, kNoBone);
  EXPECT_EQ(skeleton.GetBone(spine).parent, hips);
  EXPECT_TRUE(NearlyEqual(skeleton.GetBone(hips).rest.ExtractTranslation(),
                          GfVec3d(0.0, 0.0, 1.0), 1e-9));

  EXPECT_EQ(scene.GetFrameRate(), 24.0);
  double start, end;
  scene.GetFrameRange(&start, &end);
  EXPECT_EQ(start, 0.0);
  EXPECT_EQ(end, 24.0);

  const AnimationClip* const clip = scene.GetAnimation(armature);
  ASSERT_NE(clip, nullptr);
  ASSERT_NE(clip->FindTrack("Hips"), nullptr);
  EXPECT_EQ(clip->FindTrack("Hips")->size(), 2u);
  EXPECT_FALSE(clip->HasTrack("Spine"));
}

TEST_F(UsdCodecTest, ConvertsAndReimports) {
  const std::string dir = test::MakeTestDir("usd_codec_convert");
  const std::string src_path = WriteWalk(dir);
  const std::string out_path =
      JoinPath(JoinPath(dir, kMotionDirName), "walk.usda");
  remove(out_path.c_str());

  ConvertSettings settings;
  settings.file_name = "walk";
  settings.output_dir = dir;
  MemoryScene scene;
  UsdCodec codec;
  VectorLogger logger;
  Converter converter(settings, &scene, &codec, &logger);
  converter.SetSource(src_path);
  converter.RunToCompletion();
  ASSERT_EQ(converter.GetOutputPath(), out_path);

  MemoryScene reimported;
  ASSERT_TRUE(codec.Import(out_path, &reimported, &logger));
  const ObjectId armature = FindArmature(reimported, "Armature");
  ASSERT_NE(armature, kNoObject);
  const Skeleton& skeleton = reimported.GetSkeleton(armature);
  ASSERT_EQ(skeleton.GetBoneCount(), 3u);
  const size_t root = skeleton.FindBone("root");
  ASSERT_NE(root, kNoBone);
  EXPECT_EQ(skeleton.GetBone(root).parent, kNoBone);
  EXPECT_EQ(skeleton.GetBone(skeleton.FindBone("Hips")).parent, root);

  EXPECT_EQ(reimported.GetFrameRate(), kDefaultAnimationSampleRate);
  double start, end;
  reimported.GetFrameRange(&start, &end);
  EXPECT_EQ(start, 0.0);
  EXPECT_EQ(end, 60.0);

  const AnimationClip* const clip = reimported.GetAnimation(armature);
  ASSERT_NE(clip, nullptr);
  const AnimationClip::Track* const root_keys = clip->FindTrack("root");
  const AnimationClip::Track* const hip_keys = clip->FindTrack("Hips");
  ASSERT_NE(root_keys, nullptr);
  ASSERT_NE(hip_keys, nullptr);
  ASSERT_EQ(root_keys->size(), 61u);
  EXPECT_TRUE(NearlyEqual(root_keys->back().local.ExtractTranslation(),
                          GfVec3d(0.0, -1.0, 0.0), 1e-5));
  EXPECT_TRUE(NearlyEqual(hip_keys->back().local.ExtractTranslation(),
                          GfVec3d(0.0, 0.0, 1.0), 1e-5));
}
}  // namespace
}  // namespace rmb
