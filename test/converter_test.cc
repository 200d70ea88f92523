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

#include "convert/converter.h"

#include <algorithm>
#include <stdexcept>
#include <vector>
#include "gtest/gtest.h"
#include "process/motion_bake.h"
#include "test/test_util.h"

namespace rmb {
namespace {
using test::AddBipedArmature;
using test::AddWalk;
using test::FakeCodec;
using test::HasMessage;

std::vector<ConvertStatus> RunAll(Converter* converter) {
  std::vector<ConvertStatus> statuses;
  converter->RunToCompletion([&statuses](const ConvertStatus& status) {
    statuses.push_back(status);
  });
  return statuses;
}

std::vector<std::string> GetMessages(const std::vector<ConvertStatus>& v) {
  std::vector<std::string> messages;
  for (const ConvertStatus& status : v) {
    messages.push_back(status.message);
  }
  return messages;
}

// Host that fails while saving images.
class ThrowSaveScene : public MemoryScene {
 public:
  bool SaveImage(size_t image_index) override {
    throw std::runtime_error("disk full");
  }
};

ConvertSettings MakeSettings(const std::string& file_name,
                             const std::string& output_dir) {
  ConvertSettings settings;
  settings.file_name = file_name;
  settings.output_dir = output_dir;
  return settings;
}

TEST(ConverterTest, StatusTagNames) {
  EXPECT_STREQ(GetStatusTagName(kStatusDefault), "default");
  EXPECT_STREQ(GetStatusTagName(kStatusWarning), "warning");
  EXPECT_STREQ(GetStatusTagName(kStatusDone), "done");
}

TEST(ConverterTest, ConvertsMotion) {
  const std::string dir = test::MakeTestDir("converter_motion");
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  AddWalk(&scene, armature, 30.0, 30);
  const Skeleton source_skeleton = scene.GetSkeleton(armature);
  const AnimationClip source_clip = *scene.GetAnimation(armature);
  FakeCodec codec;
  VectorLogger logger;

  Converter converter(MakeSettings("walk", dir), &scene, &codec, &logger);
  const std::vector<ConvertStatus> statuses = RunAll(&converter);
  const std::string out_path =
      JoinPath(JoinPath(dir, kMotionDirName), "walk.fbx");
  const std::vector<std::string> expected = {
      "Starting conversion.",
      "Found armature 'Armature'.",
      "Checked hierarchy. Top bone is 'Hips'.",
      "Checked Asset Type. isActor=False",
      "Processed output path strings: \"" + out_path + "\".",
      "Added root bone 'root'.",
      "Baked root motion.",
      "Exported \"" + out_path + "\".",
      "Completed Asset Conversion.",
  };
  EXPECT_EQ(GetMessages(statuses), expected);
  EXPECT_EQ(statuses.back().tag, kStatusDone);
  for (size_t i = 0; i + 1 < statuses.size(); ++i) {
    EXPECT_EQ(statuses[i].tag, kStatusDefault) << statuses[i].message;
  }
  EXPECT_TRUE(converter.IsDone());
  EXPECT_EQ(converter.GetAssetType(), kAssetMotion);
  EXPECT_EQ(converter.GetOutputPath(), out_path);

  const Skeleton& skeleton = scene.GetSkeleton(armature);
  const size_t root = skeleton.FindBone("root");
  ASSERT_NE(root, kNoBone);
  EXPECT_EQ(skeleton.GetBone(skeleton.FindBone("Hips")).parent, root);

  const AnimationClip* const clip = scene.GetAnimation(armature);
  ASSERT_NE(clip, nullptr);
  ASSERT_NE(clip->FindTrack("root"), nullptr);
  EXPECT_EQ(clip->FindTrack("root")->size(), 61u);
  EXPECT_EQ(scene.GetFrameRate(), kDefaultAnimationSampleRate);
  double start, end;
  scene.GetFrameRange(&start, &end);
  EXPECT_EQ(start, 0.0);
  EXPECT_EQ(end, 60.0);
  EXPECT_EQ(scene.GetMode(), kModeObject);

  // The committed root and hip reproduce the hip of the original rig.
  const size_t source_hips = source_skeleton.FindBone("Hips");
  for (size_t i = 0; i <= 60; ++i) {
    const double seconds = static_cast<double>(i) / 60.0;
    GfMatrix4d root_local, hip_local;
    ASSERT_TRUE(clip->Sample("root", seconds, &root_local));
    ASSERT_TRUE(clip->Sample("Hips", seconds, &hip_local));
    const GfMatrix4d hip_world = EvaluateBoneWorld(
        source_skeleton, &source_clip, source_hips, seconds);
    EXPECT_TRUE(NearlyEqual(hip_local * root_local, hip_world, 1e-5))
        << "sample " << i;
  }

  ASSERT_EQ(codec.exported.size(), 1u);
  EXPECT_EQ(codec.exported[0], out_path);
  EXPECT_EQ(codec.last_options.forward_axis, kAxisY);
  EXPECT_EQ(codec.last_options.up_axis, kAxisZ);
  EXPECT_EQ(codec.last_options.path_mode, kPathModeCopy);
  EXPECT_TRUE(codec.imported.empty());
  EXPECT_EQ(logger.GetErrorCount(), 0u);
}

TEST(ConverterTest, ConvertsActor) {
  const std::string dir = test::MakeTestDir("converter_actor");
  MemoryScene scene;
  GfMatrix4d scale(1.0);
  scale.SetScale(0.01);
  GfMatrix4d rotate(1.0);
  rotate.SetRotate(GfRotation(GfVec3d(1.0, 0.0, 0.0), 90.0));
  const ObjectId armature = AddBipedArmature(&scene, scale * rotate);
  scene.AddObject("Body", kObjectMesh, armature, GfMatrix4d(1.0));
  FakeCodec codec;
  VectorLogger logger;

  Converter converter(MakeSettings("hero.blend", dir), &scene, &codec,
                      &logger);
  const std::vector<std::string> messages = GetMessages(RunAll(&converter));
  const std::string out_path =
      JoinPath(JoinPath(dir, kActorDirName), "hero.fbx");
  ASSERT_EQ(messages.size(), 9u);
  EXPECT_EQ(messages[3], "Checked Asset Type. isActor=True");
  EXPECT_EQ(messages[6], "Normalized rest pose.");
  EXPECT_EQ(messages[7], "Exported \"" + out_path + "\".");
  EXPECT_EQ(converter.GetAssetType(), kAssetActor);

  // The object rotation moved into the root bone.
  EXPECT_TRUE(NearlyEqual(scene.GetObjectTransform(armature), scale, 1e-9));
  const Skeleton& skeleton = scene.GetSkeleton(armature);
  EXPECT_TRUE(NearlyEqual(skeleton.GetBone(skeleton.FindBone("root")).rest,
                          rotate, 1e-9));
  EXPECT_EQ(scene.GetAnimation(armature), nullptr);
}

TEST(ConverterTest, ImportReplacesLeftovers) {
  const std::string dir = test::MakeTestDir("converter_import");
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  AddWalk(&scene, armature, 30.0, 5);
  ImageResource leftover;
  leftover.name = "old.png";
  scene.AddImage(leftover);

  FakeCodec codec;
  codec.on_import = [armature](Scene* imported) {
    EXPECT_EQ(imported->GetAnimation(armature), nullptr);
    EXPECT_EQ(imported->GetImageCount(), 0u);
    imported->SetAnimation(armature, test::MakeWalkClip(30.0, 30));
    imported->SetFrameRate(30.0);
    imported->SetFrameRange(0.0, 30.0);
  };
  VectorLogger logger;
  const std::string src_path = JoinPath(dir, "walk_src.fbx");

  Converter converter(MakeSettings("walk", dir), &scene, &codec, &logger);
  converter.SetSource(src_path);
  const std::vector<std::string> messages = GetMessages(RunAll(&converter));
  ASSERT_EQ(messages.size(), 10u);
  EXPECT_EQ(messages[1], "Imported \"" + src_path + "\".");
  ASSERT_EQ(codec.imported.size(), 1u);
  EXPECT_EQ(codec.imported[0], src_path);
  EXPECT_EQ(scene.GetSourcePath(), src_path);
  EXPECT_TRUE(HasMessage(logger, RMB_INFO_CLEARED_ANIMATIONS));
  EXPECT_TRUE(HasMessage(logger, RMB_INFO_CLEARED_IMAGES));
  EXPECT_EQ(scene.GetAnimation(armature)->FindTrack("root")->size(), 61u);
}

TEST(ConverterTest, FreshImportLogsNothing) {
  const std::string dir = test::MakeTestDir("converter_fresh_import");
  MemoryScene scene;
  FakeCodec codec;
  codec.on_import = [](Scene* imported) {
    MemoryScene* const memory = static_cast<MemoryScene*>(imported);
    const ObjectId armature = AddBipedArmature(memory);
    AddWalk(memory, armature, 24.0, 24);
  };
  VectorLogger logger;
  Converter converter(MakeSettings("walk", dir), &scene, &codec, &logger);
  converter.SetSource(JoinPath(dir, "walk_src.fbx"));
  EXPECT_EQ(RunAll(&converter).size(), 10u);
  EXPECT_FALSE(HasMessage(logger, RMB_INFO_CLEARED_ANIMATIONS));
  EXPECT_FALSE(HasMessage(logger, RMB_INFO_CLEARED_IMAGES));
}

TEST(ConverterTest, ImportFailureThrows) {
  MemoryScene scene;
  FakeCodec codec;
  codec.import_succeeds = false;
  VectorLogger logger;
  Converter converter(ConvertSettings(), &scene, &codec, &logger);
  converter.SetSource("missing.fbx");
  ConvertStatus status;
  ASSERT_TRUE(converter.Next(&status));
  EXPECT_THROW(converter.Next(&status), ImportError);

  // Nothing runs against the stale scene afterwards.
  EXPECT_TRUE(converter.IsDone());
  EXPECT_FALSE(converter.Next(&status));
  EXPECT_EQ(codec.imported.size(), 1u);
}

TEST(ConverterTest, AmbiguousHierarchyEndsConversion) {
  MemoryScene scene;
  const ObjectId armature =
      scene.AddObject("Armature", kObjectArmature, kNoObject, GfMatrix4d(1.0));
  Skeleton skeleton = test::MakeBipedSkeleton();
  skeleton.AddBone("Extra", kNoBone, GfMatrix4d(1.0), GfVec3d(0.0, 0.0, 0.1));
  scene.SetSkeleton(armature, skeleton);
  FakeCodec codec;
  VectorLogger logger;
  Converter converter(ConvertSettings(), &scene, &codec, &logger);

  ConvertStatus status;
  ASSERT_TRUE(converter.Next(&status));
  ASSERT_TRUE(converter.Next(&status));
  EXPECT_EQ(status.message, "Found armature 'Armature'.");
  EXPECT_THROW(converter.Next(&status), AmbiguousHierarchyError);

  // Pulling again after the error runs no further stage.
  EXPECT_TRUE(converter.IsDone());
  EXPECT_FALSE(converter.Next(&status));
  converter.RunToCompletion();
  const Skeleton& after = scene.GetSkeleton(armature);
  EXPECT_EQ(after.GetBoneCount(), 5u);
  EXPECT_EQ(after.FindBone("root"), kNoBone);
  EXPECT_EQ(after.GetRootBones().size(), 2u);
  EXPECT_EQ(scene.GetEditModeEnterCount(), 0u);
  EXPECT_TRUE(codec.exported.empty());
}

TEST(ConverterTest, ExportFailureThrows) {
  const std::string dir = test::MakeTestDir("converter_export_failure");
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  AddWalk(&scene, armature, 30.0, 10);
  FakeCodec codec;
  codec.export_succeeds = false;
  VectorLogger logger;
  Converter converter(MakeSettings("walk", dir), &scene, &codec, &logger);
  EXPECT_THROW(converter.RunToCompletion(), ExportError);

  // Edits made before the failure stay committed.
  EXPECT_NE(scene.GetSkeleton(armature).FindBone("root"), kNoBone);
}

TEST(ConverterTest, MissingArmatureThrows) {
  MemoryScene scene;
  scene.AddObject("Prop", kObjectMesh, kNoObject, GfMatrix4d(1.0));
  FakeCodec codec;
  VectorLogger logger;
  Converter converter(ConvertSettings(), &scene, &codec, &logger);
  EXPECT_THROW(converter.RunToCompletion(), MissingArmatureError);
}

TEST(ConverterTest, SecondConversionIsRefused) {
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  AddWalk(&scene, armature, 30.0, 10);
  FakeCodec codec;
  VectorLogger logger;
  Converter first(ConvertSettings(), &scene, &codec, &logger);
  first.RunToCompletion();
  const size_t bone_count = scene.GetSkeleton(armature).GetBoneCount();

  Converter second(ConvertSettings(), &scene, &codec, &logger);
  EXPECT_THROW(second.RunToCompletion(), AlreadyProcessedError);
  EXPECT_EQ(scene.GetSkeleton(armature).GetBoneCount(), bone_count);
}

TEST(ConverterTest, StoppingEarlyKeepsCompletedStages) {
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  AddWalk(&scene, armature, 30.0, 10);
  FakeCodec codec;
  VectorLogger logger;
  Converter converter(ConvertSettings(), &scene, &codec, &logger);
  ConvertStatus status;
  while (converter.Next(&status)) {
    if (status.message == "Added root bone 'root'.") {
      break;
    }
  }
  EXPECT_FALSE(converter.IsDone());
  EXPECT_NE(scene.GetSkeleton(armature).FindBone("root"), kNoBone);
  EXPECT_FALSE(scene.GetAnimation(armature)->HasTrack("root"));
  EXPECT_TRUE(codec.exported.empty());
}

TEST(ConverterTest, BlankFileNameConvertsWithoutExport) {
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  AddWalk(&scene, armature, 30.0, 10);
  FakeCodec codec;
  VectorLogger logger;
  Converter converter(MakeSettings("  ", "unused"), &scene, &codec, &logger);
  const std::vector<ConvertStatus> statuses = RunAll(&converter);
  ASSERT_EQ(statuses.size(), 9u);
  EXPECT_EQ(statuses[4].tag, kStatusWarning);
  EXPECT_EQ(statuses[7].message, "Skipped export.");
  EXPECT_EQ(statuses[7].tag, kStatusWarning);
  EXPECT_EQ(statuses[8].tag, kStatusDone);
  EXPECT_TRUE(codec.exported.empty());
  EXPECT_TRUE(HasMessage(logger, RMB_WARN_NO_FILE_NAME));
  EXPECT_TRUE(scene.GetAnimation(armature)->HasTrack("root"));
}

TEST(ConverterTest, ExtractsTextures) {
  const std::string dir = test::MakeTestDir("converter_textures");
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  scene.AddObject("Body", kObjectMesh, armature, GfMatrix4d(1.0));
  ImageResource embedded;
  embedded.name = "Skin";
  embedded.file_path = "//textures/skin.png";
  embedded.data = {1, 2, 3, 4};
  scene.AddImage(embedded);
  ImageResource linked;
  linked.name = "Linked";
  linked.file_path = "linked.png";
  scene.AddImage(linked);

  ConvertSettings settings = MakeSettings("hero", dir);
  settings.extract_textures = true;
  FakeCodec codec;
  VectorLogger logger;
  Converter converter(settings, &scene, &codec, &logger);
  const std::vector<ConvertStatus> statuses = RunAll(&converter);

  const std::string textures_dir =
      JoinPath(JoinPath(dir, kActorDirName), kTexturesDirName);
  ASSERT_EQ(statuses.size(), 10u);
  EXPECT_EQ(statuses[8].message,
            "Extracted 1 texture(s) to \"" + textures_dir + "\".");
  EXPECT_EQ(statuses[8].tag, kStatusDefault);
  EXPECT_EQ(test::ReadTextFile(JoinPath(textures_dir, "hero_skin.png")),
            std::string("\x01\x02\x03\x04"));
  EXPECT_EQ(scene.GetImage(0).file_path, "//textures/skin.png");
  EXPECT_EQ(scene.GetImage(1).file_path, "linked.png");
}

TEST(ConverterTest, FailedTextureSaveRestoresImagePath) {
  const std::string dir = test::MakeTestDir("converter_texture_failure");
  ThrowSaveScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  scene.AddObject("Body", kObjectMesh, armature, GfMatrix4d(1.0));
  ImageResource embedded;
  embedded.name = "Skin";
  embedded.file_path = "//textures/skin.png";
  embedded.data = {1, 2, 3, 4};
  scene.AddImage(embedded);

  ConvertSettings settings = MakeSettings("hero", dir);
  settings.extract_textures = true;
  FakeCodec codec;
  VectorLogger logger;
  Converter converter(settings, &scene, &codec, &logger);
  EXPECT_THROW(converter.RunToCompletion(), std::runtime_error);
  EXPECT_EQ(scene.GetImage(0).file_path, "//textures/skin.png");
}

TEST(ConverterTest, WritesDiagnostics) {
  const std::string dir = test::MakeTestDir("converter_diagnostics");
  MemoryScene scene;
  const ObjectId armature = AddBipedArmature(&scene);
  AddWalk(&scene, armature, 30.0, 30);
  ConvertSettings settings = MakeSettings("walk", dir);
  settings.dump_diagnostics = true;
  FakeCodec codec;
  VectorLogger logger;
  Converter converter(settings, &scene, &codec, &logger);
  converter.RunToCompletion();

  const std::string text = test::ReadTextFile(
      JoinPath(JoinPath(dir, kMotionDirName), "walk_root_motion.csv"));
  ASSERT_FALSE(text.empty());
  EXPECT_EQ(text.compare(0, 5, "time,"), 0);
  // Header plus one row per sample.
  EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 62);
}
}  // namespace
}  // namespace rmb
