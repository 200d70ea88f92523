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

#include "convert/output_path.h"

#include "common/config.h"
#include "gtest/gtest.h"
#include "test/test_util.h"

namespace rmb {
namespace {
TEST(OutputPathTest, InterchangeFileNameReplacesExtension) {
  EXPECT_EQ(MakeInterchangeFileName("walk", "fbx"), "walk.fbx");
  EXPECT_EQ(MakeInterchangeFileName("walk.blend", "fbx"), "walk.fbx");
  EXPECT_EQ(MakeInterchangeFileName("  walk.v2.usda ", "usdc"), "walk.v2.usdc");
  EXPECT_EQ(MakeInterchangeFileName(".hidden", "fbx"), ".hidden.fbx");
}

TEST(OutputPathTest, ExportDirectoryPerAssetType) {
  EXPECT_EQ(GetExportDirectory("out", kAssetMotion, true), "out/Motions");
  EXPECT_EQ(GetExportDirectory("out", kAssetActor, true), "out/Actor");
  EXPECT_EQ(GetExportDirectory("out", kAssetActor, false), "out");
  EXPECT_EQ(GetExportDirectory("", kAssetMotion, true), "./Motions");
  EXPECT_EQ(GetExportDirectory("  ", kAssetMotion, false), ".");
}

TEST(OutputPathTest, SubdirectoryIsNotDuplicated) {
  EXPECT_EQ(GetExportDirectory("out/Motions", kAssetMotion, true),
            "out/Motions");
  EXPECT_EQ(GetExportDirectory("out/Motions/", kAssetMotion, true),
            "out/Motions");
  EXPECT_EQ(GetExportDirectory("out/Actor", kAssetActor, true), "out/Actor");

  // Only the matching subdirectory is recognized.
  EXPECT_EQ(GetExportDirectory("out/Actor", kAssetMotion, true),
            "out/Actor/Motions");
}

TEST(OutputPathTest, ResolveCreatesDirectory) {
  const std::string dir = test::MakeTestDir("output_path_resolve");
  VectorLogger logger;
  const std::string path = ResolveOutputPath("walk.blend", dir, kAssetMotion,
                                             true, "fbx", &logger);
  EXPECT_EQ(path, JoinPath(JoinPath(dir, kMotionDirName), "walk.fbx"));
  EXPECT_TRUE(DiskCreateDirectory(GetFileDirectory(path)));
  EXPECT_TRUE(logger.GetMessages().empty());

  const std::string actor_path =
      ResolveOutputPath("hero", dir, kAssetActor, true, "usda", &logger);
  EXPECT_EQ(actor_path, JoinPath(JoinPath(dir, kActorDirName), "hero.usda"));
}

TEST(OutputPathTest, BlankFileNameSkipsExport) {
  VectorLogger logger;
  EXPECT_EQ(ResolveOutputPath("", "out", kAssetMotion, true, "fbx", &logger),
            "");
  EXPECT_EQ(ResolveOutputPath(" \t", "out", kAssetActor, true, "fbx", &logger),
            "");
  EXPECT_TRUE(logger.GetMessages().empty());
}

TEST(OutputPathTest, UncreatableDirectoryIsReported) {
  const std::string dir = test::MakeTestDir("output_path_blocked");
  // A file where the directory should go.
  const std::string blocker = JoinPath(dir, "blocker");
  ASSERT_TRUE(DiskWriteBinary(blocker, "x", 1));

  VectorLogger logger;
  EXPECT_EQ(ResolveOutputPath("walk", blocker, kAssetMotion, true, "fbx",
                              &logger),
            "");
  EXPECT_TRUE(test::HasMessage(logger, RMB_WARN_CREATE_DIRECTORY));
}
}  // namespace
}  // namespace rmb
