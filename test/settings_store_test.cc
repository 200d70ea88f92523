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

#include "convert/settings_store.h"

#include <stdio.h>
#include "gtest/gtest.h"
#include "test/test_util.h"

namespace rmb {
namespace {
void WriteText(const std::string& path, const std::string& text) {
  ASSERT_TRUE(DiskWriteBinary(path, text.data(), text.size()));
}

TEST(SettingsStoreTest, PathIsInAssetDirectory) {
  EXPECT_EQ(SettingsStore::GetPath("assets/hero"),
            std::string("assets/hero/") + kSettingsFileName);
}

TEST(SettingsStoreTest, SetGetRemove) {
  SettingsStore store;
  EXPECT_FALSE(store.Has(kKeyHipBoneName));
  EXPECT_EQ(store.Get(kKeyHipBoneName), "");
  store.Set(kKeyHipBoneName, "Pelvis");
  EXPECT_TRUE(store.Has(kKeyHipBoneName));
  EXPECT_EQ(store.Get(kKeyHipBoneName), "Pelvis");
  store.Remove(kKeyHipBoneName);
  EXPECT_FALSE(store.Has(kKeyHipBoneName));

  store.Set(kKeyFileName, "");
  EXPECT_TRUE(store.Has(kKeyFileName));
  store.Clear();
  EXPECT_FALSE(store.Has(kKeyFileName));
}

TEST(SettingsStoreTest, SaveAndLoad) {
  const std::string dir = test::MakeTestDir("settings_save_load");
  const std::string path = SettingsStore::GetPath(dir);
  VectorLogger logger;

  SettingsStore saved;
  saved.Set(kKeyHipBoneName, "Pelvis");
  saved.Set(kKeyOutputDir, "C:\\Export \"quoted\"");
  saved.Set(kKeyDumpDiagnostics, "true");
  ASSERT_TRUE(saved.Save(path, &logger));

  SettingsStore loaded;
  loaded.Set(kKeyRootBoneName, "stale");
  ASSERT_TRUE(loaded.Load(path, &logger));
  EXPECT_EQ(loaded.Get(kKeyHipBoneName), "Pelvis");
  EXPECT_EQ(loaded.Get(kKeyOutputDir), "C:\\Export \"quoted\"");
  EXPECT_EQ(loaded.Get(kKeyDumpDiagnostics), "true");
  EXPECT_FALSE(loaded.Has(kKeyRootBoneName));
  EXPECT_FALSE(loaded.Has(kKeyFileName));
  EXPECT_TRUE(logger.GetMessages().empty());

  const std::string text = test::ReadTextFile(path);
  EXPECT_NE(text.find("\"hipBoneName\": \"Pelvis\""), std::string::npos);
}

TEST(SettingsStoreTest, MissingFileLoadsEmpty) {
  const std::string dir = test::MakeTestDir("settings_missing");
  const std::string path = SettingsStore::GetPath(dir);
  remove(path.c_str());

  VectorLogger logger;
  SettingsStore store;
  store.Set(kKeyHipBoneName, "Pelvis");
  EXPECT_TRUE(store.Load(path, &logger));
  EXPECT_FALSE(store.Has(kKeyHipBoneName));
  EXPECT_TRUE(logger.GetMessages().empty());
}

TEST(SettingsStoreTest, MalformedFileIsReported) {
  const std::string dir = test::MakeTestDir("settings_malformed");
  const std::string path = SettingsStore::GetPath(dir);
  VectorLogger logger;
  SettingsStore store;

  WriteText(path, "{ \"hipBoneName\": ");
  EXPECT_FALSE(store.Load(path, &logger));
  EXPECT_TRUE(test::HasMessage(logger, RMB_WARN_SETTINGS_READ));

  VectorLogger array_logger;
  WriteText(path, "[\"Hips\"]");
  EXPECT_FALSE(store.Load(path, &array_logger));
  EXPECT_TRUE(test::HasMessage(array_logger, RMB_WARN_SETTINGS_READ));
}

TEST(SettingsStoreTest, NonStringValuesAreSkipped) {
  const std::string dir = test::MakeTestDir("settings_non_string");
  const std::string path = SettingsStore::GetPath(dir);
  WriteText(path,
            "{\"hipBoneName\": \"Pelvis\", \"animationSampleRate\": 24, "
            "\"unknownKey\": \"x\"}");

  VectorLogger logger;
  SettingsStore store;
  EXPECT_TRUE(store.Load(path, &logger));
  EXPECT_EQ(store.Get(kKeyHipBoneName), "Pelvis");
  EXPECT_FALSE(store.Has(kKeyAnimationSampleRate));
  EXPECT_TRUE(test::HasMessage(logger, RMB_WARN_SETTINGS_VALUE));
  EXPECT_EQ(logger.GetMessages().size(), 1u);
}

TEST(SettingsStoreTest, ApplyOverwritesStoredKeysOnly) {
  SettingsStore store;
  store.Set(kKeyRootBoneName, "motion");
  store.Set(kKeyAnimationSampleRate, "24");
  store.Set(kKeyAppendActorOrMotionPath, "False");
  store.Set(kKeyExtractTextures, "1");

  ConvertSettings settings;
  settings.hip_bone_name = "Pelvis";
  VectorLogger logger;
  store.ApplyTo(&settings, &logger);
  EXPECT_EQ(settings.hip_bone_name, "Pelvis");
  EXPECT_EQ(settings.root_bone_name, "motion");
  EXPECT_EQ(settings.animation_sample_rate, 24.0);
  EXPECT_FALSE(settings.append_actor_or_motion_path);
  EXPECT_TRUE(settings.extract_textures);
  EXPECT_FALSE(settings.dump_diagnostics);
  EXPECT_TRUE(logger.GetMessages().empty());
}

TEST(SettingsStoreTest, InvalidValuesKeepCurrentSettings) {
  SettingsStore store;
  store.Set(kKeyAnimationSampleRate, "60fps");
  store.Set(kKeyDumpDiagnostics, "yes");
  ConvertSettings settings;
  VectorLogger logger;
  store.ApplyTo(&settings, &logger);
  EXPECT_EQ(settings.animation_sample_rate, kDefaultAnimationSampleRate);
  EXPECT_FALSE(settings.dump_diagnostics);
  EXPECT_EQ(logger.GetMessages().size(), 2u);

  SettingsStore negative;
  negative.Set(kKeyAnimationSampleRate, "-30");
  VectorLogger negative_logger;
  negative.ApplyTo(&settings, &negative_logger);
  EXPECT_EQ(settings.animation_sample_rate, kDefaultAnimationSampleRate);
  EXPECT_TRUE(test::HasMessage(negative_logger, RMB_WARN_SETTINGS_VALUE));
}

TEST(SettingsStoreTest, CaptureThenApplyRestoresSettings) {
  ConvertSettings original;
  original.hip_bone_name = "Pelvis";
  original.root_bone_name = "motion";
  original.animation_sample_rate = 29.97;
  original.file_name = "walk_01";
  original.output_dir = "export/game";
  original.append_actor_or_motion_path = false;
  original.dump_diagnostics = true;
  original.extract_textures = true;
  original.armature_name = "NotPersisted";

  SettingsStore store;
  store.CaptureFrom(original);
  EXPECT_EQ(store.Get(kKeyAnimationSampleRate), "29.97");
  EXPECT_EQ(store.Get(kKeyDumpDiagnostics), "true");

  ConvertSettings restored;
  VectorLogger logger;
  store.ApplyTo(&restored, &logger);
  EXPECT_EQ(restored.hip_bone_name, original.hip_bone_name);
  EXPECT_EQ(restored.root_bone_name, original.root_bone_name);
  EXPECT_EQ(restored.animation_sample_rate, original.animation_sample_rate);
  EXPECT_EQ(restored.file_name, original.file_name);
  EXPECT_EQ(restored.output_dir, original.output_dir);
  EXPECT_FALSE(restored.append_actor_or_motion_path);
  EXPECT_TRUE(restored.dump_diagnostics);
  EXPECT_TRUE(restored.extract_textures);
  EXPECT_EQ(restored.armature_name, "");
  EXPECT_TRUE(logger.GetMessages().empty());
}
}  // namespace
}  // namespace rmb
