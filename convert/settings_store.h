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

#ifndef RMB_CONVERT_SETTINGS_STORE_H_
#define RMB_CONVERT_SETTINGS_STORE_H_

#include <string>
#include "common/config.h"
#include "common/message.h"

namespace rmb {
// Properties remembered between runs, per asset directory.
enum SettingsKey : uint8_t {
  kKeyHipBoneName,
  kKeyRootBoneName,
  kKeyAnimationSampleRate,
  kKeyFileName,
  kKeyOutputDir,
  kKeyAppendActorOrMotionPath,
  kKeyDumpDiagnostics,
  kKeyExtractTextures,
  kSettingsKeyCount
};
const char* GetSettingsKeyName(SettingsKey key);

// Key to string store, persisted as a flat JSON object.
class SettingsStore {
 public:
  // Path of the settings file in an asset directory.
  static std::string GetPath(const std::string& dir);

  SettingsStore();

  bool Has(SettingsKey key) const { return present_[key]; }
  // Returns an empty string for absent keys.
  const std::string& Get(SettingsKey key) const { return values_[key]; }
  void Set(SettingsKey key, const std::string& value);
  void Remove(SettingsKey key);
  void Clear();

  // Replaces stored values with the file's. A missing file leaves the store
  // empty and isn't an error. Unknown keys are ignored.
  bool Load(const std::string& path, Logger* logger);
  bool Save(const std::string& path, Logger* logger) const;

  // Overwrites settings with the stored values. Values that don't parse are
  // logged and skipped.
  void ApplyTo(ConvertSettings* settings, Logger* logger) const;
  void CaptureFrom(const ConvertSettings& settings);

 private:
  std::string values_[kSettingsKeyCount];
  bool present_[kSettingsKeyCount];
};
}  // namespace rmb

#endif  // RMB_CONVERT_SETTINGS_STORE_H_
