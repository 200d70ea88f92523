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

#include <stdlib.h>
#include <vector>
#include "common/common_util.h"
#include "common/disk_util.h"
#include "common/logging.h"
#include "common/platform.h"
#include "nlohmann/json.hpp"

namespace rmb {
namespace {
using json = nlohmann::json;

bool ParseBool(const std::string& text, bool* out_value) {
  if (text == "true" || text == "1" || text == "True") {
    *out_value = true;
    return true;
  }
  if (text == "false" || text == "0" || text == "False") {
    *out_value = false;
    return true;
  }
  return false;
}

bool ParseDouble(const std::string& text, double* out_value) {
  const std::string trimmed = TrimWhitespace(text);
  if (trimmed.empty()) {
    return false;
  }
  char* end = nullptr;
  const double value = strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.length()) {
    return false;
  }
  *out_value = value;
  return true;
}

std::string FormatDouble(double value) {
  char text[64];
  snprintf(text, sizeof(text), "%.10g", value);
  return text;
}

const char* FormatBool(bool value) {
  return value ? "true" : "false";
}
}  // namespace

const char* GetSettingsKeyName(SettingsKey key) {
  static const char* const kNames[] = {
      "hipBoneName",              // kKeyHipBoneName
      "rootBoneName",             // kKeyRootBoneName
      "animationSampleRate",      // kKeyAnimationSampleRate
      "fileName",                 // kKeyFileName
      "outputDir",                // kKeyOutputDir
      "appendActorOrMotionPath",  // kKeyAppendActorOrMotionPath
      "dumpDiagnostics",          // kKeyDumpDiagnostics
      "extractTextures",          // kKeyExtractTextures
  };
  static_assert(RMB_ARRAY_SIZE(kNames) == kSettingsKeyCount, "");
  return key < kSettingsKeyCount ? kNames[key] : "?";
}

std::string SettingsStore::GetPath(const std::string& dir) {
  return JoinPath(dir, kSettingsFileName);
}

SettingsStore::SettingsStore() {
  Clear();
}

void SettingsStore::Set(SettingsKey key, const std::string& value) {
  values_[key] = value;
  present_[key] = true;
}

void SettingsStore::Remove(SettingsKey key) {
  values_[key].clear();
  present_[key] = false;
}

void SettingsStore::Clear() {
  for (size_t i = 0; i != kSettingsKeyCount; ++i) {
    Remove(static_cast<SettingsKey>(i));
  }
}

bool SettingsStore::Load(const std::string& path, Logger* logger) {
  Clear();
  if (!FileExists(path.c_str())) {
    return true;
  }
  std::vector<uint8_t> data;
  if (!DiskReadBinary(path, &data)) {
    Log<RMB_WARN_SETTINGS_READ>(logger, "", path.c_str(), "read failed");
    return false;
  }
  const json root = json::parse(data.begin(), data.end(), nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    Log<RMB_WARN_SETTINGS_READ>(logger, "", path.c_str(),
                                "expected a JSON object");
    return false;
  }
  for (size_t i = 0; i != kSettingsKeyCount; ++i) {
    const SettingsKey key = static_cast<SettingsKey>(i);
    const char* const name = GetSettingsKeyName(key);
    const auto found = root.find(name);
    if (found == root.end()) {
      continue;
    }
    if (found->is_string()) {
      Set(key, found->get<std::string>());
    } else {
      Log<RMB_WARN_SETTINGS_VALUE>(logger, path.c_str(), name,
                                   found->dump().c_str());
    }
  }
  return true;
}

bool SettingsStore::Save(const std::string& path, Logger* logger) const {
  json root = json::object();
  for (size_t i = 0; i != kSettingsKeyCount; ++i) {
    if (present_[i]) {
      root[GetSettingsKeyName(static_cast<SettingsKey>(i))] = values_[i];
    }
  }
  const std::string text = root.dump(2) + "\n";
  if (!DiskWriteBinary(path, text.data(), text.size())) {
    Log<RMB_WARN_SETTINGS_WRITE>(logger, "", path.c_str());
    return false;
  }
  return true;
}

void SettingsStore::ApplyTo(ConvertSettings* settings, Logger* logger) const {
  for (size_t i = 0; i != kSettingsKeyCount; ++i) {
    if (!present_[i]) {
      continue;
    }
    const SettingsKey key = static_cast<SettingsKey>(i);
    const std::string& value = values_[i];
    bool valid = true;
    switch (key) {
      case kKeyHipBoneName:
        settings->hip_bone_name = value;
        break;
      case kKeyRootBoneName:
        settings->root_bone_name = value;
        break;
      case kKeyAnimationSampleRate: {
        double rate = 0.0;
        valid = ParseDouble(value, &rate) && rate > 0.0;
        if (valid) {
          settings->animation_sample_rate = rate;
        }
        break;
      }
      case kKeyFileName:
        settings->file_name = value;
        break;
      case kKeyOutputDir:
        settings->output_dir = value;
        break;
      case kKeyAppendActorOrMotionPath:
        valid = ParseBool(value, &settings->append_actor_or_motion_path);
        break;
      case kKeyDumpDiagnostics:
        valid = ParseBool(value, &settings->dump_diagnostics);
        break;
      case kKeyExtractTextures:
        valid = ParseBool(value, &settings->extract_textures);
        break;
      default:
        break;
    }
    if (!valid) {
      Log<RMB_WARN_SETTINGS_VALUE>(logger, "", GetSettingsKeyName(key),
                                   value.c_str());
    }
  }
}

void SettingsStore::CaptureFrom(const ConvertSettings& settings) {
  Set(kKeyHipBoneName, settings.hip_bone_name);
  Set(kKeyRootBoneName, settings.root_bone_name);
  Set(kKeyAnimationSampleRate, FormatDouble(settings.animation_sample_rate));
  Set(kKeyFileName, settings.file_name);
  Set(kKeyOutputDir, settings.output_dir);
  Set(kKeyAppendActorOrMotionPath,
      FormatBool(settings.append_actor_or_motion_path));
  Set(kKeyDumpDiagnostics, FormatBool(settings.dump_diagnostics));
  Set(kKeyExtractTextures, FormatBool(settings.extract_textures));
}
}  // namespace rmb
