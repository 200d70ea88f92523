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

#ifndef RMB_COMMON_CONFIG_H_
#define RMB_COMMON_CONFIG_H_

#include <cmath>
#include <string>
#include "common/common.h"

namespace rmb {
using PXR_NS::GfVec3d;

template <typename Scalar>
struct Constants {
  static constexpr Scalar kPi = static_cast<Scalar>(M_PI);
  static constexpr Scalar kHalfPi = kPi / 2;
  static constexpr Scalar kTwoPi = 2 * kPi;
  static constexpr Scalar kRecipTwoPi = 1 / kTwoPi;
  static constexpr Scalar kRadToDeg = 180 / kPi;
  static constexpr Scalar kDegToRad = kPi / 180;
};

enum Axis : uint8_t {
  kAxisX,
  kAxisY,
  kAxisZ,
  kAxisNegX,
  kAxisNegY,
  kAxisNegZ,
  kAxisCount
};
const char* GetAxisName(Axis axis);
GfVec3d GetAxisVector(Axis axis);

// Canonical rig orientation: characters stand on the XY plane, face -Y, and Z
// is up. The synthesized root bone's tail points along the forward axis.
constexpr Axis kGroundForwardAxis = kAxisNegY;
constexpr Axis kUpAxis = kAxisZ;

// Axes pinned on export, matching the target engine's import convention.
constexpr Axis kExportForwardAxis = kAxisY;
constexpr Axis kExportUpAxis = kAxisZ;

// Length of the synthesized root bone, before dividing by object scale.
constexpr double kRootBoneLength = 1.0;

// Tolerance for composed transforms reconstructing a recorded transform.
constexpr double kTransformTol = 1e-5;

// Planar forward vectors shorter than this (squared) don't define a heading.
constexpr double kHeadingLengthSqMin = 1e-12;

// Tolerance to snap sample times onto existing key times.
constexpr double kKeyTimeTol = 1e-6;

// Slack added to sample counts so durations that are whole multiples of the
// sample interval aren't lost to rounding.
constexpr double kSampleCountTol = 1e-6;

// Object scale below this is treated as unscaled when sizing the root bone.
constexpr double kScaleMin = 1e-8;

extern const char* const kDefaultHipBoneName;
extern const char* const kDefaultRootBoneName;
constexpr double kDefaultAnimationSampleRate = 60.0;

// Subdirectories appended to the output directory, per asset type.
extern const char* const kActorDirName;
extern const char* const kMotionDirName;

// Subdirectory textures are extracted to, under the export directory.
extern const char* const kTexturesDirName;

// Persisted settings file name, stored in the asset directory.
extern const char* const kSettingsFileName;

// Suffix of the per-frame diagnostics table written next to the export.
extern const char* const kDiagnosticsSuffix;

struct ConvertSettings {
  // Name of the rig's original parentless bone, which carries the character's
  // locomotion. Blank values fall back to kDefaultHipBoneName.
  std::string hip_bone_name = kDefaultHipBoneName;

  // Name of the synthesized root motion bone. Blank values fall back to
  // kDefaultRootBoneName.
  std::string root_bone_name = kDefaultRootBoneName;

  // Rate, in samples per second, that Motion assets are resampled at.
  // * Resampling is performed in time units, so clips recorded at different
  //   rates produce root motion with the same real-time speed.
  double animation_sample_rate = kDefaultAnimationSampleRate;

  // Name of the exported file. The extension is replaced with the codec's.
  // * If empty, the rig is converted in memory but not exported.
  std::string file_name;

  // Directory to export to. Empty means the current directory.
  std::string output_dir;

  // Append kActorDirName or kMotionDirName to output_dir, unless output_dir
  // already ends with it.
  bool append_actor_or_motion_path = true;

  // Write a per-frame table of the root motion decomposition next to the
  // export.
  bool dump_diagnostics = false;

  // Save copies of embedded images to a textures directory next to the export,
  // prefixed with the exported file's base name.
  bool extract_textures = false;

  // Armature to convert. If empty, the first armature in the scene is used.
  std::string armature_name;

  // Print conversion time stats.
  bool print_timing = false;

  // Paths to USD plugins (may contain wildcards). If unset, the plugins are
  // loaded using the system path.
  std::string plugin_path;

  // Trims bone names and restores defaults for blank or invalid values.
  void Normalize();

  static const ConvertSettings kDefault;
};

}  // namespace rmb

#endif  // RMB_COMMON_CONFIG_H_
