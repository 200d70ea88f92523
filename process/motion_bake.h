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

#ifndef RMB_PROCESS_MOTION_BAKE_H_
#define RMB_PROCESS_MOTION_BAKE_H_

#include <string>
#include <vector>
#include "common/config.h"
#include "process/diagnostics.h"
#include "rig/animation_clip.h"
#include "rig/scene.h"
#include "rig/skeleton.h"

namespace rmb {
struct BakeParams {
  std::string hip_name = kDefaultHipBoneName;
  std::string root_name = kDefaultRootBoneName;

  // Samples per second of the baked clip.
  double sample_rate = kDefaultAnimationSampleRate;

  // Native frame rate and closed frame range of the source animation.
  double source_frame_rate = 30.0;
  double frame_start = 0.0;
  double frame_end = 0.0;
};

// Times, in seconds, that a closed range is sampled at: 'start_seconds' plus
// whole multiples of the sample interval, up to 'end_seconds'.
std::vector<double> GetSampleTimes(double start_seconds, double end_seconds,
                                   double sample_rate);

// Bone transform relative to the armature at a time in seconds. Bones without
// keys hold their rest transform.
GfMatrix4d EvaluateBoneWorld(const Skeleton& skeleton,
                             const AnimationClip* clip, size_t bone_index,
                             double seconds);

// Resamples 'source' at params.sample_rate and moves the hip bone's planar
// motion onto the root bone.
// * The root bone carries the hip's ground-plane translation and its heading
//   about the up axis. The heading is measured from the hip's forward
//   direction, which is the direction that faces kGroundForwardAxis at rest.
// * The hip carries the residual H * R^-1, so composing it with the root
//   reproduces the source hip transform at every sample.
// * Other animated bones are resampled unchanged.
// * Throws UnknownBoneError if either bone is missing, and ConvertError if the
//   hip isn't a direct child of the root.
void BakeRootMotion(const BakeParams& params, const Skeleton& skeleton,
                    const AnimationClip& source, DiagnosticSink* sink,
                    AnimationClip* out_clip);

// Hands a baked clip back to the host, with its frame rate and range.
void CommitClip(Scene* scene, ObjectId armature, const AnimationClip& clip);
}  // namespace rmb

#endif  // RMB_PROCESS_MOTION_BAKE_H_
