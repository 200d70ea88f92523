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

#include "process/motion_bake.h"

#include <cmath>
#include "common/logging.h"
#include "process/math.h"

namespace rmb {
namespace {
// Direction in the hip's own space that faces ground-forward at rest.
GfVec3d GetHipForward(const Skeleton& skeleton, size_t hip) {
  const GfMatrix4d rest_world = skeleton.GetRestWorld(hip);
  const GfVec3d forward = rest_world.GetInverse().TransformDir(
      GetAxisVector(kGroundForwardAxis));
  const double length = forward.GetLength();
  return length > 0.0 ? forward / length : GetAxisVector(kGroundForwardAxis);
}

AnimationClip::Track ResampleTrack(const AnimationClip& source,
                                   const std::string& bone_name,
                                   const std::vector<double>& times,
                                   double first_frame) {
  AnimationClip::Track keys;
  keys.reserve(times.size());
  for (size_t i = 0; i != times.size(); ++i) {
    PoseKey key;
    key.time = first_frame + static_cast<double>(i);
    RMB_VERIFY(source.Sample(bone_name, times[i], &key.local));
    keys.push_back(key);
  }
  return keys;
}
}  // namespace

std::vector<double> GetSampleTimes(double start_seconds, double end_seconds,
                                   double sample_rate) {
  RMB_ASSERT_LOGIC(sample_rate > 0.0);
  const double duration = std::max(end_seconds - start_seconds, 0.0);
  const size_t count =
      static_cast<size_t>(std::floor(duration * sample_rate + kSampleCountTol)) +
      1;
  std::vector<double> times(count);
  for (size_t i = 0; i != count; ++i) {
    times[i] = start_seconds + static_cast<double>(i) / sample_rate;
  }
  return times;
}

GfMatrix4d EvaluateBoneWorld(const Skeleton& skeleton,
                             const AnimationClip* clip, size_t bone_index,
                             double seconds) {
  GfMatrix4d world(1.0);
  for (size_t i = bone_index; i != kNoBone; i = skeleton.GetBone(i).parent) {
    const Bone& bone = skeleton.GetBone(i);
    GfMatrix4d local;
    if (!clip || !clip->Sample(bone.name, seconds, &local)) {
      local = bone.rest;
    }
    world = world * local;
  }
  return world;
}

void BakeRootMotion(const BakeParams& params, const Skeleton& skeleton,
                    const AnimationClip& source, DiagnosticSink* sink,
                    AnimationClip* out_clip) {
  const size_t hip = skeleton.FindBone(params.hip_name);
  if (hip == kNoBone) {
    ThrowError<UnknownBoneError, RMB_ERROR_UNKNOWN_BONE>(
        params.hip_name.c_str());
  }
  const size_t root = skeleton.FindBone(params.root_name);
  if (root == kNoBone) {
    ThrowError<UnknownBoneError, RMB_ERROR_UNKNOWN_BONE>(
        params.root_name.c_str());
  }
  if (skeleton.GetBone(hip).parent != root) {
    ThrowError<ConvertError, RMB_ERROR_HIP_PARENT>(
        params.hip_name.c_str(), params.root_name.c_str());
  }
  RMB_ASSERT_LOGIC(params.source_frame_rate > 0.0);

  const double start_seconds = params.frame_start / params.source_frame_rate;
  const double end_seconds = params.frame_end / params.source_frame_rate;
  const std::vector<double> times =
      GetSampleTimes(start_seconds, end_seconds, params.sample_rate);
  const double first_frame = start_seconds * params.sample_rate;

  const GfVec3d ground_forward = GetAxisVector(kGroundForwardAxis);
  const GfVec3d hip_forward = GetHipForward(skeleton, hip);

  AnimationClip::Track root_keys;
  AnimationClip::Track hip_keys;
  root_keys.reserve(times.size());
  hip_keys.reserve(times.size());
  double prev_yaw = 0.0;
  for (size_t i = 0; i != times.size(); ++i) {
    const double t = times[i];
    const GfMatrix4d hip_world = EvaluateBoneWorld(skeleton, &source, hip, t);

    // Heading of the hip's forward direction. Keep the previous heading when
    // the forward direction is vertical.
    double yaw = prev_yaw;
    double heading;
    if (GetHeadingAngle(ground_forward, hip_world.TransformDir(hip_forward),
                        &heading)) {
      yaw = i == 0 ? heading : AngleUnwrap(heading, prev_yaw);
    }
    prev_yaw = yaw;

    const GfVec3d hip_pos = hip_world.ExtractTranslation();
    const GfMatrix4d root_mat =
        MakeHeadingTransform(yaw, GfVec3d(hip_pos[0], hip_pos[1], 0.0));
    const GfMatrix4d hip_local = hip_world * root_mat.GetInverse();

    const double frame = first_frame + static_cast<double>(i);
    root_keys.push_back({frame, root_mat});
    hip_keys.push_back({frame, hip_local});

    if (sink) {
      DiagnosticRow row;
      row.time = t;
      row.root_translation = root_mat.ExtractTranslation();
      row.root_yaw = yaw * Constants<double>::kRadToDeg;
      row.hip_translation = hip_local.ExtractTranslation();
      row.hip_rotation = RadToDeg(QuatToEuler(DecomposeSrt(hip_local).rotation));
      sink->Add(row);
    }
  }

  AnimationClip clip(source.GetName(), params.sample_rate);
  for (const auto& entry : source.GetTracks()) {
    const std::string& bone_name = entry.first;
    if (bone_name == params.hip_name || bone_name == params.root_name ||
        entry.second.empty()) {
      continue;
    }
    clip.SetTrack(bone_name, ResampleTrack(source, bone_name, times,
                                           first_frame));
  }
  clip.SetTrack(params.root_name, std::move(root_keys));
  clip.SetTrack(params.hip_name, std::move(hip_keys));
  clip.SetFrameRange(first_frame,
                     first_frame + static_cast<double>(times.size() - 1));
  *out_clip = std::move(clip);
}

void CommitClip(Scene* scene, ObjectId armature, const AnimationClip& clip) {
  scene->SetMode(kModeObject);
  scene->SetAnimation(armature, clip);
  scene->SetFrameRate(clip.GetFrameRate());
  scene->SetFrameRange(clip.GetStartFrame(), clip.GetEndFrame());
}
}  // namespace rmb
