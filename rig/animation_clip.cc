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

#include "rig/animation_clip.h"

#include <algorithm>
#include "common/config.h"
#include "common/logging.h"
#include "process/math.h"

namespace rmb {
const AnimationClip::Track* AnimationClip::FindTrack(
    const std::string& bone_name) const {
  const auto found = tracks_.find(bone_name);
  return found == tracks_.end() ? nullptr : &found->second;
}

void AnimationClip::SetTrack(const std::string& bone_name, Track keys) {
  std::stable_sort(keys.begin(), keys.end(),
                   [](const PoseKey& a, const PoseKey& b) {
                     return a.time < b.time;
                   });
  if (!keys.empty()) {
    const bool first_track = tracks_.empty();
    const double key_start = keys.front().time;
    const double key_end = keys.back().time;
    start_ = first_track ? key_start : std::min(start_, key_start);
    end_ = first_track ? key_end : std::max(end_, key_end);
  }
  tracks_[bone_name] = std::move(keys);
}

void AnimationClip::TransformTrack(const std::string& bone_name,
                                   const GfMatrix4d& mat) {
  const auto found = tracks_.find(bone_name);
  if (found == tracks_.end()) {
    return;
  }
  for (PoseKey& key : found->second) {
    key.local = key.local * mat;
  }
}

bool AnimationClip::Sample(const std::string& bone_name, double seconds,
                           GfMatrix4d* out_local) const {
  const Track* const keys = FindTrack(bone_name);
  if (!keys || keys->empty()) {
    return false;
  }
  *out_local = SampleTrack(*keys, seconds * frame_rate_);
  return true;
}

GfMatrix4d SampleTrack(const AnimationClip::Track& keys, double frame) {
  RMB_ASSERT_LOGIC(!keys.empty());
  if (frame <= keys.front().time + kKeyTimeTol) {
    return keys.front().local;
  }
  if (frame >= keys.back().time - kKeyTimeTol) {
    return keys.back().local;
  }

  // Find the first key after 'frame'. The range checks above guarantee it has
  // a predecessor.
  const auto next = std::upper_bound(
      keys.begin(), keys.end(), frame,
      [](double t, const PoseKey& key) { return t < key.time; });
  const PoseKey& k1 = *next;
  const PoseKey& k0 = *(next - 1);
  if (NearlyEqual(frame, k0.time, kKeyTimeTol)) {
    return k0.local;
  }
  if (NearlyEqual(frame, k1.time, kKeyTimeTol)) {
    return k1.local;
  }
  const double s = (frame - k0.time) / (k1.time - k0.time);
  return BlendTransforms(k0.local, k1.local, s);
}
}  // namespace rmb
