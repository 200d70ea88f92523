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

#ifndef RMB_RIG_ANIMATION_CLIP_H_
#define RMB_RIG_ANIMATION_CLIP_H_

#include <map>
#include <string>
#include <vector>
#include "common/common.h"

namespace rmb {
using PXR_NS::GfMatrix4d;

struct PoseKey {
  // Frame number, at the owning clip's frame rate.
  double time;
  // Bone transform relative to its parent.
  GfMatrix4d local;
};

class AnimationClip {
 public:
  using Track = std::vector<PoseKey>;
  using TrackMap = std::map<std::string, Track>;

  AnimationClip() {}
  AnimationClip(const std::string& name, double frame_rate)
      : name_(name), frame_rate_(frame_rate) {}

  const std::string& GetName() const { return name_; }
  void SetName(const std::string& name) { name_ = name; }

  // Frames per second.
  double GetFrameRate() const { return frame_rate_; }
  void SetFrameRate(double frame_rate) { frame_rate_ = frame_rate; }

  // Closed frame range. Defaults to the span of all keys.
  double GetStartFrame() const { return start_; }
  double GetEndFrame() const { return end_; }
  void SetFrameRange(double start, double end) {
    start_ = start;
    end_ = end;
  }

  bool IsEmpty() const { return tracks_.empty(); }
  const TrackMap& GetTracks() const { return tracks_; }
  bool HasTrack(const std::string& bone_name) const {
    return tracks_.count(bone_name) != 0;
  }

  // Returns null if the bone isn't animated.
  const Track* FindTrack(const std::string& bone_name) const;

  // Replaces the bone's keys, sorted by time, and grows the frame range to
  // cover them.
  void SetTrack(const std::string& bone_name, Track keys);

  void RemoveTrack(const std::string& bone_name) { tracks_.erase(bone_name); }

  // Multiplies every key of the bone's track by 'mat' (key * mat).
  void TransformTrack(const std::string& bone_name, const GfMatrix4d& mat);

  // Evaluates the bone's local transform at a time in seconds. Times outside
  // the keyed range hold the first or last key. Returns false if the bone isn't
  // animated.
  bool Sample(const std::string& bone_name, double seconds,
              GfMatrix4d* out_local) const;

 private:
  std::string name_;
  double frame_rate_ = 30.0;
  double start_ = 0.0;
  double end_ = 0.0;
  TrackMap tracks_;
};

// Evaluates a key track at a frame time.
GfMatrix4d SampleTrack(const AnimationClip::Track& keys, double frame);
}  // namespace rmb

#endif  // RMB_RIG_ANIMATION_CLIP_H_
