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

#include "process/hierarchy_guard.h"

#include "common/logging.h"

namespace rmb {
size_t CountRootBones(const Skeleton& skeleton) {
  size_t count = 0;
  for (const Bone& bone : skeleton.GetBones()) {
    if (bone.parent == kNoBone) {
      ++count;
    }
  }
  return count;
}

size_t CheckHierarchy(const Skeleton& skeleton, const std::string& root_name) {
  const std::vector<size_t> roots = skeleton.GetRootBones();
  if (roots.size() != 1) {
    ThrowError<AmbiguousHierarchyError, RMB_ERROR_AMBIGUOUS_HIERARCHY>(
        roots.size());
  }
  const size_t root = roots[0];
  if (skeleton.GetBone(root).name == root_name) {
    ThrowError<AlreadyProcessedError, RMB_ERROR_ALREADY_PROCESSED>(
        root_name.c_str());
  }
  return root;
}
}  // namespace rmb
