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

#ifndef RMB_PROCESS_HIERARCHY_GUARD_H_
#define RMB_PROCESS_HIERARCHY_GUARD_H_

#include <string>
#include "rig/skeleton.h"

namespace rmb {
size_t CountRootBones(const Skeleton& skeleton);

// Verifies the skeleton can receive a root motion bone, and returns its sole
// parentless bone.
// * Throws AmbiguousHierarchyError unless exactly one bone is parentless.
// * Throws AlreadyProcessedError if that bone is already named 'root_name',
//   so converting a rig twice never stacks root bones.
size_t CheckHierarchy(const Skeleton& skeleton, const std::string& root_name);
}  // namespace rmb

#endif  // RMB_PROCESS_HIERARCHY_GUARD_H_
