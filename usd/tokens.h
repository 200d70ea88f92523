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

#ifndef RMB_USD_TOKENS_H_
#define RMB_USD_TOKENS_H_

#include "common/common.h"
#include "pxr/base/tf/token.h"

namespace rmb {
using PXR_NS::TfToken;

extern const TfToken kTokEmpty;

extern const TfToken kTokAnimation;  // "Animation"
extern const TfToken kTokFile;  // "file"
extern const TfToken kTokSkeleton;  // "Skeleton"
extern const TfToken kTokUvTexture;  // "UsdUVTexture"

// Custom layer data keys.
extern const TfToken kTokForwardAxis;  // "forwardAxis"
}  // namespace rmb

#endif  // RMB_USD_TOKENS_H_
