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

#ifndef RMB_COMMON_COMMON_H_
#define RMB_COMMON_COMMON_H_

#include <stddef.h>
#include <stdint.h>
#include "common/platform.h"

// Disable warnings originating in the USD headers.
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4244)  // Conversion from 'double' to 'float'.
#pragma warning(disable : 4305)  // Truncation from 'double' to 'float'.
#endif  // _MSC_VER
#include "pxr/base/gf/matrix3d.h"
#include "pxr/base/gf/matrix4d.h"
#include "pxr/base/gf/quatd.h"
#include "pxr/base/gf/quatf.h"
#include "pxr/base/gf/rotation.h"
#include "pxr/base/gf/vec2d.h"
#include "pxr/base/gf/vec3d.h"
#include "pxr/base/gf/vec3f.h"
#include "pxr/base/gf/vec3h.h"
#ifdef _MSC_VER
#pragma warning(pop)
#endif  // _MSC_VER

// Enable asserts.
// * These guard against logic bugs in rig mutation, so they're enabled in all
//   builds.
#define RMB_ASSERTS 1

#if _MSC_VER
#define RMB_BREAK_ON_ASSERT (1 && RMB_ASSERTS)
#else  // _MSC_VER
#define RMB_BREAK_ON_ASSERT 0
#endif  // _MSC_VER

namespace rmb {
// NOLINTNEXTLINE: Disable warning about old-style cast (it's not a cast!)
template <class T, size_t LEN> char(&ArraySizeHelper(T(&)[LEN]))[LEN];
#define RMB_ARRAY_SIZE(array) (sizeof(rmb::ArraySizeHelper(array)))
}  // namespace rmb

#endif  // RMB_COMMON_COMMON_H_
