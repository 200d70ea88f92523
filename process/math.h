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

#ifndef RMB_PROCESS_MATH_H_
#define RMB_PROCESS_MATH_H_

#include <algorithm>
#include <cmath>
#include "common/common.h"
#include "common/config.h"

namespace rmb {
using PXR_NS::GfMatrix3d;
using PXR_NS::GfMatrix4d;
using PXR_NS::GfQuatd;
using PXR_NS::GfRotation;
using PXR_NS::GfVec2d;
using PXR_NS::GfVec3d;

// Euler angles in radians: yaw (Z), pitch (Y), roll (X).
GfVec3d QuatToEuler(const GfQuatd& q);

template <typename T>
inline T AngleMod(T a) {
  const T f = std::floor(a * Constants<T>::kRecipTwoPi + static_cast<T>(0.5));
  return a - f * Constants<T>::kTwoPi;
}

// Returns the angle equivalent to 'a' that's nearest to 'reference'.
template <typename T>
inline T AngleUnwrap(T a, T reference) {
  return reference + AngleMod(a - reference);
}

template <typename Vec>
inline Vec RadToDeg(const Vec& rad) {
  using Scalar = typename Vec::ScalarType;
  return rad * Constants<Scalar>::kRadToDeg;
}

template <typename T, typename S>
inline T Lerp(T a, T b, S s) {
  return a * (1 - s) + b * s;
}

template <typename T>
inline bool NearlyEqual(T a, T b, T tol) {
  return std::abs(a - b) <= tol;
}

inline bool NearlyEqual(const GfVec3d& a, const GfVec3d& b, double tol) {
  return NearlyEqual(a[0], b[0], tol) &&
         NearlyEqual(a[1], b[1], tol) &&
         NearlyEqual(a[2], b[2], tol);
}

template <typename T>
inline bool ArraysNearlyEqual(const T* a, const T* b, size_t count, T tol) {
  for (size_t i = 0; i != count; ++i) {
    if (!NearlyEqual(a[i], b[i], tol)) {
      return false;
    }
  }
  return true;
}

inline bool NearlyEqual(const GfMatrix4d& a, const GfMatrix4d& b, double tol) {
  return ArraysNearlyEqual(a.GetArray(), b.GetArray(), 16, tol);
}

struct Srt {
  GfVec3d scale = GfVec3d(1.0);
  GfQuatd rotation = GfQuatd(1.0);
  GfVec3d translation = GfVec3d(0.0);
};

// Splits an affine transform into scale, rotation and translation. Shear is
// discarded.
Srt DecomposeSrt(const GfMatrix4d& mat);

// Returns scale*rotate*translate matrix (USD's row-vector ordering).
GfMatrix4d ComposeSrt(const Srt& srt);

// Interpolates two transforms component-wise: translation and scale linearly,
// rotation along the shortest arc.
GfMatrix4d BlendTransforms(const GfMatrix4d& a, const GfMatrix4d& b, double s);

// Factors an object transform into O = scale * rotation * translation.
// Returns false if the matrix is singular, in which case the outputs are
// identity except for translation.
bool FactorTransform(const GfMatrix4d& mat, GfMatrix4d* out_scale,
                     GfMatrix4d* out_rotation, GfMatrix4d* out_translation);

// Length of the transformed X axis, used as the object's uniform scale.
inline double GetUniformScale(const GfMatrix4d& mat) {
  return mat.GetRow3(0).GetLength();
}

// Signed angle about the up axis (+Z) from 'from' to 'to', both projected onto
// the ground plane. Returns false if either projection is degenerate.
bool GetHeadingAngle(const GfVec3d& from, const GfVec3d& to,
                     double* out_radians);

// Rotation about the up axis (+Z), followed by a translation.
GfMatrix4d MakeHeadingTransform(double radians, const GfVec3d& translation);
}  // namespace rmb

#endif  // RMB_PROCESS_MATH_H_
