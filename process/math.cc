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

#include "process/math.h"

#include "common/logging.h"

namespace rmb {
GfVec3d QuatToEuler(const GfQuatd& q) {
  const double qw = q.GetReal();
  const double qx = q.GetImaginary()[0];
  const double qy = q.GetImaginary()[1];
  const double qz = q.GetImaginary()[2];

  // x (x-axis rotation)
  const double sx_cy = 2 * (qw * qx + qy * qz);
  const double cx_cy = 1 - 2 * (qx * qx + qy * qy);
  const double x = std::atan2(sx_cy, cx_cy);

  // y (y-axis rotation)
  const double sy = 2 * (qw * qy - qz * qx);
  const double y = std::abs(sy) < 1.0 ?
      std::asin(sy) : std::copysign(Constants<double>::kHalfPi, sy);

  // z (z-axis rotation)
  const double sz_cy = 2 * (qw * qz + qx * qy);
  const double cz_cy = 1 - 2 * (qy * qy + qz * qz);
  const double z = std::atan2(sz_cy, cz_cy);

  return GfVec3d(x, y, z);
}

Srt DecomposeSrt(const GfMatrix4d& mat) {
  Srt srt;
  GfMatrix4d scale_orient_mat, rot_mat, persp_mat;
  GfVec3d scale, translation;
  if (!mat.Factor(
          &scale_orient_mat, &scale, &rot_mat, &translation, &persp_mat)) {
    srt.translation = mat.ExtractTranslation();
    return srt;
  }
  RMB_VERIFY(rot_mat.Orthonormalize());
  srt.scale = scale;
  srt.rotation = rot_mat.ExtractRotation().GetQuat();
  srt.translation = translation;
  return srt;
}

GfMatrix4d ComposeSrt(const Srt& srt) {
  const GfMatrix3d m(srt.rotation);
  const GfVec3d& s = srt.scale;
  const GfVec3d& t = srt.translation;
  return GfMatrix4d(
    m[0][0] * s[0], m[0][1] * s[0], m[0][2] * s[0], 0.0,
    m[1][0] * s[1], m[1][1] * s[1], m[1][2] * s[1], 0.0,
    m[2][0] * s[2], m[2][1] * s[2], m[2][2] * s[2], 0.0,
    t[0], t[1], t[2], 1.0);
}

GfMatrix4d BlendTransforms(const GfMatrix4d& a, const GfMatrix4d& b, double s) {
  if (s <= 0.0) {
    return a;
  }
  if (s >= 1.0) {
    return b;
  }
  const Srt srt_a = DecomposeSrt(a);
  const Srt srt_b = DecomposeSrt(b);
  Srt srt;
  srt.scale = Lerp(srt_a.scale, srt_b.scale, s);
  srt.rotation = GfSlerp(srt_a.rotation, srt_b.rotation, s);
  srt.translation = Lerp(srt_a.translation, srt_b.translation, s);
  return ComposeSrt(srt);
}

bool FactorTransform(const GfMatrix4d& mat, GfMatrix4d* out_scale,
                     GfMatrix4d* out_rotation, GfMatrix4d* out_translation) {
  out_scale->SetIdentity();
  out_rotation->SetIdentity();
  out_translation->SetTranslate(mat.ExtractTranslation());

  GfMatrix4d scale_orient_mat, rot_mat, persp_mat;
  GfVec3d scale, translation;
  if (!mat.Factor(
          &scale_orient_mat, &scale, &rot_mat, &translation, &persp_mat)) {
    return false;
  }
  RMB_VERIFY(rot_mat.Orthonormalize());

  // Factor() produces M = U * S * U^T * R * T, where U orients the scale axes.
  GfMatrix4d scale_mat;
  scale_mat.SetScale(scale);
  *out_scale = scale_orient_mat * scale_mat * scale_orient_mat.GetTranspose();
  *out_rotation = rot_mat;
  out_rotation->SetTranslateOnly(GfVec3d(0.0));
  return true;
}

bool GetHeadingAngle(const GfVec3d& from, const GfVec3d& to,
                     double* out_radians) {
  const GfVec2d a(from[0], from[1]);
  const GfVec2d b(to[0], to[1]);
  if (a.GetLengthSq() < kHeadingLengthSqMin ||
      b.GetLengthSq() < kHeadingLengthSqMin) {
    return false;
  }
  const double cross = a[0] * b[1] - a[1] * b[0];
  const double dot = a[0] * b[0] + a[1] * b[1];
  *out_radians = std::atan2(cross, dot);
  return true;
}

GfMatrix4d MakeHeadingTransform(double radians, const GfVec3d& translation) {
  GfMatrix4d mat(1.0);
  mat.SetRotate(GfRotation(GetAxisVector(kUpAxis),
                           radians * Constants<double>::kRadToDeg));
  mat.SetTranslateOnly(translation);
  return mat;
}
}  // namespace rmb
