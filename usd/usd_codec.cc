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

#include "usd/usd_codec.h"

#include <algorithm>
#include <map>
#include <vector>
#include "common/common_util.h"
#include "common/disk_util.h"
#include "common/logging.h"
#include "common/platform.h"
#include "process/math.h"
#include "usd/tokens.h"
#include "usd/usd_util.h"
#include "pxr/base/tf/stringUtils.h"
#include "pxr/base/vt/array.h"
#include "pxr/base/vt/dictionary.h"
#include "pxr/base/vt/types.h"
#include "pxr/usd/sdf/assetPath.h"
#include "pxr/usd/sdf/layer.h"
#include "pxr/usd/sdf/path.h"
#include "pxr/usd/usd/attribute.h"
#include "pxr/usd/usd/prim.h"
#include "pxr/usd/usd/primRange.h"
#include "pxr/usd/usd/stage.h"
#include "pxr/usd/usdGeom/mesh.h"
#include "pxr/usd/usdGeom/metrics.h"
#include "pxr/usd/usdGeom/tokens.h"
#include "pxr/usd/usdGeom/xformCache.h"
#include "pxr/usd/usdGeom/xformable.h"
#include "pxr/usd/usdShade/input.h"
#include "pxr/usd/usdShade/shader.h"
#include "pxr/usd/usdSkel/animation.h"
#include "pxr/usd/usdSkel/bindingAPI.h"
#include "pxr/usd/usdSkel/root.h"
#include "pxr/usd/usdSkel/skeleton.h"
#include "pxr/usd/usdSkel/topology.h"

namespace rmb {
namespace {
using PXR_NS::GfMatrix4d;
using PXR_NS::GfQuatf;
using PXR_NS::GfVec3d;
using PXR_NS::GfVec3f;
using PXR_NS::GfVec3h;
using PXR_NS::SdfAssetPath;
using PXR_NS::SdfLayer;
using PXR_NS::SdfLayerHandle;
using PXR_NS::SdfLayerRefPtr;
using PXR_NS::SdfPath;
using PXR_NS::SdfPathVector;
using PXR_NS::TfMakeValidIdentifier;
using PXR_NS::UsdAttribute;
using PXR_NS::UsdGeomMesh;
using PXR_NS::UsdGeomTokens;
using PXR_NS::UsdGeomXformable;
using PXR_NS::UsdGeomXformCache;
using PXR_NS::UsdPrim;
using PXR_NS::UsdPrimRange;
using PXR_NS::UsdShadeInput;
using PXR_NS::UsdShadeShader;
using PXR_NS::UsdSkelAnimation;
using PXR_NS::UsdSkelBindingAPI;
using PXR_NS::UsdSkelRoot;
using PXR_NS::UsdSkelSkeleton;
using PXR_NS::UsdSkelTopology;
using PXR_NS::UsdStage;
using PXR_NS::UsdStageRefPtr;
using PXR_NS::UsdTimeCode;
using PXR_NS::VtDictionary;
using PXR_NS::VtIntArray;
using PXR_NS::VtMatrix4dArray;
using PXR_NS::VtQuatfArray;
using PXR_NS::VtTokenArray;
using PXR_NS::VtValue;
using PXR_NS::VtVec3fArray;
using PXR_NS::VtVec3hArray;

using MeshPrimMap = std::map<std::string, UsdPrim>;

bool IsAbsolutePath(const std::string& path) {
  return !path.empty() &&
         (IsPathSeparator(path[0]) || (path.length() > 1 && path[1] == ':'));
}

// Bone name of a joint path token ("Hips/Spine" -> "Spine").
std::string GetJointName(const TfToken& joint) {
  const std::string& path = joint.GetString();
  const size_t last_slash_pos = path.rfind('/');
  return last_slash_pos == std::string::npos
             ? path
             : path.substr(last_slash_pos + 1);
}

// Prim that scopes a skeleton's meshes and names its armature.
UsdPrim GetArmatureScope(const UsdSkelSkeleton& skel) {
  const UsdSkelRoot skel_root = UsdSkelRoot::Find(skel.GetPrim());
  return skel_root ? skel_root.GetPrim() : skel.GetPrim();
}

std::string GetArmatureName(const UsdSkelSkeleton& skel) {
  return GetArmatureScope(skel).GetName().GetString();
}

UsdSkelSkeleton FindSkeleton(const UsdStageRefPtr& stage,
                             const std::string& armature_name) {
  for (const UsdPrim& prim : stage->Traverse()) {
    if (prim.IsA<UsdSkelSkeleton>()) {
      const UsdSkelSkeleton skel(prim);
      if (GetArmatureName(skel) == armature_name) {
        return skel;
      }
    }
  }
  return UsdSkelSkeleton();
}

// Meshes under the skeleton's SkelRoot, by name. Skeletons without a SkelRoot
// don't own meshes.
MeshPrimMap GetMeshPrims(const UsdSkelSkeleton& skel) {
  MeshPrimMap meshes;
  const UsdSkelRoot skel_root = UsdSkelRoot::Find(skel.GetPrim());
  if (!skel_root) {
    return meshes;
  }
  for (const UsdPrim& prim : UsdPrimRange(skel_root.GetPrim())) {
    if (prim.IsA<UsdGeomMesh>()) {
      meshes.insert(std::make_pair(prim.GetName().GetString(), prim));
    }
  }
  return meshes;
}

std::vector<double> GetUnionTimeSamples(
    const std::vector<UsdAttribute>& attrs) {
  std::vector<double> times;
  for (const UsdAttribute& attr : attrs) {
    std::vector<double> attr_times;
    if (attr && attr.GetTimeSamples(&attr_times)) {
      times.insert(times.end(), attr_times.begin(), attr_times.end());
    }
  }
  std::sort(times.begin(), times.end());
  times.erase(std::unique(times.begin(), times.end()), times.end());
  return times;
}

bool BuildSkeleton(const UsdSkelSkeleton& skel, Skeleton* out_skeleton,
                   Logger* logger) {
  const std::string prim_path = skel.GetPath().GetString();
  VtTokenArray joints;
  skel.GetJointsAttr().Get(&joints);
  const UsdSkelTopology topology(joints);
  std::string why;
  if (!topology.Validate(&why)) {
    Log<RMB_WARN_SKELETON_TOPOLOGY>(logger, prim_path.c_str(), why.c_str());
    return false;
  }

  // Prefer local rest transforms. Bind transforms are skeleton-space, so they
  // are made parent-relative.
  const size_t joint_count = joints.size();
  VtMatrix4dArray rest_mats;
  VtMatrix4dArray bind_mats;
  skel.GetRestTransformsAttr().Get(&rest_mats);
  skel.GetBindTransformsAttr().Get(&bind_mats);
  const bool use_rest = rest_mats.size() == joint_count;
  const bool use_bind = !use_rest && bind_mats.size() == joint_count;

  Skeleton skeleton;
  std::vector<size_t> joint_to_bone(joint_count, kNoBone);
  for (size_t joint = 0; joint != joint_count; ++joint) {
    const int parent_joint = topology.GetParent(joint);
    GfMatrix4d local(1.0);
    if (use_rest) {
      local = rest_mats[joint];
    } else if (use_bind) {
      local = parent_joint < 0
                  ? bind_mats[joint]
                  : bind_mats[joint] * bind_mats[parent_joint].GetInverse();
    }
    const size_t parent =
        parent_joint < 0 ? kNoBone : joint_to_bone[parent_joint];
    const std::string name = GetJointName(joints[joint]);
    joint_to_bone[joint] =
        skeleton.AddBone(name, parent, local, Bone().tail);
    if (joint_to_bone[joint] == kNoBone) {
      const std::string duplicate = "duplicate joint name '" + name + "'";
      Log<RMB_WARN_SKELETON_TOPOLOGY>(logger, prim_path.c_str(),
                                      duplicate.c_str());
      return false;
    }
  }
  *out_skeleton = std::move(skeleton);
  return true;
}

// Reads joint samples of 'anim' into per-bone tracks. Joints that aren't in
// 'skeleton' are skipped.
bool BuildClip(const UsdSkelAnimation& anim, const Skeleton& skeleton,
               double frame_rate, double default_frame,
               AnimationClip* out_clip, Logger* logger) {
  const std::string prim_path = anim.GetPath().GetString();
  VtTokenArray joints;
  anim.GetJointsAttr().Get(&joints);
  const size_t joint_count = joints.size();

  const UsdAttribute translations_attr = anim.GetTranslationsAttr();
  const UsdAttribute rotations_attr = anim.GetRotationsAttr();
  const UsdAttribute scales_attr = anim.GetScalesAttr();
  std::vector<double> times = GetUnionTimeSamples(
      {translations_attr, rotations_attr, scales_attr});
  const bool is_static = times.empty();
  if (is_static) {
    times.push_back(default_frame);
  }

  std::vector<AnimationClip::Track> tracks(joint_count);
  for (const double t : times) {
    const UsdTimeCode time = is_static ? UsdTimeCode::Default() : UsdTimeCode(t);
    VtVec3fArray translations;
    VtQuatfArray rotations;
    VtVec3hArray scales;
    translations_attr.Get(&translations, time);
    rotations_attr.Get(&rotations, time);
    scales_attr.Get(&scales, time);
    if ((!translations.empty() && translations.size() != joint_count) ||
        (!rotations.empty() && rotations.size() != joint_count) ||
        (!scales.empty() && scales.size() != joint_count)) {
      Log<RMB_WARN_ANIMATION_JOINT_COUNT>(logger, "", prim_path.c_str());
      return false;
    }
    for (size_t joint = 0; joint != joint_count; ++joint) {
      Srt srt;
      if (!translations.empty()) {
        srt.translation = GfVec3d(translations[joint]);
      }
      if (!rotations.empty()) {
        srt.rotation = GfQuatd(rotations[joint]);
      }
      if (!scales.empty()) {
        srt.scale = GfVec3d(scales[joint]);
      }
      tracks[joint].push_back({t, ComposeSrt(srt)});
    }
  }

  AnimationClip clip(anim.GetPrim().GetName().GetString(), frame_rate);
  for (size_t joint = 0; joint != joint_count; ++joint) {
    const std::string name = GetJointName(joints[joint]);
    if (skeleton.FindBone(name) != kNoBone) {
      clip.SetTrack(name, std::move(tracks[joint]));
    }
  }
  clip.SetFrameRange(times.front(), times.back());
  *out_clip = std::move(clip);
  return true;
}

std::string GetTexturePath(const SdfAssetPath& asset,
                           const std::string& src_dir) {
  if (!asset.GetResolvedPath().empty()) {
    return asset.GetResolvedPath();
  }
  const std::string& path = asset.GetAssetPath();
  return IsAbsolutePath(path) ? path : JoinPath(src_dir, path);
}

// Returns the file input of a UsdUVTexture shader, or an invalid input for
// other prims.
UsdShadeInput GetTextureFileInput(const UsdPrim& prim) {
  if (!prim.IsA<UsdShadeShader>()) {
    return UsdShadeInput();
  }
  const UsdShadeShader shader(prim);
  TfToken id;
  if (!shader.GetIdAttr().Get(&id) || id != kTokUvTexture) {
    return UsdShadeInput();
  }
  return shader.GetInput(kTokFile);
}

void ImportImages(const UsdStageRefPtr& stage, const std::string& src_dir,
                  Scene* scene, Logger* logger) {
  for (const UsdPrim& prim : stage->Traverse()) {
    const UsdShadeInput input = GetTextureFileInput(prim);
    SdfAssetPath asset;
    if (!input || !input.Get(&asset) || asset.GetAssetPath().empty()) {
      continue;
    }
    ImageResource image;
    image.name = prim.GetName().GetString();
    image.file_path = GetTexturePath(asset, src_dir);
    if (!DiskReadBinary(image.file_path, &image.data)) {
      Log<RMB_WARN_IO_READ>(logger, "", image.file_path.c_str());
    }
    scene->AddImage(image);
  }
}

UsdStageRefPtr CreateExportStage(const std::string& src_path,
                                 const std::string& dst_path, Logger* logger) {
  SdfLayerRefPtr src_layer;
  if (!src_path.empty()) {
    src_layer = SdfLayer::FindOrOpen(src_path);
    if (!src_layer) {
      Log<RMB_ERROR_IO_READ_USD>(logger, "", src_path.c_str());
      return UsdStageRefPtr();
    }
  }

  // Reuse the layer if an earlier export in this process left it open.
  SdfLayerRefPtr layer = SdfLayer::Find(dst_path);
  if (layer) {
    layer->Clear();
  } else {
    layer = SdfLayer::CreateNew(dst_path);
  }
  if (!layer) {
    Log<RMB_ERROR_LAYER_CREATE>(logger, "", dst_path.c_str());
    return UsdStageRefPtr();
  }
  if (src_layer) {
    layer->TransferContent(src_layer);
  }
  return UsdStage::Open(layer);
}

UsdSkelSkeleton DefineSkeleton(const UsdStageRefPtr& stage,
                               const std::string& armature_name) {
  const SdfPath root_path = SdfPath::AbsoluteRootPath().AppendChild(
      TfToken(TfMakeValidIdentifier(armature_name)));
  UsdSkelRoot::Define(stage, root_path);
  return UsdSkelSkeleton::Define(stage, root_path.AppendChild(kTokSkeleton));
}

// Points mesh joint bindings at the rewritten joint paths.
void RemapMeshJoints(const UsdPrim& prim, const VtTokenArray& old_joints,
                     const VtTokenArray& new_joints,
                     const std::map<std::string, size_t>& name_to_joint) {
  const UsdSkelBindingAPI binding(prim);

  // Meshes with their own joint order only need their tokens renamed.
  const UsdAttribute joints_attr = binding.GetJointsAttr();
  VtTokenArray mesh_joints;
  if (joints_attr && joints_attr.Get(&mesh_joints)) {
    for (TfToken& joint : mesh_joints) {
      const auto found = name_to_joint.find(GetJointName(joint));
      if (found != name_to_joint.end()) {
        joint = new_joints[found->second];
      }
    }
    joints_attr.Set(mesh_joints);
    return;
  }

  // Otherwise indices refer to the skeleton's joint order, which has changed.
  const UsdAttribute indices_attr = binding.GetJointIndicesAttr();
  VtIntArray indices;
  if (!indices_attr || !indices_attr.Get(&indices)) {
    return;
  }
  std::vector<int> old_to_new(old_joints.size());
  for (size_t old_index = 0; old_index != old_joints.size(); ++old_index) {
    const auto found = name_to_joint.find(GetJointName(old_joints[old_index]));
    old_to_new[old_index] = found == name_to_joint.end()
                                ? static_cast<int>(old_index)
                                : static_cast<int>(found->second);
  }
  for (int& index : indices) {
    if (index >= 0 && static_cast<size_t>(index) < old_to_new.size()) {
      index = old_to_new[index];
    }
  }
  indices_attr.Set(indices);
}

void ExportAnimation(const UsdStageRefPtr& stage, const UsdSkelSkeleton& skel,
                     const Skeleton& skeleton, const std::vector<size_t>& order,
                     const AnimationClip& clip) {
  const UsdPrim skel_prim = skel.GetPrim();
  UsdPrim anim_prim;
  UsdSkelAnimation anim;
  if (UsdSkelBindingAPI(skel_prim).GetAnimationSource(&anim_prim)) {
    anim = UsdSkelAnimation(anim_prim);
  }
  if (!anim) {
    const SdfPath anim_path = skel_prim.GetPath().AppendChild(kTokAnimation);
    anim = UsdSkelAnimation::Define(stage, anim_path);
    UsdSkelBindingAPI::Apply(skel_prim).CreateAnimationSourceRel().SetTargets(
        SdfPathVector(1, anim_path));
  }

  // Animated joints, in skeleton order.
  VtTokenArray joints;
  std::vector<const AnimationClip::Track*> tracks;
  std::vector<double> times;
  for (const size_t bone_index : order) {
    const Bone& bone = skeleton.GetBone(bone_index);
    const AnimationClip::Track* const track = clip.FindTrack(bone.name);
    if (!track || track->empty()) {
      continue;
    }
    joints.push_back(TfToken(skeleton.GetBonePath(bone_index)));
    tracks.push_back(track);
    for (const PoseKey& key : *track) {
      times.push_back(key.time);
    }
  }
  std::sort(times.begin(), times.end());
  times.erase(std::unique(times.begin(), times.end(),
                          [](double a, double b) {
                            return NearlyEqual(a, b, kKeyTimeTol);
                          }),
              times.end());

  const UsdAttribute translations_attr = anim.CreateTranslationsAttr();
  const UsdAttribute rotations_attr = anim.CreateRotationsAttr();
  const UsdAttribute scales_attr = anim.CreateScalesAttr();
  translations_attr.Clear();
  rotations_attr.Clear();
  scales_attr.Clear();
  anim.CreateJointsAttr().Set(joints);

  const size_t joint_count = joints.size();
  for (const double t : times) {
    VtVec3fArray translations(joint_count);
    VtQuatfArray rotations(joint_count);
    VtVec3hArray scales(joint_count);
    for (size_t joint = 0; joint != joint_count; ++joint) {
      const Srt srt = DecomposeSrt(SampleTrack(*tracks[joint], t));
      translations[joint] = GfVec3f(srt.translation);
      rotations[joint] = GfQuatf(srt.rotation);
      scales[joint] = GfVec3h(srt.scale);
    }
    const UsdTimeCode time(t);
    translations_attr.Set(translations, time);
    rotations_attr.Set(rotations, time);
    scales_attr.Set(scales, time);
  }
}

void ExportArmature(const Scene& scene, ObjectId armature,
                    const UsdStageRefPtr& stage, OnceLogger* once_logger) {
  const std::string& armature_name = scene.GetObjectName(armature);
  const Skeleton& skeleton = scene.GetSkeleton(armature);
  UsdSkelSkeleton skel = FindSkeleton(stage, armature_name);
  if (!skel) {
    skel = DefineSkeleton(stage, armature_name);
  }
  const UsdPrim skel_prim = skel.GetPrim();

  VtTokenArray old_joints;
  skel.GetJointsAttr().Get(&old_joints);

  // Joints are written parents first, keyed by their path from the top bone.
  const std::vector<size_t> order = skeleton.GetTopologicalOrder();
  const size_t joint_count = order.size();
  VtTokenArray joints(joint_count);
  VtMatrix4dArray rest_mats(joint_count);
  VtMatrix4dArray bind_mats(joint_count);
  std::map<std::string, size_t> name_to_joint;
  for (size_t joint = 0; joint != joint_count; ++joint) {
    const size_t bone_index = order[joint];
    const Bone& bone = skeleton.GetBone(bone_index);
    joints[joint] = TfToken(skeleton.GetBonePath(bone_index));
    rest_mats[joint] = bone.rest;
    bind_mats[joint] = skeleton.GetRestWorld(bone_index);
    name_to_joint[bone.name] = joint;
  }
  skel.CreateJointsAttr().Set(joints);
  skel.CreateRestTransformsAttr().Set(rest_mats);
  skel.CreateBindTransformsAttr().Set(bind_mats);

  UsdGeomXformCache xform_cache;
  const GfMatrix4d armature_world = scene.GetObjectTransform(armature);
  UsdGeomXformable(skel_prim).MakeMatrixXform().Set(
      armature_world *
      xform_cache.GetParentToWorldTransform(skel_prim).GetInverse());
  xform_cache.Clear();

  const MeshPrimMap mesh_prims = GetMeshPrims(skel);
  for (const auto& entry : mesh_prims) {
    RemapMeshJoints(entry.second, old_joints, joints, name_to_joint);
  }
  for (const ObjectId child : scene.GetObjectChildren(armature)) {
    if (scene.GetObjectType(child) != kObjectMesh) {
      continue;
    }
    const std::string& mesh_name = scene.GetObjectName(child);
    const auto found = mesh_prims.find(mesh_name);
    if (found == mesh_prims.end()) {
      LogOnce<RMB_WARN_MESH_GEOMETRY_MISSING>(once_logger, " Meshes: ",
                                              mesh_name.c_str());
      continue;
    }
    const UsdPrim& mesh_prim = found->second;
    const GfMatrix4d mesh_mat = scene.GetObjectTransform(child);
    const UsdAttribute geom_bind_attr =
        UsdSkelBindingAPI(mesh_prim).GetGeomBindTransformAttr();
    if (geom_bind_attr && geom_bind_attr.HasAuthoredValue()) {
      geom_bind_attr.Set(mesh_mat);
    } else {
      UsdGeomXformable(mesh_prim).MakeMatrixXform().Set(
          mesh_mat * armature_world *
          xform_cache.GetParentToWorldTransform(mesh_prim).GetInverse());
    }
  }

  const AnimationClip* const clip = scene.GetAnimation(armature);
  if (clip) {
    ExportAnimation(stage, skel, skeleton, order, *clip);
  }
}

// Copies textures referenced by the stage next to it, and points the stage at
// the copies.
void CopyTextures(const UsdStageRefPtr& stage, const std::string& src_dir,
                  const std::string& dst_dir, Logger* logger) {
  for (const UsdPrim& prim : stage->Traverse()) {
    const UsdShadeInput input = GetTextureFileInput(prim);
    SdfAssetPath asset;
    if (!input || !input.Get(&asset) || asset.GetAssetPath().empty()) {
      continue;
    }
    const std::string& asset_path = asset.GetAssetPath();
    const std::string src_path =
        IsAbsolutePath(asset_path) ? asset_path : JoinPath(src_dir, asset_path);
    const std::string name = GetFileName(asset_path);
    const std::string dst_path = JoinPath(dst_dir, name);
    const std::string src_abs = GetAbsolutePath(src_path.c_str());
    if (src_abs.empty()) {
      Log<RMB_WARN_IO_COPY_TEXTURE>(logger, "", src_path.c_str());
      continue;
    }
    if (src_abs != GetAbsolutePath(dst_path.c_str()) &&
        !DiskCopyFile(src_path, dst_path)) {
      Log<RMB_WARN_IO_COPY_TEXTURE>(logger, "", src_path.c_str());
      continue;
    }
    input.Set(SdfAssetPath(name));
  }
}
}  // namespace

bool UsdCodec::Import(const std::string& path, Scene* scene, Logger* logger) {
  UsdMessageHandler usd_message_handler(logger);
  const UsdStageRefPtr stage = UsdStage::Open(path);
  if (!stage) {
    Log<RMB_ERROR_IO_READ_USD>(logger, "", path.c_str());
    return false;
  }

  const double frame_rate = stage->GetTimeCodesPerSecond();
  const bool has_range = stage->HasAuthoredTimeCodeRange();
  double frame_start = stage->GetStartTimeCode();
  double frame_end = stage->GetEndTimeCode();
  bool has_clip_range = false;
  double clip_start = 0.0;
  double clip_end = 0.0;

  UsdGeomXformCache xform_cache;
  for (const UsdPrim& prim : stage->Traverse()) {
    if (!prim.IsA<UsdSkelSkeleton>()) {
      continue;
    }
    const UsdSkelSkeleton skel(prim);
    Skeleton skeleton;
    if (!BuildSkeleton(skel, &skeleton, logger)) {
      continue;
    }
    const GfMatrix4d skel_world = xform_cache.GetLocalToWorldTransform(prim);
    const ObjectId armature = scene->AddObject(
        GetArmatureName(skel), kObjectArmature, kNoObject, skel_world);
    scene->SetSkeleton(armature, skeleton);

    UsdPrim anim_prim;
    if (UsdSkelBindingAPI(prim).GetAnimationSource(&anim_prim)) {
      const UsdSkelAnimation anim(anim_prim);
      AnimationClip clip;
      if (anim &&
          BuildClip(anim, skeleton, frame_rate, frame_start, &clip, logger)) {
        clip_start = has_clip_range
                         ? std::min(clip_start, clip.GetStartFrame())
                         : clip.GetStartFrame();
        clip_end = has_clip_range ? std::max(clip_end, clip.GetEndFrame())
                                  : clip.GetEndFrame();
        has_clip_range = true;
        scene->SetAnimation(armature, clip);
      }
    }

    // Skinned meshes are placed by their bind transform. Others keep their
    // placement relative to the skeleton.
    const GfMatrix4d skel_world_inverse = skel_world.GetInverse();
    for (const auto& entry : GetMeshPrims(skel)) {
      const UsdPrim& mesh_prim = entry.second;
      GfMatrix4d mesh_mat(1.0);
      const UsdAttribute geom_bind_attr =
          UsdSkelBindingAPI(mesh_prim).GetGeomBindTransformAttr();
      if (!geom_bind_attr || !geom_bind_attr.HasAuthoredValue() ||
          !geom_bind_attr.Get(&mesh_mat)) {
        mesh_mat = xform_cache.GetLocalToWorldTransform(mesh_prim) *
                   skel_world_inverse;
      }
      scene->AddObject(entry.first, kObjectMesh, armature, mesh_mat);
    }
  }

  if (!has_range && has_clip_range) {
    frame_start = clip_start;
    frame_end = clip_end;
  }
  scene->SetFrameRate(frame_rate);
  scene->SetFrameRange(frame_start, frame_end);

  ImportImages(stage, GetFileDirectory(path), scene, logger);
  return true;
}

bool UsdCodec::Export(const Scene& scene, const std::string& path,
                      const ExportOptions& options, Logger* logger) {
  UsdMessageHandler usd_message_handler(logger);
  const std::string& src_path = scene.GetSourcePath();
  const UsdStageRefPtr stage = CreateExportStage(src_path, path, logger);
  if (!stage) {
    return false;
  }

  // USD only supports Y-up and Z-up stages.
  UsdGeomSetStageUpAxis(
      stage, options.up_axis == kAxisY ? UsdGeomTokens->y : UsdGeomTokens->z);
  const SdfLayerHandle root_layer = stage->GetRootLayer();
  VtDictionary layer_data = root_layer->GetCustomLayerData();
  layer_data[kTokForwardAxis.GetString()] =
      VtValue(std::string(GetAxisName(options.forward_axis)));
  root_layer->SetCustomLayerData(layer_data);

  const double frame_rate = scene.GetFrameRate();
  double frame_start, frame_end;
  scene.GetFrameRange(&frame_start, &frame_end);
  stage->SetTimeCodesPerSecond(frame_rate);
  stage->SetFramesPerSecond(frame_rate);
  stage->SetStartTimeCode(frame_start);
  stage->SetEndTimeCode(frame_end);

  OnceLogger once_logger;
  once_logger.Reset(logger);
  for (const ObjectId id : scene.GetObjects()) {
    if (scene.GetObjectType(id) == kObjectArmature) {
      ExportArmature(scene, id, stage, &once_logger);
    }
  }
  once_logger.Flush();

  if (options.path_mode == kPathModeCopy && !src_path.empty()) {
    CopyTextures(stage, GetFileDirectory(src_path), GetFileDirectory(path),
                 logger);
  }

  if (!root_layer->Save()) {
    Log<RMB_ERROR_IO_WRITE_USD>(logger, "", path.c_str());
    return false;
  }
  return true;
}
}  // namespace rmb
