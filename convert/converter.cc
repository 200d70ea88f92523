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

#include "convert/converter.h"

#include <memory>
#include <string>
#include "common/common_util.h"
#include "common/disk_util.h"
#include "convert/output_path.h"
#include "process/asset_classifier.h"
#include "process/hierarchy_guard.h"
#include "process/math.h"
#include "process/motion_bake.h"
#include "process/rest_pose.h"
#include "process/root_bone.h"

namespace rmb {
namespace {
void SetStatus(const std::string& message, StatusTag tag,
               ConvertStatus* out_status) {
  out_status->message = message;
  out_status->tag = tag;
}

void SetStatus(const Message& message, StatusTag tag,
               ConvertStatus* out_status) {
  SetStatus(message.ToString(false, false), tag, out_status);
}

// Points an image at a temporary path, restoring the original on scope exit.
class ImagePathSentry {
 public:
  ImagePathSentry(Scene* scene, size_t image_index, const std::string& path)
      : scene_(scene),
        image_index_(image_index),
        original_path_(scene->GetImage(image_index).file_path) {
    scene_->SetImagePath(image_index_, path);
  }
  ~ImagePathSentry() {
    scene_->SetImagePath(image_index_, original_path_);
  }
  ImagePathSentry(const ImagePathSentry&) = delete;
  ImagePathSentry& operator=(const ImagePathSentry&) = delete;

 private:
  Scene* scene_;
  size_t image_index_;
  std::string original_path_;
};
}  // namespace

const char* GetStatusTagName(StatusTag tag) {
  static const char* const kNames[] = {
      "default",  // kStatusDefault
      "warning",  // kStatusWarning
      "done",     // kStatusDone
  };
  static_assert(RMB_ARRAY_SIZE(kNames) == kStatusTagCount, "");
  return tag < kStatusTagCount ? kNames[tag] : "?";
}

Converter::Converter(const ConvertSettings& settings, Scene* scene,
                     InterchangeCodec* codec, Logger* logger)
    : stage_(kStageBegin) {
  cc_.Reset(settings, scene, codec, logger);
}

void Converter::SetSource(const std::string& path) {
  RMB_ASSERT_LOGIC(stage_ == kStageBegin);
  cc_.src_path = path;
}

bool Converter::Next(ConvertStatus* out_status) {
  while (stage_ != kStageCount) {
    const Stage stage = stage_;
    // A stage that throws ends the conversion.
    stage_ = kStageCount;
    SetStatus(std::string(), kStatusDefault, out_status);
    const bool has_status = RunStage(stage, out_status);
    stage_ = static_cast<Stage>(stage + 1);
    if (has_status) {
      return true;
    }
  }
  return false;
}

void Converter::RunToCompletion(
    const std::function<void(const ConvertStatus&)>& on_status) {
  ConvertStatus status;
  while (Next(&status)) {
    if (on_status) {
      on_status(status);
    }
  }
}

bool Converter::RunStage(Stage stage, ConvertStatus* out_status) {
  Scene* const scene = cc_.scene;
  const ConvertSettings& settings = cc_.settings;
  switch (stage) {
    case kStageBegin:
      SetStatus("Starting conversion.", kStatusDefault, out_status);
      return true;

    case kStageImport:
      return Import(out_status);

    case kStageFindArmature:
      cc_.armature = FindArmature(*scene, settings.armature_name);
      if (cc_.armature == kNoObject) {
        ThrowError<MissingArmatureError, RMB_ERROR_MISSING_ARMATURE>(
            settings.armature_name.c_str());
      }
      SetStatus("Found armature '" + scene->GetObjectName(cc_.armature) + "'.",
                kStatusDefault, out_status);
      return true;

    case kStageGuard: {
      const Skeleton& skeleton = scene->GetSkeleton(cc_.armature);
      const size_t root = CheckHierarchy(skeleton, settings.root_bone_name);
      SetStatus("Checked hierarchy. Top bone is '" +
                    skeleton.GetBone(root).name + "'.",
                kStatusDefault, out_status);
      return true;
    }

    case kStageClassify:
      cc_.asset_type = ClassifyAsset(*scene, cc_.armature);
      SetStatus(std::string("Checked Asset Type. isActor=") +
                    (cc_.asset_type == kAssetActor ? "True" : "False"),
                kStatusDefault, out_status);
      return true;

    case kStageResolvePath:
      ResolvePath(out_status);
      return true;

    case kStageSynthesize: {
      const double scale =
          GetUniformScale(scene->GetObjectTransform(cc_.armature));
      SynthesizeRootBone(scene, cc_.armature, settings.hip_bone_name,
                         settings.root_bone_name, scale);
      SetStatus("Added root bone '" + settings.root_bone_name + "'.",
                kStatusDefault, out_status);
      return true;
    }

    case kStageRig:
      if (cc_.asset_type == kAssetActor) {
        NormalizeRestPose(scene, cc_.armature);
        SetStatus("Normalized rest pose.", kStatusDefault, out_status);
      } else {
        BakeMotion();
        SetStatus("Baked root motion.", kStatusDefault, out_status);
      }
      return true;

    case kStageExport: {
      if (cc_.output_path.empty()) {
        SetStatus("Skipped export.", kStatusWarning, out_status);
        return true;
      }
      ExportOptions options;
      options.forward_axis = kExportForwardAxis;
      options.up_axis = kExportUpAxis;
      options.path_mode = kPathModeCopy;
      if (!cc_.codec->Export(*scene, cc_.output_path, options, cc_.logger)) {
        ThrowError<ExportError, RMB_ERROR_EXPORT>(cc_.output_path.c_str());
      }
      SetStatus("Exported \"" + cc_.output_path + "\".", kStatusDefault,
                out_status);
      return true;
    }

    case kStageTextures:
      return ExtractTextures(out_status);

    case kStageComplete:
      // Close diagnostics so the table is complete once the caller sees done.
      cc_.diagnostics.reset();
      SetStatus("Completed Asset Conversion.", kStatusDone, out_status);
      return true;

    default:
      RMB_ASSERT_LOGIC(false);
      return false;
  }
}

bool Converter::Import(ConvertStatus* out_status) {
  if (cc_.src_path.empty()) {
    return false;
  }
  Scene* const scene = cc_.scene;
  const size_t animation_count = scene->ClearAnimations();
  if (animation_count != 0) {
    Log<RMB_INFO_CLEARED_ANIMATIONS>(cc_.logger, "", animation_count);
  }
  const size_t image_count = scene->ClearImages();
  if (image_count != 0) {
    Log<RMB_INFO_CLEARED_IMAGES>(cc_.logger, "", image_count);
  }
  if (!cc_.codec->Import(cc_.src_path, scene, cc_.logger)) {
    ThrowError<ImportError, RMB_ERROR_IMPORT>(cc_.src_path.c_str());
  }
  scene->SetSourcePath(cc_.src_path);
  SetStatus("Imported \"" + cc_.src_path + "\".", kStatusDefault, out_status);
  return true;
}

void Converter::ResolvePath(ConvertStatus* out_status) {
  const ConvertSettings& settings = cc_.settings;
  if (TrimWhitespace(settings.file_name).empty()) {
    Log<RMB_WARN_NO_FILE_NAME>(cc_.logger, "");
    SetStatus(GetMessage<RMB_WARN_NO_FILE_NAME>(""), kStatusWarning,
              out_status);
    return;
  }
  cc_.output_path = ResolveOutputPath(
      settings.file_name, settings.output_dir, cc_.asset_type,
      settings.append_actor_or_motion_path, cc_.codec->GetExtension(),
      cc_.logger);
  if (cc_.output_path.empty()) {
    const std::string dir =
        GetExportDirectory(settings.output_dir, cc_.asset_type,
                           settings.append_actor_or_motion_path);
    SetStatus(GetMessage<RMB_WARN_CREATE_DIRECTORY>("", dir.c_str()),
              kStatusWarning, out_status);
    return;
  }
  cc_.output_dir = GetFileDirectory(cc_.output_path);

  if (settings.dump_diagnostics && cc_.asset_type == kAssetMotion) {
    const std::string csv_path = JoinPath(
        cc_.output_dir, GetFileStem(cc_.output_path) + kDiagnosticsSuffix);
    std::unique_ptr<CsvDiagnosticSink> sink(new CsvDiagnosticSink());
    if (sink->Open(csv_path)) {
      cc_.diagnostics = std::move(sink);
    } else {
      Log<RMB_WARN_DIAGNOSTICS_OPEN>(cc_.logger, "", csv_path.c_str());
    }
  }
  SetStatus("Processed output path strings: \"" + cc_.output_path + "\".",
            kStatusDefault, out_status);
}

void Converter::BakeMotion() {
  Scene* const scene = cc_.scene;
  const ConvertSettings& settings = cc_.settings;
  BakeParams params;
  params.hip_name = settings.hip_bone_name;
  params.root_name = settings.root_bone_name;
  params.sample_rate = settings.animation_sample_rate;
  params.source_frame_rate = scene->GetFrameRate();
  scene->GetFrameRange(&params.frame_start, &params.frame_end);

  // An armature without keys bakes its rest pose over the frame range.
  const AnimationClip rest_clip;
  const AnimationClip* const source = scene->GetAnimation(cc_.armature);
  AnimationClip baked;
  BakeRootMotion(params, scene->GetSkeleton(cc_.armature),
                 source ? *source : rest_clip, cc_.diagnostics.get(), &baked);
  CommitClip(scene, cc_.armature, baked);
}

bool Converter::ExtractTextures(ConvertStatus* out_status) {
  if (!cc_.settings.extract_textures || cc_.output_path.empty()) {
    return false;
  }
  Scene* const scene = cc_.scene;
  std::string textures_dir = JoinPath(cc_.output_dir, kTexturesDirName);
  if (!DiskCreateDirectory(textures_dir)) {
    Log<RMB_WARN_TEXTURES_DIRECTORY>(cc_.logger, "", textures_dir.c_str());
    textures_dir = cc_.output_dir;
  }
  const std::string prefix = GetFileStem(cc_.output_path);

  size_t saved_count = 0;
  size_t failed_count = 0;
  const size_t image_count = scene->GetImageCount();
  for (size_t image_index = 0; image_index != image_count; ++image_index) {
    const ImageResource& image = scene->GetImage(image_index);
    if (!image.HasData()) {
      continue;
    }
    std::string name = GetFileName(
        image.file_path.empty() ? image.name : image.file_path);
    if (name.empty()) {
      name = "image" + std::to_string(image_index);
    }
    const std::string path = JoinPath(textures_dir, prefix + "_" + name);
    const ImagePathSentry image_path_sentry(scene, image_index, path);
    if (scene->SaveImage(image_index)) {
      ++saved_count;
    } else {
      Log<RMB_WARN_IO_WRITE_IMAGE>(cc_.logger, "", path.c_str());
      ++failed_count;
    }
  }

  SetStatus("Extracted " + std::to_string(saved_count) + " texture(s) to \"" +
                textures_dir + "\".",
            failed_count == 0 ? kStatusDefault : kStatusWarning, out_status);
  return true;
}
}  // namespace rmb
