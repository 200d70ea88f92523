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

#ifndef RMB_USD_USD_CODEC_H_
#define RMB_USD_USD_CODEC_H_

#include <string>
#include "rig/codec.h"

namespace rmb {
// Reads and writes rigs as UsdSkel stages.
// * Each UsdSkelSkeleton becomes an armature named after its SkelRoot (or
//   itself, if it has none). Meshes under the SkelRoot become its children.
// * Data the scene doesn't model, such as mesh geometry and materials, is
//   carried through from the scene's source layer on export.
class UsdCodec : public InterchangeCodec {
 public:
  // 'extension' selects the file format written: usda, usdc or usd.
  explicit UsdCodec(const std::string& extension = "usda")
      : extension_(extension) {}

  const char* GetExtension() const override { return extension_.c_str(); }
  bool Import(const std::string& path, Scene* scene, Logger* logger) override;
  bool Export(const Scene& scene, const std::string& path,
              const ExportOptions& options, Logger* logger) override;

 private:
  std::string extension_;
};
}  // namespace rmb

#endif  // RMB_USD_USD_CODEC_H_
