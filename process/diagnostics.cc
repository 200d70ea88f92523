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

#include "process/diagnostics.h"

namespace rmb {
bool CsvDiagnosticSink::Open(const std::string& path) {
  if (!file_.Open(path.c_str(), "w")) {
    return false;
  }
  fprintf(file_.fp,
          "time,root_x,root_y,root_z,root_yaw,"
          "hip_x,hip_y,hip_z,hip_rot_x,hip_rot_y,hip_rot_z\n");
  return true;
}

void CsvDiagnosticSink::Add(const DiagnosticRow& row) {
  if (!file_.fp) {
    return;
  }
  fprintf(file_.fp, "%.6f,%.6f,%.6f,%.6f,%.4f,%.6f,%.6f,%.6f,%.4f,%.4f,%.4f\n",
          row.time,
          row.root_translation[0], row.root_translation[1],
          row.root_translation[2], row.root_yaw,
          row.hip_translation[0], row.hip_translation[1],
          row.hip_translation[2],
          row.hip_rotation[0], row.hip_rotation[1], row.hip_rotation[2]);
}
}  // namespace rmb
