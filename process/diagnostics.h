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

#ifndef RMB_PROCESS_DIAGNOSTICS_H_
#define RMB_PROCESS_DIAGNOSTICS_H_

#include <string>
#include <vector>
#include "common/disk_util.h"
#include "process/math.h"

namespace rmb {
// Root motion decomposition of one sample.
struct DiagnosticRow {
  // Seconds.
  double time;
  GfVec3d root_translation;
  // Degrees about the up axis.
  double root_yaw;
  // Hip transform relative to the root bone.
  GfVec3d hip_translation;
  // Degrees (X, Y, Z).
  GfVec3d hip_rotation;
};

// Write-only table of diagnostic rows.
class DiagnosticSink {
 public:
  virtual ~DiagnosticSink() {}
  virtual void Add(const DiagnosticRow& row) = 0;
};

class VectorDiagnosticSink : public DiagnosticSink {
 public:
  void Add(const DiagnosticRow& row) override { rows_.push_back(row); }
  const std::vector<DiagnosticRow>& GetRows() const { return rows_; }

 private:
  std::vector<DiagnosticRow> rows_;
};

// Writes rows as comma-separated values, one line per sample.
class CsvDiagnosticSink : public DiagnosticSink {
 public:
  // Creates the file and writes the column header.
  bool Open(const std::string& path);
  bool IsOpen() const { return file_.fp != nullptr; }
  void Add(const DiagnosticRow& row) override;

 private:
  DiskFileSentry file_;
};
}  // namespace rmb

#endif  // RMB_PROCESS_DIAGNOSTICS_H_
