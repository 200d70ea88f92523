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

#ifndef RMB_USD_USD_UTIL_H_
#define RMB_USD_USD_UTIL_H_

#include <string>
#include "common/common.h"
#include "common/logging.h"
#include "pxr/base/tf/diagnosticMgr.h"

namespace rmb {
// Redirects USD messages to our own logging system in a local function scope.
class UsdMessageHandler : public PXR_NS::TfDiagnosticMgr::Delegate {
 public:
  explicit UsdMessageHandler(Logger* logger);
  ~UsdMessageHandler() override;

  void IssueError(const PXR_NS::TfError& err) override;
  void IssueFatalError(const PXR_NS::TfCallContext& context,
                       const std::string& msg) override;
  void IssueStatus(const PXR_NS::TfStatus& status) override;
  void IssueWarning(const PXR_NS::TfWarning& warning) override;

 private:
  Logger* logger_ = nullptr;
};

// Registers USD plugins at 'path' (which may contain wildcards), or finds the
// installed plugins if 'path' is empty. Returns false, logging which schema
// plugins are missing, if the codec can't run.
bool RegisterPlugins(const std::string& path, Logger* logger);
}  // namespace rmb

#endif  // RMB_USD_USD_UTIL_H_
