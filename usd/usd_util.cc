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

#include "usd/usd_util.h"

#include "common/common_util.h"
#include "common/platform.h"
#include "pxr/base/plug/plugin.h"
#include "pxr/base/plug/registry.h"
#include "pxr/base/tf/diagnosticBase.h"

namespace rmb {
namespace {
using PXR_NS::PlugRegistry;
using PXR_NS::TfCallContext;
using PXR_NS::TfDiagnosticBase;
using PXR_NS::TfDiagnosticMgr;
using PXR_NS::TfError;
using PXR_NS::TfStatus;
using PXR_NS::TfWarning;

// Schema plugins the codec reads and writes.
const char* const kRequiredPlugins[] = {
    "usd", "usdGeom", "usdShade", "usdSkel",
};

// Plugin info files relative to the working directory, in search order.
const char* const kPluginInfoCandidates[] = {
    "usd/plugInfo.json",
    "lib/usd/plugInfo.json",
    "plugin/usd/plugInfo.json",
};

std::string FindDefaultPluginPath() {
  for (const char* const candidate : kPluginInfoCandidates) {
    const std::string dir = GetFileDirectory(GetAbsolutePath(candidate));
    if (!dir.empty()) {
      return dir + "/*";
    }
  }
  return std::string();
}

// Returns the required plugins that aren't registered, space-separated.
std::string GetMissingPlugins() {
  const PlugRegistry& registry = PlugRegistry::GetInstance();
  std::string missing;
  for (const char* const name : kRequiredPlugins) {
    if (!registry.GetPluginWithName(name)) {
      missing += missing.empty() ? name : std::string(" ") + name;
    }
  }
  return missing;
}

template <What kWhat>
void LogDiagnostic(Logger* logger, const TfDiagnosticBase& diagnostic) {
  Log<kWhat>(logger, "", diagnostic.GetCommentary().c_str(),
             diagnostic.GetContext().GetFunction());
}
}  // namespace

UsdMessageHandler::UsdMessageHandler(Logger* logger) : logger_(logger) {
  TfDiagnosticMgr& diagnostics = TfDiagnosticMgr::GetInstance();
  diagnostics.SetQuiet(true);
  diagnostics.AddDelegate(this);
}

UsdMessageHandler::~UsdMessageHandler() {
  TfDiagnosticMgr& diagnostics = TfDiagnosticMgr::GetInstance();
  diagnostics.SetQuiet(false);
  diagnostics.RemoveDelegate(this);
}

void UsdMessageHandler::IssueError(const TfError& err) {
  LogDiagnostic<RMB_ERROR_USD>(logger_, err);
}

void UsdMessageHandler::IssueFatalError(const TfCallContext& context,
                                        const std::string& msg) {
  Log<RMB_ERROR_USD_FATAL>(logger_, "", msg.c_str(), context.GetFunction());
}

void UsdMessageHandler::IssueStatus(const TfStatus& status) {
  LogDiagnostic<RMB_INFO_USD>(logger_, status);
}

void UsdMessageHandler::IssueWarning(const TfWarning& warning) {
  LogDiagnostic<RMB_WARN_USD>(logger_, warning);
}

bool RegisterPlugins(const std::string& path, Logger* logger) {
  UsdMessageHandler usd_message_handler(logger);
  PlugRegistry& registry = PlugRegistry::GetInstance();

  // An explicit path is always registered. Otherwise the plugins installed
  // with the USD libraries are used, falling back to a local plugin tree.
  std::string search_path = path;
  if (search_path.empty() && !GetMissingPlugins().empty()) {
    search_path = FindDefaultPluginPath();
  }
  if (!search_path.empty()) {
    registry.RegisterPlugins(search_path);
  }

  const std::string missing = GetMissingPlugins();
  if (!missing.empty()) {
    const std::string where = search_path.empty()
                                  ? std::string("no plugin search path found")
                                  : "search path: " + search_path;
    const std::string why = "Missing " + missing + " (" + where + ").";
    Log<RMB_ERROR_LOAD_PLUGINS>(logger, "", why.c_str());
    return false;
  }
  return true;
}
}  // namespace rmb
