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

#include <stdio.h>
#include <string>
#include "args.h"  // NOLINT: Silence relative path warning.
#include "common/common_util.h"
#include "common/logging.h"
#include "convert/converter.h"
#include "convert/settings_store.h"
#include "rig/memory_scene.h"
#include "usd/usd_codec.h"
#include "usd/usd_util.h"

namespace {
// Settings for one source: defaults, then the settings file in the source's
// directory, then flags given on the command line.
rmb::ConvertSettings GetSourceSettings(const Args& args,
                                       const rmb::SettingsStore& store,
                                       rmb::Logger* logger) {
  rmb::ConvertSettings settings = args.settings;
  store.ApplyTo(&settings, logger);
  args.overrides.ApplyTo(&settings, logger);
  settings.Normalize();
  return settings;
}

bool ConvertSource(const std::string& src, const Args& args,
                   rmb::InterchangeCodec* codec, rmb::Logger* logger) {
  rmb::Logger::NameSentry name_sentry(logger, src);
  const std::string config_path =
      rmb::SettingsStore::GetPath(rmb::GetFileDirectory(src));
  rmb::SettingsStore store;
  if (args.use_config && !store.Load(config_path, logger)) {
    // Continue with defaults. The reason has been logged.
    store.Clear();
  }
  const rmb::ConvertSettings settings =
      GetSourceSettings(args, store, logger);

  // An unnamed export takes the source's name. This isn't persisted, so other
  // sources in the directory keep their own names.
  rmb::ConvertSettings run_settings = settings;
  if (run_settings.file_name.empty()) {
    run_settings.file_name = rmb::GetFileStem(src);
  }

  rmb::MemoryScene scene;
  rmb::Converter converter(run_settings, &scene, codec, logger);
  converter.SetSource(src);
  try {
    converter.RunToCompletion([](const rmb::ConvertStatus& status) {
      printf("[%s] %s\n", rmb::GetStatusTagName(status.tag),
             status.message.c_str());
    });
  } catch (const rmb::ConvertError& e) {
    logger->Add(e.GetMessage());
    return false;
  } catch (const rmb::AssertException& e) {
    rmb::Log<rmb::RMB_ERROR_ASSERT>(logger, "", e.GetFile(), e.GetLine(),
                                    e.GetExpression());
    return false;
  }

  if (args.use_config) {
    store.CaptureFrom(settings);
    return store.Save(config_path, logger);
  }
  return true;
}
}  // namespace

int main(int argc, char* argv[]) {
  rmb::PrintLogger logger;

  Args args;
  if (!ParseArgs(argc, argv, &args, &logger)) {
    return -1;
  }
  if (args.sources.empty()) {
    return 0;
  }

  if (!rmb::RegisterPlugins(args.settings.plugin_path, &logger)) {
    return -1;
  }

  rmb::UsdCodec codec(args.format);
  bool success = true;
  {
    rmb::ProfileSentry profile_sentry("Convert", args.settings.print_timing);
    for (const std::string& src : args.sources) {
      if (args.sources.size() > 1) {
        printf("%s\n", src.c_str());
        logger.SetLinePrefix("  ");
      }
      if (!ConvertSource(src, args, &codec, &logger)) {
        success = false;
      }
    }
  }
  return success ? 0 : -1;
}
