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

#include "args.h"  // NOLINT: Silence relative path warning.

#include <stdio.h>
#include <string.h>
#include <algorithm>
#include <memory>
#include "common/common_util.h"
#include "common/logging.h"
#include "tclap/CmdLine.h"

namespace {
// Get offset from the default conversion settings. This allows us to reference
// members of the default by name in Bind().
size_t GetDefaultOffset(const void* member) {
  const size_t offset =
      static_cast<const char*>(member) -
      reinterpret_cast<const char*>(&rmb::ConvertSettings::kDefault);
  RMB_ASSERT_LOGIC(offset <= sizeof(rmb::ConvertSettings));
  return offset;
}

template <typename T>
std::string ToString(const T& v) {
  return std::to_string(v);
}

const std::string& ToString(const std::string& v) {
  return v;
}

constexpr rmb::SettingsKey kNotPersisted = rmb::kSettingsKeyCount;

class ArgParser {
 public:
  ArgParser()
      : nousage_(false),
        output_(this),
        cmd_(""),
        paths_("paths",
               "Input USD files containing a skeleton (.usd, .usda, .usdc).",
               true, "path"),
        nousage_arg_("", "nousage", "Don't print usage on argument error."),
        noconfig_arg_("", "noconfig",
                      "Don't read or write the settings file in each "
                      "source directory."),
        format_arg_("", "format",
                    "Output file format (usda, usdc or usd). [default=usda]",
                    false, "usda", "string") {
    cmd_.setOutput(&output_);
    cmd_.setExceptionHandling(false);

    Bind();

    // For some reason TCLAP lists parameters in reverse, so add them in reverse
    // to correct this.
    cmd_.add(nousage_arg_);
    cmd_.add(noconfig_arg_);
    cmd_.add(format_arg_);
    const size_t binder_count = binders_.size();
    for (size_t i = binder_count; i != 0; ) {
      --i;
      binders_[i]->Add(&cmd_);
    }
    cmd_.add(paths_);
  }

  bool Parse(
      int argc, const char* const* argv, Args* out_args, rmb::Logger* logger) {
    try {
      // Convert args to vector, replacing arg[0] with the short exe name.
      // * We also explicitly check for --nousage because we need this argument
      //   before parse completes.
      nousage_ = false;
      argc = std::max(argc, 1);
      std::vector<std::string> arg_vec(argc);
      arg_vec[0] = "rmb_convert";
      for (int i = 1; i != argc; ++i) {
        const char* const arg = argv[i];
        if (strcmp(arg, "--nousage") == 0) {
          nousage_ = true;
        }
        arg_vec[i] = argv[i];
      }

      // Parse args.
      cmd_.reset();
      cmd_.parse(arg_vec);

      // The unnamed 'paths' argument acts as the catch-all, which unfortunately
      // means mistyped flags will also be treated as paths. Explicitly emit
      // errors for these.
      const std::vector<std::string>& paths = paths_.getValue();
      bool have_unknown_flags = false;
      for (const std::string& path : paths) {
        if (path.compare(0, 2, "--") == 0) {
          rmb::Log<rmb::RMB_ERROR_ARGUMENT_UNKNOWN>(logger, "", path.c_str());
          have_unknown_flags = true;
        }
      }
      if (have_unknown_flags) {
        return false;
      }
      if (paths.empty()) {
        rmb::Log<rmb::RMB_ERROR_ARGUMENT_PATHS>(logger, "");
        return false;
      }
      out_args->sources = paths;
      out_args->use_config = !noconfig_arg_.getValue();
      out_args->format = rmb::TrimWhitespace(format_arg_.getValue());

      // Apply arguments to settings.
      for (const std::unique_ptr<IBinder>& binder : binders_) {
        binder->Apply(out_args);
      }
      return true;
    } catch (const TCLAP::ArgException& e) {
      rmb::Log<rmb::RMB_ERROR_ARGUMENT_EXCEPTION>(
          logger, "", e.argId().c_str(), e.error().c_str());
      return false;
    } catch (const TCLAP::ExitException&) {
      return true;
    }
  }

  void PrintShortUsage() {
    output_.PrintShortUsage();
  }

 private:
  class IBinder {
   public:
    virtual ~IBinder() {}
    virtual void Add(TCLAP::CmdLine* cmd) = 0;
    virtual void Apply(Args* args) = 0;
  };

  class Output : public TCLAP::StdOutput {
   public:
    explicit Output(ArgParser* parser) : parser_(parser) {}
    void usage(TCLAP::CmdLineInterface& c) override {
      if (parser_->nousage_) {
        return;
      }
      PrintLongUsage();
    }

    void PrintShortUsage() const {
      if (parser_->nousage_) {
        return;
      }
      printf("Usage: \n");
      _shortUsage(parser_->cmd_, std::cout);
    }

    void PrintLongUsage() const {
      if (parser_->nousage_) {
        return;
      }
      printf("rmb_convert - Move character root motion onto a root bone.\n");
      PrintShortUsage();
      printf("Where: \n");
      _longUsage(parser_->cmd_, std::cout);
    }

   private:
    ArgParser* parser_;
  };

  bool nousage_;
  Output output_;
  TCLAP::CmdLine cmd_;
  std::vector<std::unique_ptr<IBinder>> binders_;
  TCLAP::UnlabeledMultiArg<std::string> paths_;
  TCLAP::SwitchArg nousage_arg_;
  TCLAP::SwitchArg noconfig_arg_;
  TCLAP::ValueArg<std::string> format_arg_;

  // Only flags given on the command line are applied. Persisted settings are
  // recorded in Args::overrides, so they can be layered over the settings file.
  template <typename T>
  static void ApplyValue(size_t offset, rmb::SettingsKey key, const T& value,
                         Args* args) {
    if (key == kNotPersisted) {
      T* const out_value = reinterpret_cast<T*>(
          reinterpret_cast<char*>(&args->settings) + offset);
      *out_value = value;
    } else {
      args->overrides.Set(key, ToString(value));
    }
  }

  // For switches, this adds an inverse 'no' flag (e.g. --dump_diagnostics and
  // --nodump_diagnostics).
  class SwitchBinder : public IBinder {
   public:
    SwitchBinder(const char* name, const char* desc, const bool* def,
                 rmb::SettingsKey key = kNotPersisted)
        : name_(name),
          desc_(desc),
          offset_(GetDefaultOffset(def)),
          def_(*def),
          key_(key) {}
    void Add(TCLAP::CmdLine* cmd) override {
      const std::string on_name = name_;
      const std::string off_name = "no" + on_name;
      const std::string on_desc =
          std::string(desc_) + (def_ ? " [Default]" : "");
      const std::string off_desc =
          "Disable --" + on_name + (!def_ ? ". [Default]" : ".");
      on_ = std::unique_ptr<TCLAP::SwitchArg>(
          new TCLAP::SwitchArg("", on_name, on_desc, false));
      off_ = std::unique_ptr<TCLAP::SwitchArg>(
          new TCLAP::SwitchArg("", off_name, off_desc, false));
      cmd->add(*off_);
      cmd->add(*on_);
    }
    void Apply(Args* args) override {
      if (off_->isSet()) {
        ApplyValue(offset_, key_, false, args);
      } else if (on_->isSet()) {
        ApplyValue(offset_, key_, true, args);
      }
    }

   private:
    const char* name_;
    const char* desc_;
    size_t offset_;
    bool def_;
    rmb::SettingsKey key_;
    std::unique_ptr<TCLAP::SwitchArg> on_;
    std::unique_ptr<TCLAP::SwitchArg> off_;
  };

  static const char* GetValueTypeName(double) { return "float"; }
  static const char* GetValueTypeName(const std::string&) { return "string"; }

  template <typename T>
  class ValueBinder : public IBinder {
    using Arg = TCLAP::ValueArg<T>;

   public:
    ValueBinder(const char* name, const char* desc, const T* def,
                rmb::SettingsKey key = kNotPersisted)
        : name_(name),
          desc_(desc),
          offset_(GetDefaultOffset(def)),
          def_(*def),
          key_(key) {}
    void Add(TCLAP::CmdLine* cmd) override {
      const std::string desc =
          std::string(desc_) + " [default=" + ToString(def_) + "]";
      arg_ = std::unique_ptr<Arg>(
          new Arg("", name_, desc, false, def_, GetValueTypeName(def_)));
      cmd->add(*arg_);
    }
    void Apply(Args* args) override {
      if (arg_->isSet()) {
        ApplyValue(offset_, key_, arg_->getValue(), args);
      }
    }

   private:
    const char* name_;
    const char* desc_;
    size_t offset_;
    T def_;
    rmb::SettingsKey key_;
    std::unique_ptr<Arg> arg_;
  };
  using FloatBinder = ValueBinder<double>;
  using StringBinder = ValueBinder<std::string>;

  void Bind() {
    const rmb::ConvertSettings& def = rmb::ConvertSettings::kDefault;
    binders_.emplace_back(new StringBinder("hip",
        "Name of the rig's top bone, which carries its locomotion.",
        &def.hip_bone_name, rmb::kKeyHipBoneName));
    binders_.emplace_back(new StringBinder("root",
        "Name of the root motion bone added above the hip.",
        &def.root_bone_name, rmb::kKeyRootBoneName));
    binders_.emplace_back(new FloatBinder ("sample_rate",
        "Samples per second of baked motions.",
        &def.animation_sample_rate, rmb::kKeyAnimationSampleRate));
    binders_.emplace_back(new StringBinder("name",
        "Output file name. Defaults to the source file name.",
        &def.file_name, rmb::kKeyFileName));
    binders_.emplace_back(new StringBinder("out",
        "Output directory. Defaults to the current directory.",
        &def.output_dir, rmb::kKeyOutputDir));
    binders_.emplace_back(new SwitchBinder("append_actor_or_motion_path",
        "Export to an Actor or Motions subdirectory of the output directory.",
        &def.append_actor_or_motion_path, rmb::kKeyAppendActorOrMotionPath));
    binders_.emplace_back(new SwitchBinder("dump_diagnostics",
        "Write a per-frame table of the baked root motion next to motions.",
        &def.dump_diagnostics, rmb::kKeyDumpDiagnostics));
    binders_.emplace_back(new SwitchBinder("extract_textures",
        "Save copies of the asset's images to a textures directory.",
        &def.extract_textures, rmb::kKeyExtractTextures));
    binders_.emplace_back(new StringBinder("armature",
        "Armature to convert. Defaults to the first one found.",
        &def.armature_name));
    binders_.emplace_back(new SwitchBinder("print_timing",
        "Print conversion time stats.",
        &def.print_timing));
    binders_.emplace_back(new StringBinder("plugin_path",
        "Paths to USD plugins (may contain wildcards).",
        &def.plugin_path));
  }
};
}  // namespace

bool ParseArgs(
    int argc, const char* const* argv, Args* out_args, rmb::Logger* logger) {
  ArgParser parser;
  const bool success = parser.Parse(argc, argv, out_args, logger);
  if (!success) {
    parser.PrintShortUsage();
  }
  return success;
}
