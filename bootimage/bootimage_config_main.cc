/*
 * Copyright (C) 2026 The Android Open Source Project
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

#include <sysexits.h>
#include <unistd.h>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "android-base/file.h"
#include "android-base/logging.h"
#include "android-base/result.h"
#include "android-base/stringprintf.h"
#include "android-base/strings.h"
#include "arch/target.h"
#include "base/macros.h"
#include "boot_image_config.h"
#include "classpath.h"
#include "global_config.h"
#include "jar_list.h"

namespace {

using ::android::base::Join;
using ::android::base::Result;
using ::dexpreopt::GetOsClass;
using ::dexpreopt::GetOsTypeFromString;
using ::dexpreopt::GetTargetString;
using ::dexpreopt::OsClass;
using ::dexpreopt::OsType;
using ::dexpreopt::Target;
using ::dexpreopt::bootimage::BcpForDexpreopt;
using ::dexpreopt::bootimage::BootClasspath;
using ::dexpreopt::bootimage::BootImageConfig;
using ::dexpreopt::bootimage::BootImageConfigs;
using ::dexpreopt::bootimage::BootImageVariant;
using ::dexpreopt::bootimage::ConfiguredJarList;
using ::dexpreopt::bootimage::DexpreoptConfigMakeVars;
using ::dexpreopt::bootimage::DexpreoptContext;
using ::dexpreopt::bootimage::GenBootImageConfigs;
using ::dexpreopt::bootimage::GetUpdatableBootConfig;
using ::dexpreopt::bootimage::GlobalConfig;
using ::dexpreopt::bootimage::MakeVar;
using ::dexpreopt::bootimage::ParseConfiguredJarList;
using ::dexpreopt::bootimage::ParseTargetList;
using ::dexpreopt::bootimage::SystemServerClasspath;
using ::dexpreopt::bootimage::UpdatableBootConfig;

void UsageMsgV(const char* fmt, va_list ap) {
  std::string error;
  android::base::StringAppendV(&error, fmt, ap);
  if (isatty(fileno(stderr))) {
    std::cerr << error << std::endl;
  } else {
    LOG(ERROR) << error;
  }
}

void UsageMsg(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  UsageMsgV(fmt, ap);
  va_end(ap);
}

NO_RETURN void ArgumentError(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  UsageMsgV(fmt, ap);
  va_end(ap);
  UsageMsg("Try '--help' for more information.");
  exit(EX_USAGE);
}

// Reports an error in the derived configuration. These are not recoverable: the global config
// describes a boot classpath that cannot be dexpreopted.
NO_RETURN void ConfigError(const std::string& message) {
  LOG(ERROR) << "Invalid dexpreopt configuration: " << message;
  exit(EX_CONFIG);
}

std::string GetEnvironmentVariableOrDefault(const char* name, std::string default_value) {
  const char* value = getenv(name);
  if (value == nullptr) {
    return default_value;
  }
  return value;
}

bool ArgumentMatches(std::string_view argument, std::string_view prefix, std::string* value) {
  if (android::base::StartsWith(argument, prefix)) {
    *value = std::string(argument.substr(prefix.size()));
    return true;
  }
  return false;
}

ConfiguredJarList ParseJarListOrDie(const char* option, const std::string& value) {
  Result<ConfiguredJarList> jars = ParseConfiguredJarList(value);
  if (!jars.ok()) {
    ArgumentError("Invalid %s: %s", option, jars.error().message().c_str());
  }
  return std::move(jars).value();
}

int InitializeConfig(int argc, char** argv, GlobalConfig* config) {
  std::string art_apex_jars = GetEnvironmentVariableOrDefault("DEXPREOPT_ART_APEX_JARS", "");
  std::string boot_jars = GetEnvironmentVariableOrDefault("DEXPREOPT_BOOT_JARS", "");
  std::string updatable_boot_jars =
      GetEnvironmentVariableOrDefault("DEXPREOPT_UPDATABLE_BOOT_JARS", "");
  std::string system_server_jars =
      GetEnvironmentVariableOrDefault("DEXPREOPT_SYSTEM_SERVER_JARS", "");
  std::string updatable_system_server_jars =
      GetEnvironmentVariableOrDefault("DEXPREOPT_UPDATABLE_SYSTEM_SERVER_JARS", "");

  int n = 1;
  for (; n < argc - 1; ++n) {
    const char* arg = argv[n];
    std::string value;
    if (ArgumentMatches(arg, "--device-name=", &value)) {
      config->SetDeviceName(value);
    } else if (ArgumentMatches(arg, "--out-dir=", &value)) {
      config->SetOutDir(value);
    } else if (ArgumentMatches(arg, "--host-out-dir=", &value)) {
      config->SetHostOutDir(value);
    } else if (ArgumentMatches(arg, "--art-apex-jars=", &value)) {
      art_apex_jars = value;
    } else if (ArgumentMatches(arg, "--boot-jars=", &value)) {
      boot_jars = value;
    } else if (ArgumentMatches(arg, "--updatable-boot-jars=", &value)) {
      updatable_boot_jars = value;
    } else if (ArgumentMatches(arg, "--system-server-jars=", &value)) {
      system_server_jars = value;
    } else if (ArgumentMatches(arg, "--updatable-system-server-jars=", &value)) {
      updatable_system_server_jars = value;
    } else if (ArgumentMatches(arg, "--targets=", &value)) {
      Result<std::vector<Target>> targets = ParseTargetList(value);
      if (!targets.ok()) {
        ArgumentError("Invalid --targets: %s", targets.error().message().c_str());
      }
      config->SetTargets(targets.value());
    } else if (ArgumentMatches(arg, "--build-os=", &value)) {
      Result<OsType> os = GetOsTypeFromString(value);
      if (!os.ok()) {
        ArgumentError("Invalid --build-os: %s", os.error().message().c_str());
      }
      if (GetOsClass(os.value()) != OsClass::kHost) {
        ArgumentError("Invalid --build-os: '%s' is not a host OS", value.c_str());
      }
      config->SetBuildOs(os.value());
    } else {
      ArgumentError("Unrecognized argument: '%s'", arg);
    }
  }

  config->SetArtApexJars(ParseJarListOrDie("--art-apex-jars", art_apex_jars));
  config->SetBootJars(ParseJarListOrDie("--boot-jars", boot_jars));
  config->SetUpdatableBootJars(ParseJarListOrDie("--updatable-boot-jars", updatable_boot_jars));
  config->SetSystemServerJars(ParseJarListOrDie("--system-server-jars", system_server_jars));
  config->SetUpdatableSystemServerJars(
      ParseJarListOrDie("--updatable-system-server-jars", updatable_system_server_jars));

  return n;
}

void PrintList(std::string_view label, const std::vector<std::string>& values) {
  std::cout << "  " << label << ":\n";
  for (const std::string& value : values) {
    std::cout << "    " << value << "\n";
  }
}

void DumpBootImageConfig(const BootImageConfig& config) {
  std::cout << "boot image '" << config.name << "'\n";
  std::cout << "  stem: " << config.stem << "\n";
  std::cout << "  extends: " << (config.extends != nullptr ? config.extends->name : "-") << "\n";
  std::cout << "  install dir on host: " << config.install_dir_on_host << "\n";
  std::cout << "  dir: " << config.dir << "\n";
  std::cout << "  symbols dir: " << config.symbols_dir << "\n";
  std::cout << "  zip: " << config.zip << "\n";
  PrintList("modules", config.modules.CopyOfApexJarPairs());
  PrintList("dex paths", config.dex_paths);
  PrintList("dex paths deps", config.dex_paths_deps);
  for (const BootImageVariant& variant : config.variants) {
    std::cout << "  variant " << GetTargetString(variant.target) << "\n";
    std::cout << "    image: " << variant.image_path_on_host << "\n";
    if (!variant.primary_images.empty()) {
      std::cout << "    primary images: " << variant.primary_images << "\n";
    }
    std::cout << "    images deps: " << Join(variant.images_deps, " ") << "\n";
    std::cout << "    dex locations: " << Join(variant.dex_locations, ":") << "\n";
    std::cout << "    dex locations deps: " << Join(variant.dex_locations_deps, ":") << "\n";
  }
}

void DumpBootImages(const DexpreoptContext& ctx) {
  Result<const BootImageConfigs*> configs = GenBootImageConfigs(ctx);
  if (!configs.ok()) {
    ConfigError(configs.error().message());
  }
  DumpBootImageConfig(*configs.value()->art);
  DumpBootImageConfig(*configs.value()->framework);

  const UpdatableBootConfig& updatable = GetUpdatableBootConfig(ctx);
  std::cout << "updatable boot jars\n";
  PrintList("modules", updatable.modules.CopyOfApexJarPairs());
  PrintList("dex paths", updatable.dex_paths);
  PrintList("dex locations", updatable.dex_locations);
}

void PrintSystemServerClasspath(const DexpreoptContext& ctx) {
  Result<const std::vector<std::string>*> classpath = SystemServerClasspath(ctx);
  if (!classpath.ok()) {
    ConfigError(classpath.error().message());
  }
  std::cout << Join(*classpath.value(), ":") << "\n";
}

void PrintBootClasspath(const DexpreoptContext& ctx, bool with_updatable) {
  Result<BootClasspath> bcp = BcpForDexpreopt(ctx, with_updatable);
  if (!bcp.ok()) {
    ConfigError(bcp.error().message());
  }
  std::cout << "-Xbootclasspath:" << Join(bcp->dex_paths, ":") << "\n";
  std::cout << "-Xbootclasspath-locations:" << Join(bcp->dex_locations, ":") << "\n";
}

void PrintMakeVars(const DexpreoptContext& ctx) {
  Result<std::vector<MakeVar>> vars = DexpreoptConfigMakeVars(ctx);
  if (!vars.ok()) {
    ConfigError(vars.error().message());
  }
  for (const MakeVar& var : vars.value()) {
    std::cout << var.name << " := " << var.value << "\n";
  }
}

NO_RETURN void UsageHelp(const char* argv0) {
  std::string name(android::base::Basename(argv0));
  UsageMsg("Usage: %s [OPTION...] ACTION", name.c_str());
  UsageMsg("Derives the boot image configuration and the classpaths for dexpreopting");
  UsageMsg("from the global dexpreopt configuration.");
  UsageMsg("");
  UsageMsg("Valid ACTION choices are:");
  UsageMsg("");
  UsageMsg("--dump-boot-images               Print the boot image configs and their variants.");
  UsageMsg("--system-server-classpath        Print the on-device system server classpath.");
  UsageMsg("--boot-classpath                 Print the boot classpath for dexpreopting.");
  UsageMsg("--boot-classpath-with-updatable  Print the boot classpath for dexpreopting,");
  UsageMsg("                                 including the updatable boot jars.");
  UsageMsg("--make-vars                      Print the variables exported to make.");
  UsageMsg("--help                           Display this help information.");
  UsageMsg("");
  UsageMsg("Available OPTIONs are:");
  UsageMsg("");
  UsageMsg("--device-name=<NAME>             Name of the device being built.");
  UsageMsg("--out-dir=<DIR>                  Build output directory (default: out/soong).");
  UsageMsg("--host-out-dir=<DIR>             Host install directory");
  UsageMsg("                                 (default: out/host/linux-x86).");
  UsageMsg("--art-apex-jars=<LIST>           Jars of the ART APEX. Defaults to");
  UsageMsg("                                 $DEXPREOPT_ART_APEX_JARS.");
  UsageMsg("--boot-jars=<LIST>               Jars of the boot image. Defaults to");
  UsageMsg("                                 $DEXPREOPT_BOOT_JARS.");
  UsageMsg("--updatable-boot-jars=<LIST>     Boot jars from updatable APEXes. Defaults to");
  UsageMsg("                                 $DEXPREOPT_UPDATABLE_BOOT_JARS.");
  UsageMsg("--system-server-jars=<LIST>      System server jars. Defaults to");
  UsageMsg("                                 $DEXPREOPT_SYSTEM_SERVER_JARS.");
  UsageMsg("--updatable-system-server-jars=<LIST>");
  UsageMsg("                                 System server jars from updatable APEXes.");
  UsageMsg("                                 Defaults to");
  UsageMsg("                                 $DEXPREOPT_UPDATABLE_SYSTEM_SERVER_JARS.");
  UsageMsg("--targets=<TARGETS>              Comma-separated <os>:<arch>[:native_bridge]");
  UsageMsg("                                 entries, e.g. android:arm64,android:arm.");
  UsageMsg("--build-os=<OS>                  OS of the build host (default: linux_glibc).");
  UsageMsg("");
  UsageMsg("A <LIST> is a comma-separated list of <apex>:<jar> pairs, where <apex> is an");
  UsageMsg("APEX name, 'platform' or 'system_ext'.");

  exit(EX_USAGE);
}

}  // namespace

int main(int argc, char** argv) {
  android::base::InitLogging(argv);

  const char* argv0 = argv[0];
  GlobalConfig config;
  int n = InitializeConfig(argc, argv, &config);
  argv += n;
  argc -= n;
  if (argc != 1) {
    ArgumentError("Expected 1 argument, but have %d.", argc);
  }

  DexpreoptContext ctx(config);

  const std::string_view action(argv[0]);
  if (action == "--dump-boot-images") {
    DumpBootImages(ctx);
  } else if (action == "--system-server-classpath") {
    PrintSystemServerClasspath(ctx);
  } else if (action == "--boot-classpath") {
    PrintBootClasspath(ctx, /*with_updatable=*/false);
  } else if (action == "--boot-classpath-with-updatable") {
    PrintBootClasspath(ctx, /*with_updatable=*/true);
  } else if (action == "--make-vars") {
    PrintMakeVars(ctx);
  } else if (action == "--help") {
    UsageHelp(argv0);
  } else {
    ArgumentError("Unknown argument: %s", argv[0]);
  }
  return EX_OK;
}
