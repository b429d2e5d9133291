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

#include "classpath.h"

#include <string>
#include <vector>

#include "android-base/result.h"
#include "android-base/strings.h"
#include "arch/target.h"
#include "base/file_utils.h"
#include "base/once.h"
#include "boot_image_config.h"
#include "global_config.h"
#include "jar_list.h"

namespace dexpreopt {
namespace bootimage {

namespace {

using ::android::base::Errorf;
using ::android::base::Join;
using ::android::base::Result;

constexpr OnceKey<std::vector<std::string>> kNonUpdatableSystemServerJarsKey(
    "nonUpdatableSystemServerJars");
constexpr OnceKey<Result<std::vector<std::string>>> kSystemServerClasspathKey(
    "systemServerClasspath");

Result<std::vector<std::string>> GenerateSystemServerClasspath(const DexpreoptContext& ctx) {
  const GlobalConfig& global = ctx.Config();
  std::vector<std::string> locations;
  // 1) Non-updatable jars.
  for (const std::string& jar : NonUpdatableSystemServerJars(ctx)) {
    locations.push_back(JoinPath({kSystemFrameworkDefaultPath, jar + ".jar"}));
  }
  // 2) The jars that are from an updatable APEX.
  std::vector<std::string> updatable_locations =
      global.GetUpdatableSystemServerJars().DevicePaths(global, OsType::kAndroid);
  locations.insert(locations.end(), updatable_locations.begin(), updatable_locations.end());

  size_t expected =
      global.GetSystemServerJars().Len() + global.GetUpdatableSystemServerJars().Len();
  if (locations.size() != expected) {
    return Errorf(
        "wrong number of system server jars, got {}, expected {}", locations.size(), expected);
  }
  return locations;
}

// Returns the on-device locations of the jars of `config` and of all images it extends, ancestors
// first.
std::vector<std::string> AndroidDexLocationsDeps(const BootImageConfig& config,
                                                 const GlobalConfig& global) {
  std::vector<std::string> locations;
  if (config.extends != nullptr) {
    locations = AndroidDexLocationsDeps(*config.extends, global);
  }
  std::vector<std::string> own = config.modules.DevicePaths(global, OsType::kAndroid);
  locations.insert(locations.end(), own.begin(), own.end());
  return locations;
}

}  // namespace

const std::vector<std::string>& NonUpdatableSystemServerJars(const DexpreoptContext& ctx) {
  return ctx.Cache().Once(kNonUpdatableSystemServerJarsKey, [&]() {
    const GlobalConfig& global = ctx.Config();
    const ConfiguredJarList& updatable = global.GetUpdatableSystemServerJars();
    std::vector<std::string> jars;
    for (const std::string& jar : global.GetSystemServerJars().CopyOfJars()) {
      if (!updatable.ContainsJar(jar)) {
        jars.push_back(jar);
      }
    }
    return jars;
  });
}

Result<const std::vector<std::string>*> SystemServerClasspath(const DexpreoptContext& ctx) {
  const Result<std::vector<std::string>>& classpath = ctx.Cache().Once(
      kSystemServerClasspathKey, [&]() { return GenerateSystemServerClasspath(ctx); });
  if (!classpath.ok()) {
    return classpath.error();
  }
  return &classpath.value();
}

Result<BootClasspath> BcpForDexpreopt(const DexpreoptContext& ctx, bool with_updatable) {
  // Non-updatable boot jars. They are used both in the boot image and in dexpreopt.
  const BootImageConfig* boot_image = OR_RETURN(DefaultBootImageConfig(ctx));
  // The dex locations of all Android variants are identical. Without one, as in a host-only
  // build, compute them from the modules.
  const BootImageVariant* variant = boot_image->GetAnyAndroidVariant();
  BootClasspath bcp{
      .dex_paths = boot_image->dex_paths_deps,
      .dex_locations = variant != nullptr ?
                           variant->dex_locations_deps :
                           AndroidDexLocationsDeps(*boot_image, ctx.Config()),
  };

  if (with_updatable) {
    // Updatable boot jars. They are used only in dexpreopt, not in the boot image.
    const UpdatableBootConfig& updatable = GetUpdatableBootConfig(ctx);
    bcp.dex_paths.insert(
        bcp.dex_paths.end(), updatable.dex_paths.begin(), updatable.dex_paths.end());
    bcp.dex_locations.insert(
        bcp.dex_locations.end(), updatable.dex_locations.begin(), updatable.dex_locations.end());
  }

  return bcp;
}

Result<std::vector<MakeVar>> DexpreoptConfigMakeVars(const DexpreoptContext& ctx) {
  const BootImageConfig* boot_image = OR_RETURN(DefaultBootImageConfig(ctx));
  return std::vector<MakeVar>{
      {.name = "DEXPREOPT_BOOT_JARS_MODULES",
       .value = Join(boot_image->modules.CopyOfApexJarPairs(), ":")},
  };
}

}  // namespace bootimage
}  // namespace dexpreopt
