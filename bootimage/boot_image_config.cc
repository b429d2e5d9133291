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

#include "boot_image_config.h"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "android-base/logging.h"
#include "android-base/result.h"
#include "arch/target.h"
#include "base/file_utils.h"
#include "base/macros.h"
#include "base/once.h"
#include "global_config.h"
#include "jar_list.h"
#include "targets.h"

namespace dexpreopt {
namespace bootimage {

namespace {

using ::android::base::Errorf;
using ::android::base::Result;

constexpr OnceKey<Result<BootImageConfigs>> kBootImageConfigKey("bootImageConfig");
constexpr OnceKey<UpdatableBootConfig> kUpdatableBootConfigKey("updatableBootConfig");

// Fills in the fields that every config derives the same way from its name and modules, and
// expands the variants.
void InitBootImageConfig(const GlobalConfig& global,
                         const std::vector<Target>& targets,
                         /*inout*/ BootImageConfig* config) {
  std::string device_dir = global.GetDeviceDir();
  config->dir = JoinPath({device_dir, "dex_" + config->name + "jars"});
  config->symbols_dir = JoinPath({device_dir, "dex_" + config->name + "jars_unstripped"});

  // The paths to the dex jars need to be known before the jars are built. A later stage copies
  // the jars to these paths.
  std::string input_dir = JoinPath({device_dir, "dex_" + config->name + "jars_input"});
  config->dex_paths = config->modules.BuildPaths(input_dir);
  config->dex_paths_deps = config->dex_paths;

  config->variants = ExpandVariants(*config, targets, global);

  config->zip = JoinPath({config->dir, config->name + ".zip"});
}

// Makes the transitive lists of `extension` start with those of `parent`, and points the
// variants of `extension` to the images they extend.
void LinkExtension(const BootImageConfig& parent, /*inout*/ BootImageConfig* extension) {
  std::vector<std::string> dex_paths_deps = parent.dex_paths_deps;
  dex_paths_deps.insert(
      dex_paths_deps.end(), extension->dex_paths_deps.begin(), extension->dex_paths_deps.end());
  extension->dex_paths_deps = std::move(dex_paths_deps);

  CHECK_EQ(parent.variants.size(), extension->variants.size());
  for (size_t i = 0; i < extension->variants.size(); i++) {
    const BootImageVariant& parent_variant = parent.variants[i];
    BootImageVariant& variant = extension->variants[i];
    DCHECK(parent_variant.target == variant.target);
    variant.primary_images = parent_variant.image_path_on_host;
    std::vector<std::string> dex_locations_deps = parent_variant.dex_locations_deps;
    dex_locations_deps.insert(dex_locations_deps.end(),
                              variant.dex_locations_deps.begin(),
                              variant.dex_locations_deps.end());
    variant.dex_locations_deps = std::move(dex_locations_deps);
  }
}

Result<BootImageConfigs> GenerateBootImageConfigs(const GlobalConfig& global) {
  std::vector<Target> targets = DexpreoptTargets(global);

  const ConfiguredJarList& art_modules = global.GetArtApexJars();
  ConfiguredJarList framework_modules = global.GetBootJars().RemoveList(art_modules);

  // Every ART APEX jar must be a boot jar, or the images would not cover the boot classpath.
  if (size_t expected = global.GetBootJars().Len(),
      actual = art_modules.Len() + framework_modules.Len();
      actual != expected) {
    return Errorf("wrong number of boot image jars, got {}, expected {}", actual, expected);
  }

  BootImageConfigs configs;

  // ART config for the primary boot image in the ART APEX. It includes the Core Libraries.
  configs.art = std::make_unique<BootImageConfig>();
  configs.art->name = kArtBootImageName;
  configs.art->stem = "boot";
  configs.art->install_dir_on_host = kArtDirOnHost;
  configs.art->modules = art_modules;

  // Framework config for the boot image extension. It includes framework libraries and depends
  // on the ART config.
  configs.framework = std::make_unique<BootImageConfig>();
  configs.framework->extends = configs.art.get();
  configs.framework->name = kFrameworkBootImageName;
  configs.framework->stem = "boot";
  configs.framework->install_dir_on_host = kFrameworkSubdir;
  configs.framework->modules = std::move(framework_modules);

  // The base must be complete before the extension is linked to it.
  for (BootImageConfig* config : {configs.art.get(), configs.framework.get()}) {
    InitBootImageConfig(global, targets, config);
    LOG(VERBOSE) << DEXPREOPT_FORMAT("Boot image config '{}': {} modules, {} variants",
                                     config->name,
                                     config->modules.Len(),
                                     config->variants.size());
  }
  LinkExtension(*configs.art, configs.framework.get());

  return configs;
}

}  // namespace

std::string BootImageConfig::ModuleName(size_t index) const {
  // Dexpreopting the boot classpath produces one set of files per jar. The first jar of a primary
  // image is converted into <stem>.art, and the rest into <stem>-<jar>.art.
  std::string module_name = stem;
  if (index != 0 || extends != nullptr) {
    module_name += "-" + ModuleStem(modules.Jar(index));
  }
  return module_name;
}

std::string BootImageConfig::FirstModuleNameOrStem() const {
  if (modules.IsEmpty()) {
    return stem;
  }
  return ModuleName(0);
}

std::vector<std::string> BootImageConfig::ModuleFiles(
    std::string_view dir, std::initializer_list<std::string_view> exts) const {
  std::vector<std::string> files;
  files.reserve(modules.Len() * exts.size());
  for (size_t i = 0; i < modules.Len(); i++) {
    std::vector<std::string> module_files =
        PathsWithExtensions(JoinPath({dir, ModuleName(i)}), exts);
    files.insert(files.end(), module_files.begin(), module_files.end());
  }
  return files;
}

const BootImageVariant* BootImageConfig::GetAnyAndroidVariant() const {
  for (const BootImageVariant& variant : variants) {
    if (variant.target.os == OsType::kAndroid) {
      return &variant;
    }
  }
  return nullptr;
}

const BootImageConfig* BootImageConfigs::Get(std::string_view name) const {
  for (const BootImageConfig* config : {art.get(), framework.get()}) {
    if (config != nullptr && config->name == name) {
      return config;
    }
  }
  return nullptr;
}

std::vector<BootImageVariant> ExpandVariants(const BootImageConfig& config,
                                             const std::vector<Target>& targets,
                                             const GlobalConfig& global) {
  // <stem>.art for a primary image, <stem>-<first module>.art for an extension.
  std::string image_name = config.FirstModuleNameOrStem() + ".art";

  std::vector<BootImageVariant> variants;
  variants.reserve(targets.size());
  for (const Target& target : targets) {
    std::string image_dir = JoinPath({config.dir,
                                      GetOsTypeString(target.os),
                                      config.install_dir_on_host,
                                      GetArchTypeString(target.arch)});
    BootImageVariant variant;
    variant.config = &config;
    variant.target = target;
    variant.image_path_on_host = JoinPath({image_dir, image_name});
    variant.images_deps = config.ModuleFiles(image_dir, {".art", ".oat", ".vdex"});
    variant.dex_locations = config.modules.DevicePaths(global, target.os);
    variant.dex_locations_deps = variant.dex_locations;
    variants.push_back(std::move(variant));
  }
  return variants;
}

Result<const BootImageConfigs*> GenBootImageConfigs(const DexpreoptContext& ctx) {
  const Result<BootImageConfigs>& configs = ctx.Cache().Once(
      kBootImageConfigKey, [&]() { return GenerateBootImageConfigs(ctx.Config()); });
  if (!configs.ok()) {
    return configs.error();
  }
  return &configs.value();
}

Result<const BootImageConfig*> ArtBootImageConfig(const DexpreoptContext& ctx) {
  const BootImageConfigs* configs = OR_RETURN(GenBootImageConfigs(ctx));
  return configs->art.get();
}

Result<const BootImageConfig*> DefaultBootImageConfig(const DexpreoptContext& ctx) {
  const BootImageConfigs* configs = OR_RETURN(GenBootImageConfigs(ctx));
  return configs->framework.get();
}

const UpdatableBootConfig& GetUpdatableBootConfig(const DexpreoptContext& ctx) {
  return ctx.Cache().Once(kUpdatableBootConfigKey, [&]() {
    const GlobalConfig& global = ctx.Config();
    const ConfiguredJarList& updatable_boot_jars = global.GetUpdatableBootJars();
    std::string dir = JoinPath({global.GetDeviceDir(), "updatable_bootjars"});
    return UpdatableBootConfig{
        .modules = updatable_boot_jars,
        .dex_paths = updatable_boot_jars.BuildPaths(dir),
        .dex_locations = updatable_boot_jars.DevicePaths(global, OsType::kAndroid),
    };
  });
}

}  // namespace bootimage
}  // namespace dexpreopt
