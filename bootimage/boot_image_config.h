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

#ifndef DEXPREOPT_BOOTIMAGE_BOOT_IMAGE_CONFIG_H_
#define DEXPREOPT_BOOTIMAGE_BOOT_IMAGE_CONFIG_H_

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "android-base/result.h"
#include "arch/target.h"
#include "global_config.h"
#include "jar_list.h"

namespace dexpreopt {
namespace bootimage {

// Name of the primary boot image, which contains the Core Libraries from the ART APEX.
static constexpr const char* kArtBootImageName = "art";
// Name of the boot image extension, which contains the framework libraries.
static constexpr const char* kFrameworkBootImageName = "boot";

static constexpr const char* kArtDirOnHost = "apex/art_boot_images/javalib";
static constexpr const char* kFrameworkSubdir = "system/framework";

struct BootImageConfig;

// The instantiation of a boot image config for one target.
struct BootImageVariant {
  // The config this variant belongs to. Not owned.
  const BootImageConfig* config = nullptr;

  Target target;

  // Path of the image file of the first module, e.g.
  // ".../dex_bootjars/android/system/framework/arm64/boot-framework.art".
  std::string image_path_on_host;

  // The .art, .oat and .vdex files of all modules of the image.
  std::vector<std::string> images_deps;

  // Locations of the dex files of this image on the target.
  std::vector<std::string> dex_locations;

  // Locations of the dex files of this image and of all images it extends, ancestors first.
  std::vector<std::string> dex_locations_deps;

  // For an extension, `image_path_on_host` of the same target in the extended image. Empty for a
  // primary image.
  std::string primary_images;
};

// One layer of the boot image.
struct BootImageConfig {
  // The config this one extends, or null for the primary boot image. Not owned.
  const BootImageConfig* extends = nullptr;

  std::string name;

  // Base name of the image files.
  std::string stem;

  // Directory of the image files relative to the OS directory, e.g. "system/framework".
  std::string install_dir_on_host;

  ConfiguredJarList modules;

  // Output directory of the image.
  std::string dir;

  // Output directory of the unstripped image files.
  std::string symbols_dir;

  // Archive that collects the image files of all variants.
  std::string zip;

  // Predefined paths to the dex jars of `modules`. They are known before the jars are built, and
  // the jars are later copied there.
  std::vector<std::string> dex_paths;

  // `dex_paths` of all images this one extends, ancestors first, followed by `dex_paths`.
  std::vector<std::string> dex_paths_deps;

  // One variant per target, in the order of `DexpreoptTargets`.
  std::vector<BootImageVariant> variants;

  // Returns the image name of the module at `index`. The first module of a primary image is named
  // after the stem, e.g. "boot". All other modules get the module stem as a suffix, e.g.
  // "boot-core-libart" or "boot-framework".
  std::string ModuleName(size_t index) const;

  // Returns the name of the first module, or the stem if the image has no modules.
  std::string FirstModuleNameOrStem() const;

  // Returns "<dir>/<module name><ext>" for every module and every extension in `exts`.
  std::vector<std::string> ModuleFiles(std::string_view dir,
                                       std::initializer_list<std::string_view> exts) const;

  // Returns the first variant for Android, or null if there is none. The dex locations of all
  // Android variants are identical.
  const BootImageVariant* GetAnyAndroidVariant() const;
};

// The boot image configs of one build invocation. The framework config extends the ART config.
// Configs are heap-allocated so that pointers between them survive moves of this struct.
struct BootImageConfigs {
  std::unique_ptr<BootImageConfig> art;
  std::unique_ptr<BootImageConfig> framework;

  // Returns the config with the given name, or null.
  const BootImageConfig* Get(std::string_view name) const;
};

// Creates one variant of `config` for each target in `targets`, in the same order. Only uses the
// fields of `config` itself; wiring to an extended config is up to the caller.
std::vector<BootImageVariant> ExpandVariants(const BootImageConfig& config,
                                             const std::vector<Target>& targets,
                                             const GlobalConfig& global);

// Returns the boot image configs of the build. They are generated on the first call and cached in
// the context. Fails if the module counts of the images do not add up to the boot jars.
android::base::Result<const BootImageConfigs*> GenBootImageConfigs(const DexpreoptContext& ctx);

// Returns the config of the primary boot image.
android::base::Result<const BootImageConfig*> ArtBootImageConfig(const DexpreoptContext& ctx);

// Returns the config of the default boot image, which is the framework extension.
android::base::Result<const BootImageConfig*> DefaultBootImageConfig(const DexpreoptContext& ctx);

// Build and install paths of the updatable boot jars. They are dexpreopted against the boot image
// but are not part of it.
struct UpdatableBootConfig {
  ConfiguredJarList modules;

  // Predefined build paths to the jars. A later stage copies the actual jars there.
  std::vector<std::string> dex_paths;

  // Locations of the jars on device.
  std::vector<std::string> dex_locations;
};

// Returns the updatable boot config of the build, generated on the first call.
const UpdatableBootConfig& GetUpdatableBootConfig(const DexpreoptContext& ctx);

}  // namespace bootimage
}  // namespace dexpreopt

#endif  // DEXPREOPT_BOOTIMAGE_BOOT_IMAGE_CONFIG_H_
