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

#ifndef DEXPREOPT_BOOTIMAGE_CLASSPATH_H_
#define DEXPREOPT_BOOTIMAGE_CLASSPATH_H_

#include <string>
#include <vector>

#include "android-base/result.h"
#include "global_config.h"

namespace dexpreopt {
namespace bootimage {

// Returns the names of the system server jars that are not from an updatable APEX, in classpath
// order.
const std::vector<std::string>& NonUpdatableSystemServerJars(const DexpreoptContext& ctx);

// Returns the on-device locations of the jars on the system server classpath: the non-updatable
// jars in /system/framework first, then the jars from updatable APEXes. Computed on the first
// call. Fails if the number of locations does not match the configured number of system server
// jars.
android::base::Result<const std::vector<std::string>*> SystemServerClasspath(
    const DexpreoptContext& ctx);

// The boot classpath to dexpreopt against, as passed to dex2oat in -Xbootclasspath and
// -Xbootclasspath-locations. `dex_paths[i]` is the build path of the jar at `dex_locations[i]`.
struct BootClasspath {
  std::vector<std::string> dex_paths;
  std::vector<std::string> dex_locations;
};

// Returns the boot classpath for dexpreopting. It always starts with the jars of the default boot
// image, in image order. If `with_updatable` is true, the updatable boot jars follow. They are not
// in the boot image, but code compiled against the boot classpath may still use them. Fails
// only if the boot image configs cannot be generated.
android::base::Result<BootClasspath> BcpForDexpreopt(const DexpreoptContext& ctx,
                                                      bool with_updatable);

struct MakeVar {
  std::string name;
  std::string value;
};

// Returns the variables exported to the legacy make build.
android::base::Result<std::vector<MakeVar>> DexpreoptConfigMakeVars(const DexpreoptContext& ctx);

}  // namespace bootimage
}  // namespace dexpreopt

#endif  // DEXPREOPT_BOOTIMAGE_CLASSPATH_H_
