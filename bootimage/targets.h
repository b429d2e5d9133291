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

#ifndef DEXPREOPT_BOOTIMAGE_TARGETS_H_
#define DEXPREOPT_BOOTIMAGE_TARGETS_H_

#include <vector>

#include "arch/target.h"
#include "global_config.h"

namespace dexpreopt {
namespace bootimage {

// Returns the targets that boot images are generated for: the Android targets of the target
// matrix, minus those supported through native bridge, followed by all targets of the build OS.
// Host images are needed by host-based tests.
std::vector<Target> DexpreoptTargets(const GlobalConfig& config);

}  // namespace bootimage
}  // namespace dexpreopt

#endif  // DEXPREOPT_BOOTIMAGE_TARGETS_H_
