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

#include "targets.h"

#include <vector>

#include "arch/target.h"
#include "global_config.h"

namespace dexpreopt {
namespace bootimage {

std::vector<Target> DexpreoptTargets(const GlobalConfig& config) {
  std::vector<Target> targets;
  for (const Target& target : config.GetTargets()) {
    if (target.os == OsType::kAndroid && target.native_bridge == NativeBridge::kDisabled) {
      targets.push_back(target);
    }
  }
  for (const Target& target : config.GetTargets()) {
    if (target.os == config.GetBuildOs()) {
      targets.push_back(target);
    }
  }
  return targets;
}

}  // namespace bootimage
}  // namespace dexpreopt
