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

#include "global_config.h"

#include <string>
#include <string_view>
#include <vector>

#include "android-base/result.h"
#include "android-base/strings.h"
#include "arch/target.h"

namespace dexpreopt {
namespace bootimage {

namespace {

using ::android::base::Errorf;
using ::android::base::Result;
using ::android::base::Split;
using ::android::base::Trim;

}  // namespace

Result<Target> ParseTarget(std::string_view target) {
  std::vector<std::string> parts = Split(Trim(std::string(target)), ":");
  if (parts.size() < 2 || parts.size() > 3) {
    return Errorf("Invalid target '{}', expected format: <os>:<arch>[:native_bridge]", target);
  }
  Result<OsType> os = GetOsTypeFromString(parts[0]);
  if (!os.ok()) {
    return Errorf("Invalid target '{}': {}", target, os.error().message());
  }
  Result<ArchType> arch = GetArchTypeFromString(parts[1]);
  if (!arch.ok()) {
    return Errorf("Invalid target '{}': {}", target, arch.error().message());
  }
  NativeBridge native_bridge = NativeBridge::kDisabled;
  if (parts.size() == 3) {
    if (parts[2] != "native_bridge") {
      return Errorf("Invalid target '{}': unknown modifier '{}'", target, parts[2]);
    }
    native_bridge = NativeBridge::kEnabled;
  }
  return Target{.os = os.value(), .arch = arch.value(), .native_bridge = native_bridge};
}

Result<std::vector<Target>> ParseTargetList(std::string_view list) {
  std::vector<Target> targets;
  std::string trimmed = Trim(std::string(list));
  if (trimmed.empty()) {
    return targets;
  }
  for (const std::string& item : Split(trimmed, ",")) {
    targets.push_back(OR_RETURN(ParseTarget(item)));
  }
  return targets;
}

}  // namespace bootimage
}  // namespace dexpreopt
