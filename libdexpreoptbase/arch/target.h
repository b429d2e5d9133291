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

#ifndef DEXPREOPT_LIBDEXPREOPTBASE_ARCH_TARGET_H_
#define DEXPREOPT_LIBDEXPREOPTBASE_ARCH_TARGET_H_

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "android-base/result.h"

namespace dexpreopt {

enum class ArchType : uint8_t {
  kArm,
  kArm64,
  kRiscv64,
  kX86,
  kX86_64,
};

enum class OsClass : uint8_t {
  kDevice,
  kHost,
};

enum class OsType : uint8_t {
  kAndroid,
  kLinuxGlibc,
  kLinuxMusl,
  kLinuxBionic,
  kDarwin,
  kWindows,
};

// Whether a target is only reachable through native bridge emulation (e.g. arm code running on an
// x86 device).
enum class NativeBridge : uint8_t {
  kDisabled,
  kEnabled,
};

// One entry of the build's architecture/OS target matrix.
struct Target {
  OsType os = OsType::kAndroid;
  ArchType arch = ArchType::kArm;
  NativeBridge native_bridge = NativeBridge::kDisabled;

  bool operator==(const Target& other) const {
    return os == other.os && arch == other.arch && native_bridge == other.native_bridge;
  }
  bool operator!=(const Target& other) const { return !(*this == other); }
};

// Returns the name used for `arch` in output paths, e.g. "arm64".
const char* GetArchTypeString(ArchType arch);

android::base::Result<ArchType> GetArchTypeFromString(std::string_view arch);

// Returns the name used for `os` in output paths, e.g. "android" or "linux_glibc".
const char* GetOsTypeString(OsType os);

android::base::Result<OsType> GetOsTypeFromString(std::string_view os);

OsClass GetOsClass(OsType os);

// Returns a human readable name such as "android_arm64" or "android_arm_native_bridge".
std::string GetTargetString(const Target& target);

std::ostream& operator<<(std::ostream& os, ArchType rhs);
std::ostream& operator<<(std::ostream& os, OsType rhs);
std::ostream& operator<<(std::ostream& os, const Target& rhs);

}  // namespace dexpreopt

#endif  // DEXPREOPT_LIBDEXPREOPTBASE_ARCH_TARGET_H_
