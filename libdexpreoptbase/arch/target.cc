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

#include "target.h"

#include <ostream>
#include <string>
#include <string_view>

#include "android-base/logging.h"
#include "android-base/result.h"
#include "base/macros.h"

namespace dexpreopt {

namespace {

using ::android::base::Errorf;
using ::android::base::Result;

constexpr ArchType kAllArchTypes[] = {
    ArchType::kArm, ArchType::kArm64, ArchType::kRiscv64, ArchType::kX86, ArchType::kX86_64};

constexpr OsType kAllOsTypes[] = {OsType::kAndroid,
                                  OsType::kLinuxGlibc,
                                  OsType::kLinuxMusl,
                                  OsType::kLinuxBionic,
                                  OsType::kDarwin,
                                  OsType::kWindows};

}  // namespace

const char* GetArchTypeString(ArchType arch) {
  switch (arch) {
    case ArchType::kArm:
      return "arm";
    case ArchType::kArm64:
      return "arm64";
    case ArchType::kRiscv64:
      return "riscv64";
    case ArchType::kX86:
      return "x86";
    case ArchType::kX86_64:
      return "x86_64";
      // No default. All cases should be explicitly handled, or the compilation will fail.
  }
  LOG(FATAL) << "Unknown arch type " << static_cast<int>(arch);
  UNREACHABLE();
}

Result<ArchType> GetArchTypeFromString(std::string_view arch) {
  for (ArchType value : kAllArchTypes) {
    if (arch == GetArchTypeString(value)) {
      return value;
    }
  }
  return Errorf("Unknown arch '{}'", arch);
}

const char* GetOsTypeString(OsType os) {
  switch (os) {
    case OsType::kAndroid:
      return "android";
    case OsType::kLinuxGlibc:
      return "linux_glibc";
    case OsType::kLinuxMusl:
      return "linux_musl";
    case OsType::kLinuxBionic:
      return "linux_bionic";
    case OsType::kDarwin:
      return "darwin";
    case OsType::kWindows:
      return "windows";
      // No default. All cases should be explicitly handled, or the compilation will fail.
  }
  LOG(FATAL) << "Unknown OS type " << static_cast<int>(os);
  UNREACHABLE();
}

Result<OsType> GetOsTypeFromString(std::string_view os) {
  for (OsType value : kAllOsTypes) {
    if (os == GetOsTypeString(value)) {
      return value;
    }
  }
  return Errorf("Unknown OS '{}'", os);
}

OsClass GetOsClass(OsType os) {
  return os == OsType::kAndroid ? OsClass::kDevice : OsClass::kHost;
}

std::string GetTargetString(const Target& target) {
  return DEXPREOPT_FORMAT("{}_{}{}",
                          GetOsTypeString(target.os),
                          GetArchTypeString(target.arch),
                          target.native_bridge == NativeBridge::kEnabled ? "_native_bridge" : "");
}

std::ostream& operator<<(std::ostream& os, ArchType rhs) { return os << GetArchTypeString(rhs); }

std::ostream& operator<<(std::ostream& os, OsType rhs) { return os << GetOsTypeString(rhs); }

std::ostream& operator<<(std::ostream& os, const Target& rhs) {
  return os << GetTargetString(rhs);
}

}  // namespace dexpreopt
