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

#include "testing.h"

#include <string>
#include <string_view>
#include <vector>

#include "android-base/logging.h"
#include "android-base/result.h"
#include "arch/target.h"
#include "base/file_utils.h"
#include "global_config.h"
#include "jar_list.h"

namespace dexpreopt {
namespace bootimage {
namespace testing {

namespace {

std::string GetApexName(const std::string& jar) {
  if (jar == "conscrypt") {
    return "com.android.conscrypt";
  }
  if (jar == "core-icu4j") {
    return "com.android.i18n";
  }
  return kAndroidArtApexName;
}

}  // namespace

ConfiguredJarList GetLibCoreModules(bool core_only) {
  // Modules of the primary boot image.
  std::vector<std::string> jars{
      "core-oj",
      "core-libart",
      "okhttp",
      "bouncycastle",
      "apache-xml",
  };

  // Additional modules.
  if (!core_only) {
    jars.push_back("core-icu4j");
    jars.push_back("conscrypt");
  }

  ConfiguredJarList modules;
  for (const std::string& jar : jars) {
    modules.Append(GetApexName(jar), jar);
  }
  return modules;
}

ConfiguredJarList MakeJarList(std::string_view list) {
  android::base::Result<ConfiguredJarList> jars = ParseConfiguredJarList(list);
  CHECK(jars.ok()) << jars.error().message();
  return jars.value();
}

void PopulateGlobalConfig(GlobalConfig* config) {
  config->SetDeviceName(kTestDeviceName);
  config->SetArtApexJars(MakeJarList("com.android.art:core-oj,com.android.art:core-libart"));
  config->SetBootJars(MakeJarList(
      "com.android.art:core-oj,com.android.art:core-libart,platform:framework,platform:services"));
  config->SetUpdatableBootJars(MakeJarList("com.android.wifi:framework-wifi"));
  config->SetSystemServerJars(MakeJarList("platform:services,system_ext:ethernet-service"));
  config->SetUpdatableSystemServerJars(MakeJarList("com.android.permission:service-permission"));
  config->SetTargets({
      Target{.os = OsType::kAndroid, .arch = ArchType::kArm64},
      Target{.os = OsType::kLinuxGlibc, .arch = ArchType::kX86_64},
  });
  config->SetBuildOs(OsType::kLinuxGlibc);
}

}  // namespace testing
}  // namespace bootimage
}  // namespace dexpreopt
