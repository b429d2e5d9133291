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

#ifndef DEXPREOPT_BOOTIMAGE_TESTING_H_
#define DEXPREOPT_BOOTIMAGE_TESTING_H_

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "global_config.h"
#include "jar_list.h"

// Returns the value of the given `android::base::Result`, or fails the GoogleTest.
#define OR_FAIL(expr)                                   \
  ({                                                    \
    auto&& tmp__ = (expr);                              \
    ASSERT_TRUE(tmp__.ok()) << tmp__.error().message(); \
    std::move(tmp__).value();                           \
  })

namespace dexpreopt {
namespace bootimage {
namespace testing {

static constexpr const char* kTestDeviceName = "generic_arm64";

// Returns the Core Libraries, each paired with the APEX it is installed from. This starts with the
// jars that go into the primary boot image.
ConfiguredJarList GetLibCoreModules(bool core_only);

// Parses a list in the format of `ParseConfiguredJarList`. Aborts on malformed input.
ConfiguredJarList MakeJarList(std::string_view list);

// Fills `config` with a small but complete configuration: two ART APEX jars, two more boot jars
// on the system partition, one updatable boot jar, and system server jars from both the system
// partition and an updatable APEX. The targets are arm64 on device and x86_64 on the host.
void PopulateGlobalConfig(GlobalConfig* config);

}  // namespace testing
}  // namespace bootimage
}  // namespace dexpreopt

#endif  // DEXPREOPT_BOOTIMAGE_TESTING_H_
