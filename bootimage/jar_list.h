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

#ifndef DEXPREOPT_BOOTIMAGE_JAR_LIST_H_
#define DEXPREOPT_BOOTIMAGE_JAR_LIST_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "android-base/result.h"
#include "arch/target.h"

namespace dexpreopt {
namespace bootimage {

class GlobalConfig;

// Namespace of jars installed on the system partition.
static constexpr const char* kPlatformApex = "platform";
// Namespace of jars installed on the system_ext partition.
static constexpr const char* kSystemExtApex = "system_ext";

// Returns the file stem of a jar module. The stem of "framework-minus-apex" is "framework"; every
// other module is its own stem.
std::string ModuleStem(std::string_view module);

// An ordered list of (apex, jar) pairs. The apex is the namespace the jar is installed from: an
// APEX name, or one of `kPlatformApex` and `kSystemExtApex`. Pairs are unique, and their order is
// the order on the classpath.
class ConfiguredJarList {
 public:
  ConfiguredJarList() = default;

  size_t Len() const { return jars_.size(); }
  bool IsEmpty() const { return jars_.empty(); }

  const std::string& Apex(size_t index) const;
  const std::string& Jar(size_t index) const;

  bool Contains(std::string_view apex, std::string_view jar) const;

  // Returns true if any pair has `jar` as its module, whatever the apex.
  bool ContainsJar(std::string_view jar) const;

  // Adds the pair to the end of the list. Returns false and leaves the list unchanged if the
  // pair is already in the list.
  bool Append(std::string_view apex, std::string_view jar);

  // Returns the pairs of this list followed by the pairs of `other` that are not in this list.
  ConfiguredJarList AppendList(const ConfiguredJarList& other) const;

  // Returns the pairs of this list that are not in `other`, in their original order.
  ConfiguredJarList RemoveList(const ConfiguredJarList& other) const;

  // Returns a path under `dir` for each pair, in list order: "<dir>/<apex>/<stem>.jar".
  std::vector<std::string> BuildPaths(std::string_view dir) const;

  // Returns the location of each jar on a target running `os`, in list order. Jars are in
  // /system/framework, /system_ext/framework or /apex/<apex>/javalib on device, and in the same
  // layout under the host output directory of `config` on host.
  std::vector<std::string> DevicePaths(const GlobalConfig& config, OsType os) const;

  std::vector<std::string> CopyOfJars() const { return jars_; }

  // Returns "<apex>:<jar>" for each pair.
  std::vector<std::string> CopyOfApexJarPairs() const;

  bool operator==(const ConfiguredJarList& other) const {
    return apexes_ == other.apexes_ && jars_ == other.jars_;
  }
  bool operator!=(const ConfiguredJarList& other) const { return !(*this == other); }

 private:
  std::vector<std::string> apexes_;
  std::vector<std::string> jars_;
};

// Parses a comma-separated list of "<apex>:<jar>" pairs, such as
// "com.android.art:core-oj,platform:framework". Each pair has exactly one colon. Repeated pairs
// are dropped.
android::base::Result<ConfiguredJarList> ParseConfiguredJarList(std::string_view list);

}  // namespace bootimage
}  // namespace dexpreopt

#endif  // DEXPREOPT_BOOTIMAGE_JAR_LIST_H_
