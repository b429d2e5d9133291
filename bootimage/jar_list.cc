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

#include "jar_list.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "android-base/logging.h"
#include "android-base/result.h"
#include "android-base/strings.h"
#include "arch/target.h"
#include "base/file_utils.h"
#include "base/macros.h"
#include "global_config.h"

namespace dexpreopt {
namespace bootimage {

namespace {

using ::android::base::Errorf;
using ::android::base::Result;
using ::android::base::Split;
using ::android::base::Trim;

// Returns the directory that contains the jars of `apex`, relative to the root of the target.
std::string InstallSubdir(const std::string& apex) {
  if (apex == kPlatformApex) {
    return "system/framework";
  }
  if (apex == kSystemExtApex) {
    return "system_ext/framework";
  }
  return JoinPath({"apex", apex, "javalib"});
}

}  // namespace

std::string ModuleStem(std::string_view module) {
  // The stem of framework-minus-apex is framework. The module is renamed at build time and the
  // stem cannot be queried before the modules are processed.
  if (module == "framework-minus-apex") {
    return "framework";
  }
  return std::string(module);
}

const std::string& ConfiguredJarList::Apex(size_t index) const {
  CHECK_LT(index, apexes_.size());
  return apexes_[index];
}

const std::string& ConfiguredJarList::Jar(size_t index) const {
  CHECK_LT(index, jars_.size());
  return jars_[index];
}

bool ConfiguredJarList::Contains(std::string_view apex, std::string_view jar) const {
  for (size_t i = 0; i < jars_.size(); i++) {
    if (apexes_[i] == apex && jars_[i] == jar) {
      return true;
    }
  }
  return false;
}

bool ConfiguredJarList::ContainsJar(std::string_view jar) const {
  for (const std::string& j : jars_) {
    if (j == jar) {
      return true;
    }
  }
  return false;
}

bool ConfiguredJarList::Append(std::string_view apex, std::string_view jar) {
  if (Contains(apex, jar)) {
    return false;
  }
  apexes_.emplace_back(apex);
  jars_.emplace_back(jar);
  return true;
}

ConfiguredJarList ConfiguredJarList::AppendList(const ConfiguredJarList& other) const {
  ConfiguredJarList result = *this;
  for (size_t i = 0; i < other.Len(); i++) {
    result.Append(other.apexes_[i], other.jars_[i]);
  }
  return result;
}

ConfiguredJarList ConfiguredJarList::RemoveList(const ConfiguredJarList& other) const {
  ConfiguredJarList result;
  for (size_t i = 0; i < jars_.size(); i++) {
    if (!other.Contains(apexes_[i], jars_[i])) {
      result.apexes_.push_back(apexes_[i]);
      result.jars_.push_back(jars_[i]);
    }
  }
  return result;
}

std::vector<std::string> ConfiguredJarList::BuildPaths(std::string_view dir) const {
  std::vector<std::string> paths;
  paths.reserve(jars_.size());
  for (size_t i = 0; i < jars_.size(); i++) {
    paths.push_back(JoinPath({dir, apexes_[i], ModuleStem(jars_[i]) + ".jar"}));
  }
  return paths;
}

std::vector<std::string> ConfiguredJarList::DevicePaths(const GlobalConfig& config,
                                                        OsType os) const {
  std::string root = GetOsClass(os) == OsClass::kHost ? config.GetHostOutDir() : "/";
  std::vector<std::string> paths;
  paths.reserve(jars_.size());
  for (size_t i = 0; i < jars_.size(); i++) {
    paths.push_back(JoinPath({root, InstallSubdir(apexes_[i]), ModuleStem(jars_[i]) + ".jar"}));
  }
  return paths;
}

std::vector<std::string> ConfiguredJarList::CopyOfApexJarPairs() const {
  std::vector<std::string> pairs;
  pairs.reserve(jars_.size());
  for (size_t i = 0; i < jars_.size(); i++) {
    pairs.push_back(apexes_[i] + ":" + jars_[i]);
  }
  return pairs;
}

Result<ConfiguredJarList> ParseConfiguredJarList(std::string_view list) {
  ConfiguredJarList result;
  std::string trimmed = Trim(std::string(list));
  if (trimmed.empty()) {
    return result;
  }
  for (const std::string& item : Split(trimmed, ",")) {
    std::string pair = Trim(item);
    size_t colon = pair.find(':');
    if (colon == std::string::npos || colon == 0 || colon == pair.size() - 1 ||
        pair.find(':', colon + 1) != std::string::npos) {
      return Errorf("malformed (apex, jar) pair: '{}', expected format: <apex>:<jar>", pair);
    }
    if (!result.Append(pair.substr(0, colon), pair.substr(colon + 1))) {
      LOG(WARNING) << DEXPREOPT_FORMAT("Ignoring repeated jar '{}'", pair);
    }
  }
  return result;
}

}  // namespace bootimage
}  // namespace dexpreopt
