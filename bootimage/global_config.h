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

#ifndef DEXPREOPT_BOOTIMAGE_GLOBAL_CONFIG_H_
#define DEXPREOPT_BOOTIMAGE_GLOBAL_CONFIG_H_

#include <string>
#include <string_view>
#include <vector>

#include "android-base/logging.h"
#include "android-base/result.h"
#include "arch/target.h"
#include "base/file_utils.h"
#include "base/macros.h"
#include "base/once.h"
#include "jar_list.h"

namespace dexpreopt {
namespace bootimage {

static constexpr const char* kDefaultOutDir = "out/soong";
static constexpr const char* kDefaultHostOutDir = "out/host/linux-x86";

// The global dexpreopt configuration of one build invocation. It is loaded once, before any
// boot image config is derived, and is read-only afterwards.
class GlobalConfig final {
 private:
  std::string device_name_;
  std::string out_dir_ = kDefaultOutDir;
  std::string host_out_dir_ = kDefaultHostOutDir;

  // Jars in the ART APEX. They make up the primary boot image.
  ConfiguredJarList art_apex_jars_;
  // All jars on the boot classpath that go into the boot image, including `art_apex_jars_`.
  ConfiguredJarList boot_jars_;
  // Boot classpath jars from updatable APEXes. They are never compiled into the boot image.
  ConfiguredJarList updatable_boot_jars_;
  // Jars on the system server classpath that are not from updatable APEXes.
  ConfiguredJarList system_server_jars_;
  // Jars on the system server classpath that come from updatable APEXes. Disjoint from
  // `system_server_jars_`.
  ConfiguredJarList updatable_system_server_jars_;

  // The architecture/OS target matrix of the build, in configuration order.
  std::vector<Target> targets_;
  // The OS the build runs on.
  OsType build_os_ = OsType::kLinuxGlibc;

  // Values derived from this config. Tied to the config so that they are never read back for
  // another one.
  mutable OnceCache once_cache_;

 public:
  GlobalConfig() = default;

  const std::string& GetDeviceName() const { return device_name_; }
  const std::string& GetOutDir() const { return out_dir_; }
  const std::string& GetHostOutDir() const { return host_out_dir_; }

  // Returns the output directory for files specific to the device being built.
  std::string GetDeviceDir() const { return JoinPath({out_dir_, device_name_}); }

  const ConfiguredJarList& GetArtApexJars() const { return art_apex_jars_; }
  const ConfiguredJarList& GetBootJars() const { return boot_jars_; }
  const ConfiguredJarList& GetUpdatableBootJars() const { return updatable_boot_jars_; }
  const ConfiguredJarList& GetSystemServerJars() const { return system_server_jars_; }
  const ConfiguredJarList& GetUpdatableSystemServerJars() const {
    return updatable_system_server_jars_;
  }

  const std::vector<Target>& GetTargets() const { return targets_; }
  OsType GetBuildOs() const { return build_os_; }

  OnceCache& GetOnceCache() const { return once_cache_; }

  void SetDeviceName(const std::string& device_name) {
    CheckNotDerived();
    device_name_ = device_name;
  }
  void SetOutDir(const std::string& out_dir) {
    CheckNotDerived();
    out_dir_ = out_dir;
  }
  void SetHostOutDir(const std::string& host_out_dir) {
    CheckNotDerived();
    host_out_dir_ = host_out_dir;
  }

  void SetArtApexJars(const ConfiguredJarList& jars) {
    CheckNotDerived();
    art_apex_jars_ = jars;
  }
  void SetBootJars(const ConfiguredJarList& jars) {
    CheckNotDerived();
    boot_jars_ = jars;
  }
  void SetUpdatableBootJars(const ConfiguredJarList& jars) {
    CheckNotDerived();
    updatable_boot_jars_ = jars;
  }
  void SetSystemServerJars(const ConfiguredJarList& jars) {
    CheckNotDerived();
    system_server_jars_ = jars;
  }
  void SetUpdatableSystemServerJars(const ConfiguredJarList& jars) {
    CheckNotDerived();
    updatable_system_server_jars_ = jars;
  }

  void SetTargets(const std::vector<Target>& targets) {
    CheckNotDerived();
    targets_ = targets;
  }
  void SetBuildOs(OsType os) {
    CheckNotDerived();
    build_os_ = os;
  }

 private:
  // Derived values are cached, so the config cannot change once the first one is computed.
  void CheckNotDerived() const {
    CHECK_EQ(once_cache_.Size(), 0u) << "GlobalConfig modified after values were derived from it";
  }

  DISALLOW_COPY_AND_ASSIGN(GlobalConfig);
};

// Everything a derivation needs: the global config, and the cache of the values derived from it.
// Cheap to copy. The config must outlive the context.
class DexpreoptContext {
 public:
  explicit DexpreoptContext(const GlobalConfig& config) : config_(config) {}

  const GlobalConfig& Config() const { return config_; }
  OnceCache& Cache() const { return config_.GetOnceCache(); }

 private:
  const GlobalConfig& config_;
};

// Parses a target in the form of "<os>:<arch>" or "<os>:<arch>:native_bridge", e.g.
// "android:arm64".
android::base::Result<Target> ParseTarget(std::string_view target);

// Parses a comma-separated list of targets. See `ParseTarget`.
android::base::Result<std::vector<Target>> ParseTargetList(std::string_view list);

}  // namespace bootimage
}  // namespace dexpreopt

#endif  // DEXPREOPT_BOOTIMAGE_GLOBAL_CONFIG_H_
