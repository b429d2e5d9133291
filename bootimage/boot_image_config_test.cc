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

#include "boot_image_config.h"

#include <string>
#include <thread>
#include <vector>

#include "android-base/logging.h"
#include "android-base/result-gmock.h"
#include "arch/target.h"
#include "base/once.h"
#include "global_config.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "jar_list.h"
#include "testing.h"

namespace dexpreopt {
namespace bootimage {
namespace {

using ::android::base::testing::HasError;
using ::android::base::testing::WithMessage;
using ::dexpreopt::bootimage::testing::MakeJarList;
using ::testing::ElementsAre;
using ::testing::Each;
using ::testing::Eq;
using ::testing::IsEmpty;

constexpr Target kArm64{.os = OsType::kAndroid, .arch = ArchType::kArm64};
constexpr Target kHostX86_64{.os = OsType::kLinuxGlibc, .arch = ArchType::kX86_64};

class BootImageConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { testing::PopulateGlobalConfig(&config_); }

  const BootImageConfig* Art() { return OrDie(ArtBootImageConfig(ctx_)); }
  const BootImageConfig* Framework() { return OrDie(DefaultBootImageConfig(ctx_)); }

  static const BootImageConfig* OrDie(android::base::Result<const BootImageConfig*> config) {
    CHECK(config.ok()) << config.error().message();
    return config.value();
  }

  GlobalConfig config_;
  DexpreoptContext ctx_{config_};
};

TEST_F(BootImageConfigTest, ArtConfig) {
  const BootImageConfig* art = Art();

  EXPECT_EQ(art->name, "art");
  EXPECT_EQ(art->stem, "boot");
  EXPECT_EQ(art->extends, nullptr);
  EXPECT_EQ(art->install_dir_on_host, "apex/art_boot_images/javalib");
  EXPECT_THAT(art->modules.CopyOfJars(), ElementsAre("core-oj", "core-libart"));
  EXPECT_EQ(art->dir, "out/soong/generic_arm64/dex_artjars");
  EXPECT_EQ(art->symbols_dir, "out/soong/generic_arm64/dex_artjars_unstripped");
  EXPECT_EQ(art->zip, "out/soong/generic_arm64/dex_artjars/art.zip");
  EXPECT_THAT(
      art->dex_paths,
      ElementsAre("out/soong/generic_arm64/dex_artjars_input/com.android.art/core-oj.jar",
                  "out/soong/generic_arm64/dex_artjars_input/com.android.art/core-libart.jar"));
  EXPECT_EQ(art->dex_paths_deps, art->dex_paths);
}

TEST_F(BootImageConfigTest, FrameworkConfig) {
  const BootImageConfig* framework = Framework();

  EXPECT_EQ(framework->name, "boot");
  EXPECT_EQ(framework->stem, "boot");
  EXPECT_EQ(framework->extends, Art());
  EXPECT_EQ(framework->install_dir_on_host, "system/framework");
  EXPECT_THAT(framework->modules.CopyOfApexJarPairs(),
              ElementsAre("platform:framework", "platform:services"));
  EXPECT_EQ(framework->dir, "out/soong/generic_arm64/dex_bootjars");
  EXPECT_EQ(framework->symbols_dir, "out/soong/generic_arm64/dex_bootjars_unstripped");
  EXPECT_EQ(framework->zip, "out/soong/generic_arm64/dex_bootjars/boot.zip");
  EXPECT_THAT(framework->dex_paths,
              ElementsAre("out/soong/generic_arm64/dex_bootjars_input/platform/framework.jar",
                          "out/soong/generic_arm64/dex_bootjars_input/platform/services.jar"));
}

TEST_F(BootImageConfigTest, ModulesPartitionBootJars) {
  const BootImageConfig* art = Art();
  const BootImageConfig* framework = Framework();

  for (size_t i = 0; i < framework->modules.Len(); i++) {
    EXPECT_FALSE(art->modules.Contains(framework->modules.Apex(i), framework->modules.Jar(i)));
  }
  EXPECT_EQ(art->modules.AppendList(framework->modules), config_.GetBootJars());
}

TEST_F(BootImageConfigTest, ExtensionModulesKeepBootJarOrder) {
  config_.SetBootJars(MakeJarList(
      "platform:ext,com.android.art:core-oj,platform:framework,com.android.art:core-libart"));

  EXPECT_THAT(Framework()->modules.CopyOfJars(), ElementsAre("ext", "framework"));
}

TEST_F(BootImageConfigTest, DexPathsDeps) {
  const BootImageConfig* art = Art();
  const BootImageConfig* framework = Framework();

  std::vector<std::string> expected = art->dex_paths_deps;
  expected.insert(expected.end(), framework->dex_paths.begin(), framework->dex_paths.end());
  EXPECT_EQ(framework->dex_paths_deps, expected);
}

TEST_F(BootImageConfigTest, Variants) {
  for (const BootImageConfig* config : {Art(), Framework()}) {
    ASSERT_EQ(config->variants.size(), 2u);
    EXPECT_EQ(config->variants[0].target, kArm64);
    EXPECT_EQ(config->variants[1].target, kHostX86_64);
    for (const BootImageVariant& variant : config->variants) {
      EXPECT_EQ(variant.config, config);
    }
  }
}

TEST_F(BootImageConfigTest, ArtVariants) {
  const BootImageConfig* art = Art();
  ASSERT_EQ(art->variants.size(), 2u);

  const BootImageVariant& device = art->variants[0];
  EXPECT_EQ(device.image_path_on_host,
            "out/soong/generic_arm64/dex_artjars/android/apex/art_boot_images/javalib/arm64/"
            "boot.art");
  EXPECT_THAT(
      device.images_deps,
      ElementsAre("out/soong/generic_arm64/dex_artjars/android/apex/art_boot_images/javalib/arm64/"
                  "boot.art",
                  "out/soong/generic_arm64/dex_artjars/android/apex/art_boot_images/javalib/arm64/"
                  "boot.oat",
                  "out/soong/generic_arm64/dex_artjars/android/apex/art_boot_images/javalib/arm64/"
                  "boot.vdex",
                  "out/soong/generic_arm64/dex_artjars/android/apex/art_boot_images/javalib/arm64/"
                  "boot-core-libart.art",
                  "out/soong/generic_arm64/dex_artjars/android/apex/art_boot_images/javalib/arm64/"
                  "boot-core-libart.oat",
                  "out/soong/generic_arm64/dex_artjars/android/apex/art_boot_images/javalib/arm64/"
                  "boot-core-libart.vdex"));
  EXPECT_THAT(device.dex_locations,
              ElementsAre("/apex/com.android.art/javalib/core-oj.jar",
                          "/apex/com.android.art/javalib/core-libart.jar"));
  EXPECT_EQ(device.dex_locations_deps, device.dex_locations);
  EXPECT_THAT(device.primary_images, IsEmpty());

  const BootImageVariant& host = art->variants[1];
  EXPECT_EQ(host.image_path_on_host,
            "out/soong/generic_arm64/dex_artjars/linux_glibc/apex/art_boot_images/javalib/x86_64/"
            "boot.art");
  EXPECT_THAT(host.dex_locations,
              ElementsAre("out/host/linux-x86/apex/com.android.art/javalib/core-oj.jar",
                          "out/host/linux-x86/apex/com.android.art/javalib/core-libart.jar"));
}

TEST_F(BootImageConfigTest, FrameworkVariants) {
  const BootImageConfig* art = Art();
  const BootImageConfig* framework = Framework();
  ASSERT_EQ(framework->variants.size(), 2u);

  const BootImageVariant& device = framework->variants[0];
  EXPECT_EQ(device.image_path_on_host,
            "out/soong/generic_arm64/dex_bootjars/android/system/framework/arm64/"
            "boot-framework.art");
  EXPECT_THAT(device.images_deps,
              ElementsAre("out/soong/generic_arm64/dex_bootjars/android/system/framework/arm64/"
                          "boot-framework.art",
                          "out/soong/generic_arm64/dex_bootjars/android/system/framework/arm64/"
                          "boot-framework.oat",
                          "out/soong/generic_arm64/dex_bootjars/android/system/framework/arm64/"
                          "boot-framework.vdex",
                          "out/soong/generic_arm64/dex_bootjars/android/system/framework/arm64/"
                          "boot-services.art",
                          "out/soong/generic_arm64/dex_bootjars/android/system/framework/arm64/"
                          "boot-services.oat",
                          "out/soong/generic_arm64/dex_bootjars/android/system/framework/arm64/"
                          "boot-services.vdex"));
  EXPECT_THAT(device.dex_locations,
              ElementsAre("/system/framework/framework.jar", "/system/framework/services.jar"));
  EXPECT_THAT(device.dex_locations_deps,
              ElementsAre("/apex/com.android.art/javalib/core-oj.jar",
                          "/apex/com.android.art/javalib/core-libart.jar",
                          "/system/framework/framework.jar",
                          "/system/framework/services.jar"));
  EXPECT_EQ(device.primary_images, art->variants[0].image_path_on_host);

  const BootImageVariant& host = framework->variants[1];
  EXPECT_EQ(host.image_path_on_host,
            "out/soong/generic_arm64/dex_bootjars/linux_glibc/system/framework/x86_64/"
            "boot-framework.art");
  EXPECT_EQ(host.primary_images, art->variants[1].image_path_on_host);
  EXPECT_THAT(host.dex_locations_deps,
              ElementsAre("out/host/linux-x86/apex/com.android.art/javalib/core-oj.jar",
                          "out/host/linux-x86/apex/com.android.art/javalib/core-libart.jar",
                          "out/host/linux-x86/system/framework/framework.jar",
                          "out/host/linux-x86/system/framework/services.jar"));
}

TEST_F(BootImageConfigTest, ExcludesNativeBridgeTargets) {
  config_.SetTargets({kArm64,
                      Target{.os = OsType::kAndroid,
                             .arch = ArchType::kX86_64,
                             .native_bridge = NativeBridge::kEnabled},
                      kHostX86_64});

  for (const BootImageConfig* config : {Art(), Framework()}) {
    ASSERT_EQ(config->variants.size(), 2u);
    EXPECT_EQ(config->variants[0].target, kArm64);
    EXPECT_EQ(config->variants[1].target, kHostX86_64);
  }
}

TEST_F(BootImageConfigTest, NoTargets) {
  config_.SetTargets({});

  EXPECT_THAT(Art()->variants, IsEmpty());
  EXPECT_THAT(Framework()->variants, IsEmpty());
  EXPECT_EQ(Framework()->GetAnyAndroidVariant(), nullptr);
}

TEST_F(BootImageConfigTest, GetAnyAndroidVariant) {
  config_.SetTargets({kHostX86_64, kArm64});

  const BootImageVariant* variant = Framework()->GetAnyAndroidVariant();
  ASSERT_NE(variant, nullptr);
  EXPECT_EQ(variant->target, kArm64);
}

TEST_F(BootImageConfigTest, ModuleNames) {
  const BootImageConfig* art = Art();
  const BootImageConfig* framework = Framework();

  EXPECT_EQ(art->ModuleName(0), "boot");
  EXPECT_EQ(art->ModuleName(1), "boot-core-libart");
  EXPECT_EQ(art->FirstModuleNameOrStem(), "boot");
  EXPECT_EQ(framework->ModuleName(0), "boot-framework");
  EXPECT_EQ(framework->ModuleName(1), "boot-services");
  EXPECT_EQ(framework->FirstModuleNameOrStem(), "boot-framework");
}

TEST_F(BootImageConfigTest, ModuleNameUsesStem) {
  config_.SetBootJars(MakeJarList(
      "com.android.art:core-oj,com.android.art:core-libart,platform:framework-minus-apex"));

  EXPECT_EQ(Framework()->ModuleName(0), "boot-framework");
  EXPECT_THAT(Framework()->dex_paths,
              ElementsAre("out/soong/generic_arm64/dex_bootjars_input/platform/framework.jar"));
}

TEST_F(BootImageConfigTest, EmptyExtension) {
  config_.SetBootJars(config_.GetArtApexJars());

  const BootImageConfig* framework = Framework();
  EXPECT_TRUE(framework->modules.IsEmpty());
  EXPECT_EQ(framework->FirstModuleNameOrStem(), "boot");
  EXPECT_EQ(framework->dex_paths_deps, Art()->dex_paths_deps);
  EXPECT_THAT(framework->variants[0].images_deps, IsEmpty());
  EXPECT_EQ(framework->variants[0].dex_locations_deps, Art()->variants[0].dex_locations_deps);
}

TEST_F(BootImageConfigTest, GetByName) {
  const BootImageConfigs* configs = OR_FAIL(GenBootImageConfigs(ctx_));

  EXPECT_EQ(configs->Get("art"), configs->art.get());
  EXPECT_EQ(configs->Get("boot"), configs->framework.get());
  EXPECT_EQ(configs->Get("apex"), nullptr);
}

TEST_F(BootImageConfigTest, WrongNumberOfBootJars) {
  // An ART APEX jar that is not a boot jar.
  config_.SetArtApexJars(
      MakeJarList("com.android.art:core-oj,com.android.art:core-libart,com.android.art:okhttp"));

  EXPECT_THAT(GenBootImageConfigs(ctx_),
              HasError(WithMessage("wrong number of boot image jars, got 5, expected 4")));
  EXPECT_THAT(ArtBootImageConfig(ctx_),
              HasError(WithMessage("wrong number of boot image jars, got 5, expected 4")));
  EXPECT_THAT(DefaultBootImageConfig(ctx_),
              HasError(WithMessage("wrong number of boot image jars, got 5, expected 4")));
}

TEST_F(BootImageConfigTest, ComputedOnce) {
  const BootImageConfigs* first = OR_FAIL(GenBootImageConfigs(ctx_));
  const BootImageConfigs* second = OR_FAIL(GenBootImageConfigs(DexpreoptContext(config_)));

  EXPECT_EQ(first, second);
}

TEST_F(BootImageConfigTest, ConfigIsFrozenOnceDerived) {
  ASSERT_TRUE(GenBootImageConfigs(ctx_).ok());

  EXPECT_DEATH(config_.SetBootJars(config_.GetArtApexJars()), "modified after values were derived");
}

TEST_F(BootImageConfigTest, ConcurrentCallersShareConfigs) {
  constexpr int kThreads = 8;
  std::vector<const BootImageConfig*> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&, i]() { results[i] = OrDie(DefaultBootImageConfig(ctx_)); });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  EXPECT_THAT(results, Each(Eq(Framework())));
}

TEST_F(BootImageConfigTest, ConfigsDoNotShareDerivedValues) {
  GlobalConfig other_config;
  testing::PopulateGlobalConfig(&other_config);
  other_config.SetDeviceName("generic_x86_64");
  other_config.SetBootJars(other_config.GetArtApexJars());
  DexpreoptContext other_ctx(other_config);

  // Derive from this config first, so that a shared cache would hand its values to the other.
  const BootImageConfig* framework = Framework();
  const BootImageConfig* other = OrDie(DefaultBootImageConfig(other_ctx));

  EXPECT_NE(other, framework);
  EXPECT_EQ(other->dir, "out/soong/generic_x86_64/dex_bootjars");
  EXPECT_TRUE(other->modules.IsEmpty());
  EXPECT_EQ(framework->modules.Len(), 2u);
}

TEST_F(BootImageConfigTest, UpdatableBootConfig) {
  const UpdatableBootConfig& updatable = GetUpdatableBootConfig(ctx_);

  EXPECT_THAT(updatable.modules.CopyOfApexJarPairs(),
              ElementsAre("com.android.wifi:framework-wifi"));
  EXPECT_THAT(updatable.dex_paths,
              ElementsAre("out/soong/generic_arm64/updatable_bootjars/com.android.wifi/"
                          "framework-wifi.jar"));
  EXPECT_THAT(updatable.dex_locations,
              ElementsAre("/apex/com.android.wifi/javalib/framework-wifi.jar"));
  EXPECT_EQ(&GetUpdatableBootConfig(ctx_), &updatable);
}

TEST(BootImageVariantTest, Defaults) {
  BootImageVariant variant;
  EXPECT_EQ(variant.config, nullptr);
  EXPECT_EQ(variant.target, Target());
  EXPECT_THAT(variant.images_deps, IsEmpty());
}

TEST(ExpandVariantsTest, OneVariantPerTarget) {
  GlobalConfig global;
  BootImageConfig config;
  config.name = "apex";
  config.stem = "boot";
  config.install_dir_on_host = "apex/com.android.foo/javalib";
  config.dir = "out/dex_apexjars";
  config.modules = MakeJarList("com.android.foo:foo,com.android.foo:bar");

  std::vector<Target> targets{
      kArm64, Target{.os = OsType::kAndroid, .arch = ArchType::kArm}, kHostX86_64};
  std::vector<BootImageVariant> variants = ExpandVariants(config, targets, global);

  ASSERT_EQ(variants.size(), targets.size());
  for (size_t i = 0; i < targets.size(); i++) {
    EXPECT_EQ(variants[i].target, targets[i]);
    EXPECT_EQ(variants[i].config, &config);
    EXPECT_THAT(variants[i].primary_images, IsEmpty());
    EXPECT_EQ(variants[i].images_deps.size(), 6u);
  }
  EXPECT_EQ(variants[1].image_path_on_host,
            "out/dex_apexjars/android/apex/com.android.foo/javalib/arm/boot.art");
  EXPECT_THAT(variants[1].dex_locations,
              ElementsAre("/apex/com.android.foo/javalib/foo.jar",
                          "/apex/com.android.foo/javalib/bar.jar"));
}

TEST(ExpandVariantsTest, NoTargets) {
  GlobalConfig global;
  BootImageConfig config;
  config.stem = "boot";
  config.modules = MakeJarList("platform:framework");

  EXPECT_THAT(ExpandVariants(config, {}, global), IsEmpty());
}

}  // namespace
}  // namespace bootimage
}  // namespace dexpreopt
