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

#ifndef DEXPREOPT_LIBDEXPREOPTBASE_BASE_FILE_UTILS_H_
#define DEXPREOPT_LIBDEXPREOPTBASE_BASE_FILE_UTILS_H_

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace dexpreopt {

// Default on-device locations.
static constexpr const char* kSystemFrameworkDefaultPath = "/system/framework";
static constexpr const char* kAndroidArtApexName = "com.android.art";

// Joins the non-empty elements with '/' and returns the lexically normal form of the result,
// without a trailing separator. An absolute element in the middle does not reset the result.
//
// JoinPath({"out/soong", "", "dex_bootjars"}) == "out/soong/dex_bootjars"
// JoinPath({"/", "system/framework/"}) == "/system/framework"
std::string JoinPath(std::initializer_list<std::string_view> elements);

// Returns `path` with `ext` appended for each of `exts`, in order.
std::vector<std::string> PathsWithExtensions(std::string_view path,
                                             std::initializer_list<std::string_view> exts);

}  // namespace dexpreopt

#endif  // DEXPREOPT_LIBDEXPREOPTBASE_BASE_FILE_UTILS_H_
