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

#include "file_utils.h"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "android-base/strings.h"

namespace dexpreopt {

std::string JoinPath(std::initializer_list<std::string_view> elements) {
  std::string joined;
  for (std::string_view element : elements) {
    if (element.empty()) {
      continue;
    }
    if (!joined.empty() && joined.back() != '/') {
      joined += '/';
    }
    joined.append(element);
  }
  if (joined.empty()) {
    return "";
  }
  std::string result = std::filesystem::path(joined).lexically_normal().string();
  // `lexically_normal` keeps the trailing separator of "a/b/", but not the one of "/".
  if (result.size() > 1 && android::base::EndsWith(result, "/")) {
    result.pop_back();
  }
  return result;
}

std::vector<std::string> PathsWithExtensions(std::string_view path,
                                             std::initializer_list<std::string_view> exts) {
  std::vector<std::string> paths;
  paths.reserve(exts.size());
  for (std::string_view ext : exts) {
    std::string file(path);
    file.append(ext);
    paths.push_back(std::move(file));
  }
  return paths;
}

}  // namespace dexpreopt
