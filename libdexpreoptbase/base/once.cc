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

#include "once.h"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <typeindex>

#include "android-base/logging.h"

namespace dexpreopt {

OnceCache::Entry* OnceCache::GetOrCreateEntry(std::string_view name, std::type_index type) {
  std::lock_guard<std::mutex> lock(mu_);
  std::unique_ptr<Entry>& entry = entries_[std::string(name)];
  if (entry == nullptr) {
    entry = std::make_unique<Entry>(type);
  } else if (entry->type != type) {
    LOG(FATAL) << "Once key '" << name << "' requested as " << type.name()
               << ", but it holds " << entry->type.name();
  }
  return entry.get();
}

size_t OnceCache::Size() {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

}  // namespace dexpreopt
