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

#ifndef DEXPREOPT_LIBDEXPREOPTBASE_BASE_ONCE_H_
#define DEXPREOPT_LIBDEXPREOPTBASE_BASE_ONCE_H_

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "android-base/thread_annotations.h"
#include "base/macros.h"

namespace dexpreopt {

// A key for `OnceCache`. The type parameter is the type of the cached value, so that a value can
// only be read back as the type it was created with.
template <typename T>
class OnceKey {
 public:
  explicit constexpr OnceKey(const char* name) : name_(name) {}

  const char* Name() const { return name_; }

 private:
  const char* name_;
};

// A cache of values that are computed at most once per key. The cache is scoped to one build
// invocation: callers create it next to the configuration the values are derived from and pass it
// down explicitly.
//
// Thread-safe. If several threads ask for the same key before the value exists, exactly one of
// them runs the factory and the others block until the value is published. All callers get a
// reference to the same object, which stays valid and immutable for the lifetime of the cache.
class OnceCache {
 public:
  OnceCache() = default;

  // Returns the value for `key`, calling `factory` to create it if this is the first request.
  // `factory` must not request the same key again.
  template <typename T, typename Factory>
  const T& Once(const OnceKey<T>& key, Factory&& factory) {
    Entry* entry = GetOrCreateEntry(key.Name(), typeid(T));
    std::call_once(entry->once_flag, [&]() {
      entry->value = std::make_shared<const T>(std::forward<Factory>(factory)());
    });
    return *static_cast<const T*>(entry->value.get());
  }

  // Returns the number of keys that have been requested so far.
  size_t Size();

 private:
  struct Entry {
    explicit Entry(std::type_index t) : type(t) {}

    const std::type_index type;
    std::once_flag once_flag;
    // Written exactly once, under `once_flag`.
    std::shared_ptr<const void> value;
  };

  Entry* GetOrCreateEntry(std::string_view name, std::type_index type);

  std::mutex mu_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_ GUARDED_BY(mu_);

  DISALLOW_COPY_AND_ASSIGN(OnceCache);
};

}  // namespace dexpreopt

#endif  // DEXPREOPT_LIBDEXPREOPTBASE_BASE_ONCE_H_
