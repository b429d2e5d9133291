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

#ifndef DEXPREOPT_LIBDEXPREOPTBASE_BASE_MACROS_H_
#define DEXPREOPT_LIBDEXPREOPTBASE_BASE_MACROS_H_

#include "android-base/macros.h"  // IWYU pragma: export
#include "fmt/format.h"           // IWYU pragma: export

// Formats a string with the `{}` syntax. Prefer this over `StringPrintf` in new code.
#define DEXPREOPT_FORMAT(...) ::fmt::format(__VA_ARGS__)

#define NO_RETURN [[ noreturn ]]  // NOLINT[whitespace/braces] [5]

#define UNREACHABLE __builtin_unreachable

#endif  // DEXPREOPT_LIBDEXPREOPTBASE_BASE_MACROS_H_
