////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2016 by EMC Corporation, All Rights Reserved
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is EMC Corporation
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdio>
#include <string_view>

#include "shared.hpp"

namespace strata::log {

// use a prefix that does not clash with any predefined macros (e.g. win32
// 'ERROR')
enum class Level : uint32_t {
  kFatal = 0,
  kError,
  kWarn,
  kInfo,
  kDebug,
  kTrace,
};

using Callback = void (*)(Level level, std::string_view file, size_t line,
                          std::string_view function,
                          std::string_view message);

// messages with a level above the threshold are dropped
Level GetLevel() noexcept;
void SetLevel(Level level) noexcept;

// nullptr == /dev/null
void SetOutput(Level level, FILE* out) noexcept;
// set the same output for all levels less or equal to 'level'
void SetOutputLE(Level level, FILE* out) noexcept;

// nullptr == write to the per-level FILE* output
Callback SetCallback(Callback callback) noexcept;

bool Enabled(Level level) noexcept;

void Log(Level level, std::string_view file, size_t line,
         std::string_view function, std::string_view message) noexcept;

std::string_view LevelName(Level level) noexcept;

// parse level name as printed by LevelName(...), case-insensitive
bool ParseLevel(std::string_view name, Level& level) noexcept;

}  // namespace strata::log

#define STRATA_LOG(level, message)                                   \
  do {                                                               \
    if (::strata::log::Enabled(level)) {                             \
      ::strata::log::Log(level, __FILE__, __LINE__,                  \
                         STRATA_CURRENT_FUNCTION, message);          \
    }                                                                \
  } while (false)

#define STRATA_LOG_FATAL(message) \
  STRATA_LOG(::strata::log::Level::kFatal, message)
#define STRATA_LOG_ERROR(message) \
  STRATA_LOG(::strata::log::Level::kError, message)
#define STRATA_LOG_WARN(message) \
  STRATA_LOG(::strata::log::Level::kWarn, message)
#define STRATA_LOG_INFO(message) \
  STRATA_LOG(::strata::log::Level::kInfo, message)
#define STRATA_LOG_DEBUG(message) \
  STRATA_LOG(::strata::log::Level::kDebug, message)
#define STRATA_LOG_TRACE(message) \
  STRATA_LOG(::strata::log::Level::kTrace, message)
