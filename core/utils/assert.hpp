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

#include <string_view>

#include "shared.hpp"

namespace strata::assert {

using Callback = void (*)(std::string_view file, size_t line,
                          std::string_view function,
                          std::string_view condition);

// not thread-safe
Callback SetCallback(Callback callback) noexcept;

void Message(std::string_view file, size_t line, std::string_view function,
             std::string_view condition) noexcept;

}  // namespace strata::assert

#ifdef STRATA_DEBUG

#define STRATA_ASSERT(condition)                                 \
  do {                                                           \
    if (STRATA_UNLIKELY(!(condition))) {                         \
      ::strata::assert::Message(__FILE__, __LINE__,              \
                                STRATA_CURRENT_FUNCTION, #condition); \
    }                                                            \
  } while (false)

#else

#define STRATA_ASSERT(condition) ((void)1)

#endif
