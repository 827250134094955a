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

#include "utils/assert.hpp"

#include <cstdlib>
#include <utility>

#include "utils/log.hpp"

#include <absl/strings/str_cat.h>

namespace strata::assert {
namespace {

void DefaultCallback(std::string_view file, size_t line,
                     std::string_view function,
                     std::string_view condition) {
  log::Log(log::Level::kFatal, file, line, function,
           absl::StrCat("Assertion failed: ", condition));
  std::abort();
}

Callback kCallback = &DefaultCallback;

}  // namespace

Callback SetCallback(Callback callback) noexcept {
  return std::exchange(kCallback, callback);
}

void Message(std::string_view file, size_t line, std::string_view function,
             std::string_view condition) noexcept {
  if (STRATA_LIKELY(kCallback != nullptr)) {
    kCallback(file, line, function, condition);
  }
}

}  // namespace strata::assert
