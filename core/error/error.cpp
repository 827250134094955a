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

#include "error/error.hpp"

#include <absl/strings/str_cat.h>

namespace strata {

const char* error_base::what() const noexcept {
  return "An unknown error occurred.";
}

lock_obtain_failed::lock_obtain_failed(std::string_view filename,
                                       std::string_view reason)
  : detailed_error_base{absl::StrCat(
      "Lock obtain timed out",
      filename.empty() ? "" : absl::StrCat(", file: '", filename, "'"),
      reason.empty() ? "" : absl::StrCat(", reason: ", reason))},
    reason_{reason} {}

file_not_found::file_not_found(std::string_view filename)
  : detailed_error_base{
      filename.empty()
        ? std::string{"File not found."}
        : absl::StrCat("File not found, path: '", filename, "'")} {}

}  // namespace strata
