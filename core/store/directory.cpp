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

#include "store/directory.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/log.hpp"
#include "utils/thread_utils.hpp"

namespace strata {

bool index_lock::try_lock(int64_t wait_timeout_ms) {
  if (wait_timeout_ms < 0 && wait_timeout_ms != kLockWaitForever) {
    throw illegal_argument{absl::StrCat(
      "Lock wait timeout must be non-negative or kLockWaitForever, got ",
      wait_timeout_ms)};
  }

  failure_reason_.clear();

  if (lock()) {
    return true;
  }

  // number of whole poll intervals covering the timeout
  const int64_t max_sleep_count =
    (wait_timeout_ms + kLockPollIntervalMs - 1) / kLockPollIntervalMs;

  for (int64_t sleep_count = 0;
       wait_timeout_ms == kLockWaitForever || sleep_count < max_sleep_count;
       ++sleep_count) {
    sleep_ms(kLockPollIntervalMs);

    if (lock()) {
      return true;
    }
  }

  STRATA_LOG_WARN(absl::StrCat("Failed to obtain lock '", name(), "' within ",
                               wait_timeout_ms, "ms",
                               failure_reason_.empty() ? "" : ", reason: ",
                               failure_reason_));

  throw lock_obtain_failed{name(), failure_reason_};
}

}  // namespace strata
