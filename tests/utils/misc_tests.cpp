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

#include <stdexcept>

#include "tests_shared.hpp"
#include "utils/misc.hpp"

TEST(misc_tests, finally_on_scope_exit) {
  size_t calls = 0;

  {
    strata::Finally increment = [&calls]() noexcept { ++calls; };
    ASSERT_EQ(0, calls);
  }

  ASSERT_EQ(1, calls);
}

TEST(misc_tests, finally_on_exception) {
  size_t calls = 0;

  try {
    strata::Finally increment = [&calls]() noexcept { ++calls; };
    throw std::runtime_error{"error"};
  } catch (const std::runtime_error&) {
    ASSERT_EQ(1, calls);
  }

  ASSERT_EQ(1, calls);
}
