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

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace strata {

using byte_type = uint8_t;

using bstring = std::basic_string<byte_type>;

// generation of an index meta, 0 is reserved for "no generation"
struct index_gen_limits {
  static constexpr uint64_t invalid() noexcept { return 0; }
  static constexpr bool valid(uint64_t gen) noexcept {
    return invalid() != gen;
  }
};

// generation of a segment deletions file, 0 == no deletions file
struct del_gen_limits {
  static constexpr uint64_t invalid() noexcept { return 0; }
  static constexpr bool valid(uint64_t gen) noexcept {
    return invalid() != gen;
  }
};

}  // namespace strata
