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

#include <string>
#include <string_view>

#include "shared.hpp"

namespace strata {

inline constexpr std::string_view kSegmentsPrefix = "segments_";
inline constexpr std::string_view kPendingSegmentsPrefix = "pending_segments_";
inline constexpr std::string_view kWriteLockName = "write.lock";

inline constexpr std::string_view kDataExt = "dat";
inline constexpr std::string_view kCompoundExt = "cfs";
inline constexpr std::string_view kDeletesExt = "del";
inline constexpr std::string_view kSegmentMetaExt = "sm";

// returns string in the following format : _{gen}
std::string file_name(uint64_t gen);

// returns string in the following format : {prefix}{gen}
std::string file_name(std::string_view prefix, uint64_t gen);

// returns string in the following format : {name}.{ext}
std::string file_name(std::string_view name, std::string_view ext);

// returns string in the following format : {name}.{gen}.{ext}
std::string file_name(std::string_view name, uint64_t gen,
                      std::string_view ext);

// Generation encoded in a 'segments_N' file name,
// index_gen_limits::invalid() if the name is not a commit file
uint64_t parse_generation(std::string_view segments_file) noexcept;

// Files managed by an index: segment files, commit files and
// leftovers of interrupted commits
bool is_index_file(std::string_view name) noexcept;

// 'true' if 'name' belongs to the segment named 'segment'
bool is_segment_file(std::string_view name, std::string_view segment) noexcept;

}  // namespace strata
