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

#include "store/data_input.hpp"
#include "store/data_output.hpp"

namespace strata::format_utils {

inline constexpr uint32_t kFormatMagic = 0x3fd76c17;
inline constexpr uint32_t kFooterMagic = ~kFormatMagic;

// Size of the footer in bytes: magic + reserved + checksum
inline constexpr size_t kFooterLen = 2 * sizeof(uint32_t) + sizeof(uint64_t);

void write_header(IndexOutput& out, std::string_view format, int32_t ver);

// Write footer, checksum covers every byte written before it
void write_footer(IndexOutput& out);

// Validate header, returns version of the format,
// throws index_error on mismatch
int32_t check_header(IndexInput& in, std::string_view format, int32_t min_ver,
                     int32_t max_ver);

// Validate footer against an expected checksum, throws index_error on
// mismatch
void check_footer(IndexInput& in, uint64_t checksum);

// Compute checksum of a whole stream except the footer, position of the
// stream is left unchanged
uint64_t checksum(IndexInput& in);

}  // namespace strata::format_utils
