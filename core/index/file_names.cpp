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

#include "index/file_names.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

namespace strata {

std::string file_name(uint64_t gen) { return file_name("_", gen); }

std::string file_name(std::string_view prefix, uint64_t gen) {
  return absl::StrCat(prefix, gen);
}

std::string file_name(std::string_view name, std::string_view ext) {
  return absl::StrCat(name, ".", ext);
}

std::string file_name(std::string_view name, uint64_t gen,
                      std::string_view ext) {
  return absl::StrCat(name, ".", gen, ".", ext);
}

uint64_t parse_generation(std::string_view segments_file) noexcept {
  if (!segments_file.starts_with(kSegmentsPrefix)) {
    return index_gen_limits::invalid();
  }

  segments_file.remove_prefix(kSegmentsPrefix.size());

  uint64_t gen;
  if (segments_file.empty() || !absl::ascii_isdigit(segments_file.front()) ||
      !absl::SimpleAtoi(segments_file, &gen)) {
    return index_gen_limits::invalid();
  }

  return gen;
}

bool is_index_file(std::string_view name) noexcept {
  return name.starts_with('_') || name.starts_with(kSegmentsPrefix) ||
         name.starts_with(kPendingSegmentsPrefix);
}

bool is_segment_file(std::string_view name,
                     std::string_view segment) noexcept {
  return name.size() > segment.size() && name.starts_with(segment) &&
         '.' == name[segment.size()];
}

}  // namespace strata
