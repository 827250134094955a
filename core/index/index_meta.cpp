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

#include "index/index_meta.hpp"

#include <algorithm>

#include <absl/numeric/int128.h>

namespace strata {

uint64_t LiveBytes(const SegmentMeta& meta) noexcept {
  if (!meta.docs_count) {
    return 0;
  }

  // byte_size * live_docs_count doesn't fit 64 bits for large segments
  return absl::Uint128Low64(absl::uint128{meta.byte_size} *
                            meta.live_docs_count / meta.docs_count);
}

bool SegmentMeta::operator==(const SegmentMeta& other) const noexcept {
  return name == other.name && version == other.version &&
         docs_count == other.docs_count &&
         live_docs_count == other.live_docs_count &&
         byte_size == other.byte_size && del_gen == other.del_gen &&
         use_compound_file == other.use_compound_file && files == other.files;
}

bool IndexMeta::operator==(const IndexMeta& other) const noexcept {
  return gen_ == other.gen_ && last_gen_ == other.last_gen_ &&
         seg_counter_ == other.seg_counter_ &&
         timestamp_ == other.timestamp_ && segments_ == other.segments_;
}

std::vector<std::string> IndexMeta::files() const {
  std::vector<std::string> files;

  visit_files([&files](const std::string& file) {
    files.emplace_back(file);
    return true;
  });

  return files;
}

const IndexSegment* IndexMeta::find(std::string_view name) const noexcept {
  const auto it =
    std::find_if(segments_.begin(), segments_.end(),
                 [name](const IndexSegment& s) { return s.meta.name == name; });

  return it == segments_.end() ? nullptr : &*it;
}

uint64_t IndexMeta::next_generation() const noexcept {
  return index_gen_limits::valid(gen_) ? (gen_ + 1) : 1;
}

}  // namespace strata
