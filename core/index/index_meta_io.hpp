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

#include "index/index_meta.hpp"
#include "store/directory.hpp"

namespace strata {

// Two-phase writer of 'segments_N' commit files
class IndexMetaWriter {
 public:
  static constexpr std::string_view kFormatName = "strata_10_index_meta";
  static constexpr int32_t kFormatMin = 0;
  static constexpr int32_t kFormatMax = 0;

  ~IndexMetaWriter();

  // Assign the next generation to 'meta', write and sync
  // 'pending_segments_N' together with every file 'meta' references,
  // returns 'false' if a prepared commit is already pending
  bool prepare(directory& dir, IndexMeta& meta);

  // Publish a prepared commit as 'segments_N',
  // returns 'false' if there is no prepared commit
  bool commit();

  // Drop a prepared commit
  void rollback() noexcept;

 private:
  directory* dir_{};
  IndexMeta* meta_{};
  uint64_t last_gen_{index_gen_limits::invalid()};
};

class IndexMetaReader {
 public:
  static constexpr std::string_view kFormatName = IndexMetaWriter::kFormatName;

  // Name of the commit file with the highest generation
  static bool last_segments_file(const directory& dir, std::string& name);

  // Read a commit, throws on missing or corrupted data
  static void read(const directory& dir, IndexMeta& meta,
                   std::string_view filename);
};

// Descriptor file of a single segment: '{name}.{version}.sm'
struct SegmentMetaWriter {
  static constexpr std::string_view kFormatName = "strata_10_segment_meta";
  static constexpr int32_t kFormatMin = 0;
  static constexpr int32_t kFormatMax = 0;

  // Write a descriptor of 'meta', returns descriptor file name
  static std::string write(directory& dir, const SegmentMeta& meta);
};

struct SegmentMetaReader {
  static void read(const directory& dir, SegmentMeta& meta,
                   std::string_view filename);
};

}  // namespace strata
