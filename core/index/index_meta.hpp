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

#include <span>
#include <string>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "shared.hpp"
#include "utils/assert.hpp"

namespace strata {

// Descriptor of a single immutable segment
struct SegmentMeta {
  using FileSet = absl::flat_hash_set<std::string>;

  bool operator==(const SegmentMeta& other) const noexcept;

  std::string name;
  uint64_t docs_count{};       // Total number of documents in a segment
  uint64_t live_docs_count{};  // Total number of live documents in a segment
  uint64_t byte_size{};        // Size of segment data in bytes
  uint64_t version{};          // Bumped every time the descriptor is replaced
  uint64_t del_gen{del_gen_limits::invalid()};  // Generation of deletes file
  bool use_compound_file{};
  FileSet files;
};

inline bool HasRemovals(const SegmentMeta& meta) noexcept {
  return meta.live_docs_count != meta.docs_count;
}

inline uint64_t DeletedDocs(const SegmentMeta& meta) noexcept {
  return meta.docs_count - meta.live_docs_count;
}

// Bytes of a segment pro-rated by the fraction of live documents
uint64_t LiveBytes(const SegmentMeta& meta) noexcept;

struct IndexSegment {
  bool operator==(const IndexSegment& other) const noexcept {
    return filename == other.filename && meta == other.meta;
  }

  std::string filename;  // Segment descriptor file
  SegmentMeta meta;
};

// One consistent generation of an index
class IndexMeta {
 public:
  bool operator==(const IndexMeta& other) const noexcept;

  void add(IndexSegment&& segment) {
    segments_.emplace_back(std::move(segment));
  }

  template<typename Visitor>
  bool visit_files(const Visitor& visitor) const {
    for (auto& curr_segment : segments_) {
      if (!visitor(curr_segment.filename)) {
        return false;
      }

      for (auto& file : curr_segment.meta.files) {
        if (!visitor(file)) {
          return false;
        }
      }
    }
    return true;
  }

  // All files referenced by a generation (excluding its commit file)
  std::vector<std::string> files() const;

  uint64_t counter() const noexcept { return seg_counter_; }
  void SetCounter(uint64_t v) noexcept { seg_counter_ = v; }

  uint64_t generation() const noexcept { return gen_; }
  uint64_t last_generation() const noexcept { return last_gen_; }

  void update_generation(const IndexMeta& rhs) noexcept {
    gen_ = rhs.gen_;
    last_gen_ = rhs.last_gen_;
  }

  // Commit time, milliseconds since epoch
  uint64_t timestamp() const noexcept { return timestamp_; }
  void SetTimestamp(uint64_t v) noexcept { timestamp_ = v; }

  size_t size() const noexcept { return segments_.size(); }
  bool empty() const noexcept { return segments_.empty(); }

  const IndexSegment& operator[](size_t i) const noexcept {
    STRATA_ASSERT(i < segments_.size());
    return segments_[i];
  }

  std::span<const IndexSegment> segments() const noexcept { return segments_; }
  std::vector<IndexSegment>& segments() noexcept { return segments_; }

  // nullptr if there is no segment with the specified name
  const IndexSegment* find(std::string_view name) const noexcept;

  uint64_t next_generation() const noexcept;

 private:
  friend class IndexMetaWriter;
  friend class IndexMetaReader;

  uint64_t gen_{index_gen_limits::invalid()};
  uint64_t last_gen_{index_gen_limits::invalid()};
  uint64_t seg_counter_{0};
  uint64_t timestamp_{0};
  std::vector<IndexSegment> segments_;
};

}  // namespace strata
