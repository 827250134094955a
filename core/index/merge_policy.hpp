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

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "index/index_meta.hpp"

namespace strata {

// Reason a merge policy is consulted
enum class MergeTrigger : uint32_t {
  kSegmentFlush,   // a new segment was flushed
  kFullFlush,      // writer flushed every pending segment, e.g. on commit
  kMergeFinished,  // a merge finished, its output may cascade
  kExplicit,       // merge requested by a user
  kClosing         // writer is closing
};

std::string_view MergeTriggerName(MergeTrigger trigger) noexcept;

// Abort/progress tracker shared between a merge and its owner
class MergeProgress {
 public:
  void Abort() noexcept { aborted_.store(true, std::memory_order_release); }

  bool IsAborted() const noexcept {
    return aborted_.load(std::memory_order_acquire);
  }

  // Throws merge_aborted if the merge was aborted
  void CheckAborted(std::string_view segment) const;

  void AddWork(uint64_t units) noexcept {
    work_.fetch_add(units, std::memory_order_relaxed);
  }

  uint64_t Work() const noexcept {
    return work_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic_bool aborted_{false};
  std::atomic<uint64_t> work_{0};
};

// Single merge: a subset of segments combined into a new segment
struct OneMerge {
  enum class State : uint32_t { kPending, kRunning, kCommitted, kFailed };

  explicit OneMerge(std::vector<SegmentMeta>&& segments);

  uint64_t TotalDocs() const noexcept;
  uint64_t TotalLiveDocs() const noexcept;

  std::vector<SegmentMeta> segments;  // input segments
  uint64_t total_bytes{};             // raw size of input segments
  uint64_t estimated_bytes{};         // expected size of a merged segment
  double score{};                     // lower is better
  double skew{};
  double non_deleted_ratio{1.};
  size_t max_num_segments{};  // target segment count of a forced merge, 0 if
                              // not forced
  bool use_compound_file{};
  MergeProgress progress;
  std::optional<IndexSegment> output;
  State state{State::kPending};
  std::exception_ptr error;
};

// Merges proposed by a single consultation of a merge policy
struct MergeSpecification {
  bool empty() const noexcept { return merges.empty(); }
  size_t size() const noexcept { return merges.size(); }

  std::vector<std::shared_ptr<OneMerge>> merges;
};

// Names of the segments participating in in-flight merges
using MergingSegments = absl::flat_hash_set<std::string>;

// Selects segments to merge, must never select a segment
// that is already participating in a merge
class MergePolicy {
 public:
  using ptr = std::shared_ptr<MergePolicy>;

  virtual ~MergePolicy() = default;

  virtual MergeSpecification FindMerges(MergeTrigger trigger,
                                        const IndexMeta& segments,
                                        const MergingSegments& merging) = 0;

  // Merge an index down to at most 'max_segment_count' segments
  virtual MergeSpecification FindForcedMerges(
    const IndexMeta& segments, size_t max_segment_count,
    const MergingSegments& merging) = 0;

  // Merge away deleted documents
  virtual MergeSpecification FindForcedDeletesMerges(
    const IndexMeta& segments, const MergingSegments& merging) = 0;

  // Whether 'merged' should be written as a compound file
  virtual bool UseCompoundFile(const IndexMeta& segments,
                               const SegmentMeta& merged) const = 0;
};

}  // namespace strata
