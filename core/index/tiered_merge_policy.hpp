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

#include <algorithm>
#include <limits>

#include "index/merge_policy.hpp"

namespace strata {

// Merges segments of approximately equal size, subject to an allowed
// number of segments per tier. Segments are merged regardless of their
// adjacency, the number of segments merged at once is decoupled from the
// number of segments allowed per tier.
//
// The policy computes a budget of segments an index may have, if the index
// is over budget, segments sorted by decreasing size (pro-rated by the
// fraction of live documents) are scanned for the least cost merge. The cost
// combines the skew of a merge (largest segment / smallest segment), its
// total size and the fraction of deletes it reclaims.
class TieredMergePolicy final : public MergePolicy {
 public:
  struct Options {
    // maximum number of segments merged at once during normal merging
    size_t max_merge_at_once = 10;
    // maximum number of segments merged at once during forced merges
    size_t max_merge_at_once_explicit = 30;
    // maximum size of a segment produced by normal merging
    uint64_t max_merged_segment_bytes = uint64_t{5} << 30;
    // treat all smaller segments as equal for selection and budget
    uint64_t floor_segment_bytes = uint64_t{2} << 20;
    // allowed number of segments per tier, must be >= max_merge_at_once
    // for merges to be effective
    double segments_per_tier = 10.;
    // segments with a larger percentage of deletes are merged by
    // FindForcedDeletesMerges(...)
    double force_merge_deletes_pct_allowed = 10.;
    // how aggressively deletes are reclaimed, 0 disables reclaiming
    double reclaim_deletes_weight = 2.;
    // merged segment is a compound file if it is at most this fraction of
    // an index
    double no_cfs_ratio = 0.1;
    // merged segment larger than this is never a compound file
    uint64_t max_cfs_segment_bytes = std::numeric_limits<uint64_t>::max();
  };

  static MergePolicy::ptr Make();
  // Throws illegal_argument on invalid options
  static MergePolicy::ptr Make(const Options& options);

  TieredMergePolicy();
  explicit TieredMergePolicy(const Options& options);

  const Options& options() const noexcept { return options_; }

  MergeSpecification FindMerges(MergeTrigger trigger,
                                const IndexMeta& segments,
                                const MergingSegments& merging) final;

  MergeSpecification FindForcedMerges(const IndexMeta& segments,
                                      size_t max_segment_count,
                                      const MergingSegments& merging) final;

  MergeSpecification FindForcedDeletesMerges(
    const IndexMeta& segments, const MergingSegments& merging) final;

  bool UseCompoundFile(const IndexMeta& segments,
                       const SegmentMeta& merged) const final;

 private:
  struct Candidate;

  // Size of a segment pro-rated by the fraction of live documents
  static uint64_t Size(const SegmentMeta& meta) noexcept;

  uint64_t FloorSize(uint64_t bytes) const noexcept {
    return std::max(bytes, options_.floor_segment_bytes);
  }

  // Number of segments allowed for an index of 'total_bytes' whose smallest
  // segment is 'min_segment_bytes'
  size_t AllowedSegmentCount(uint64_t total_bytes,
                             uint64_t min_segment_bytes) const noexcept;

  void Score(Candidate& candidate) const noexcept;

  Options options_;
};

}  // namespace strata
