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

#include "index/tiered_merge_policy.hpp"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/log.hpp"

namespace strata {
namespace {

using SegmentRefs = std::vector<const SegmentMeta*>;

SegmentRefs Eligible(const IndexMeta& segments,
                     const MergingSegments& merging) {
  SegmentRefs eligible;
  eligible.reserve(segments.size());

  for (auto& segment : segments.segments()) {
    if (!merging.contains(segment.meta.name)) {
      eligible.emplace_back(&segment.meta);
    }
  }

  return eligible;
}

std::shared_ptr<OneMerge> MakeMerge(SegmentRefs::const_iterator begin,
                                    SegmentRefs::const_iterator end) {
  std::vector<SegmentMeta> inputs;
  inputs.reserve(std::distance(begin, end));

  for (; begin != end; ++begin) {
    inputs.emplace_back(**begin);
  }

  return std::make_shared<OneMerge>(std::move(inputs));
}

}  // namespace

struct TieredMergePolicy::Candidate {
  SegmentRefs segments;
  uint64_t total_before{};  // raw bytes
  uint64_t total_after{};   // bytes pro-rated by live documents
  uint64_t floored_max{};
  uint64_t floored_min{std::numeric_limits<uint64_t>::max()};
  bool hit_too_large{};
  double skew{};
  double non_deleted_ratio{1.};
  double score{};
};

MergePolicy::ptr TieredMergePolicy::Make() {
  return std::make_shared<TieredMergePolicy>();
}

MergePolicy::ptr TieredMergePolicy::Make(const Options& options) {
  return std::make_shared<TieredMergePolicy>(options);
}

TieredMergePolicy::TieredMergePolicy() : TieredMergePolicy{Options{}} {}

TieredMergePolicy::TieredMergePolicy(const Options& options)
  : options_{options} {
  if (options_.max_merge_at_once < 2) {
    throw illegal_argument{absl::StrCat("max_merge_at_once must be > 1, got ",
                                        options_.max_merge_at_once)};
  }

  if (options_.max_merge_at_once_explicit < 2) {
    throw illegal_argument{
      absl::StrCat("max_merge_at_once_explicit must be > 1, got ",
                   options_.max_merge_at_once_explicit)};
  }

  if (!options_.max_merged_segment_bytes) {
    throw illegal_argument{"max_merged_segment_bytes must be positive"};
  }

  if (!options_.floor_segment_bytes) {
    throw illegal_argument{"floor_segment_bytes must be positive"};
  }

  if (!(options_.segments_per_tier >= 2.)) {
    throw illegal_argument{absl::StrCat("segments_per_tier must be >= 2, got ",
                                        options_.segments_per_tier)};
  }

  if (!(options_.force_merge_deletes_pct_allowed >= 0. &&
        options_.force_merge_deletes_pct_allowed <= 100.)) {
    throw illegal_argument{absl::StrCat(
      "force_merge_deletes_pct_allowed must be within [0, 100], got ",
      options_.force_merge_deletes_pct_allowed)};
  }

  if (!(options_.reclaim_deletes_weight >= 0.)) {
    throw illegal_argument{
      absl::StrCat("reclaim_deletes_weight must be >= 0, got ",
                   options_.reclaim_deletes_weight)};
  }

  if (!(options_.no_cfs_ratio >= 0. && options_.no_cfs_ratio <= 1.)) {
    throw illegal_argument{absl::StrCat(
      "no_cfs_ratio must be within [0, 1], got ", options_.no_cfs_ratio)};
  }

  if (!options_.max_cfs_segment_bytes) {
    throw illegal_argument{"max_cfs_segment_bytes must be positive"};
  }
}

uint64_t TieredMergePolicy::Size(const SegmentMeta& meta) noexcept {
  if (!meta.docs_count) {
    return 0;
  }

  const double live_ratio = static_cast<double>(meta.live_docs_count) /
                            static_cast<double>(meta.docs_count);

  return static_cast<uint64_t>(static_cast<double>(meta.byte_size) *
                               live_ratio);
}

size_t TieredMergePolicy::AllowedSegmentCount(
  uint64_t total_bytes, uint64_t min_segment_bytes) const noexcept {
  const auto segments_per_tier = options_.segments_per_tier;

  double level_size = static_cast<double>(FloorSize(min_segment_bytes));
  double bytes_left = static_cast<double>(total_bytes);
  double allowed = 0.;

  while (true) {
    const double level_count = bytes_left / level_size;

    if (level_count < segments_per_tier) {
      // only complete segments of a partial tier count
      allowed += std::floor(level_count);
      break;
    }

    allowed += segments_per_tier;
    bytes_left -= segments_per_tier * level_size;
    level_size *= static_cast<double>(options_.max_merge_at_once);
  }

  return static_cast<size_t>(
    std::max(allowed, std::floor(segments_per_tier)));
}

void TieredMergePolicy::Score(Candidate& candidate) const noexcept {
  // a size capped merge is as good as a perfectly balanced one
  candidate.skew = candidate.hit_too_large
                     ? 1.
                     : static_cast<double>(candidate.floored_max) /
                         static_cast<double>(candidate.floored_min);

  candidate.non_deleted_ratio =
    candidate.total_before
      ? static_cast<double>(candidate.total_after) /
          static_cast<double>(candidate.total_before)
      : 1.;

  candidate.score =
    candidate.skew *
    std::pow(static_cast<double>(candidate.total_after), 0.05) *
    std::pow(candidate.non_deleted_ratio, options_.reclaim_deletes_weight);
}

MergeSpecification TieredMergePolicy::FindMerges(
  MergeTrigger trigger, const IndexMeta& segments,
  const MergingSegments& merging) {
  MergeSpecification spec;

  if (segments.empty()) {
    return spec;
  }

  SegmentRefs sorted;
  sorted.reserve(segments.size());
  for (auto& segment : segments.segments()) {
    sorted.emplace_back(&segment.meta);
  }

  // by decreasing pro-rated size
  std::sort(sorted.begin(), sorted.end(),
            [](const SegmentMeta* lhs, const SegmentMeta* rhs) {
              const auto lhs_size = Size(*lhs);
              const auto rhs_size = Size(*rhs);
              return lhs_size == rhs_size ? lhs->name < rhs->name
                                          : lhs_size > rhs_size;
            });

  uint64_t merging_bytes = 0;
  uint64_t total_bytes = 0;
  uint64_t min_segment_bytes = std::numeric_limits<uint64_t>::max();

  for (auto* segment : sorted) {
    const auto size = Size(*segment);

    if (merging.contains(segment->name)) {
      merging_bytes += size;
    }

    total_bytes += size;
    min_segment_bytes = std::min(min_segment_bytes, size);
  }

  // segments of at least half the max merged size are not merged
  // and do not count towards the budget
  size_t too_big_count = 0;
  for (auto* segment : sorted) {
    const auto size = Size(*segment);

    if (size < options_.max_merged_segment_bytes / 2) {
      break;
    }

    total_bytes -= size;
    ++too_big_count;
  }

  const auto allowed = AllowedSegmentCount(total_bytes, min_segment_bytes);
  bool max_merge_is_running =
    merging_bytes >= options_.max_merged_segment_bytes;

  MergingSegments to_be_merged;
  SegmentRefs eligible;

  while (true) {
    eligible.clear();
    for (size_t i = too_big_count, count = sorted.size(); i < count; ++i) {
      auto* segment = sorted[i];
      if (!merging.contains(segment->name) &&
          !to_be_merged.contains(segment->name)) {
        eligible.emplace_back(segment);
      }
    }

    if (eligible.size() <= allowed) {
      break;
    }

    std::optional<Candidate> best;

    for (size_t start = 0, count = eligible.size(); start < count; ++start) {
      Candidate candidate;

      for (size_t idx = start;
           idx < count &&
           candidate.segments.size() < options_.max_merge_at_once;
           ++idx) {
        auto* segment = eligible[idx];
        const auto size = Size(*segment);

        if (candidate.total_after + size >
            options_.max_merged_segment_bytes) {
          // shrink the merge instead of exceeding the size cap
          candidate.hit_too_large = true;
          continue;
        }

        candidate.segments.emplace_back(segment);
        candidate.total_before += segment->byte_size;
        candidate.total_after += size;
        candidate.floored_max = std::max(candidate.floored_max, FloorSize(size));
        candidate.floored_min = std::min(candidate.floored_min, FloorSize(size));
      }

      if (candidate.segments.empty()) {
        continue;
      }

      if (candidate.segments.size() == 1 &&
          !(candidate.hit_too_large && HasRemovals(*candidate.segments[0]))) {
        continue;
      }

      if (candidate.hit_too_large && max_merge_is_running) {
        // don't start another max sized merge
        continue;
      }

      Score(candidate);

      if (!best || candidate.score < best->score) {
        best = std::move(candidate);
      }
    }

    if (!best) {
      break;
    }

    auto merge = MakeMerge(best->segments.begin(), best->segments.end());
    merge->estimated_bytes = best->total_after;
    merge->score = best->score;
    merge->skew = best->skew;
    merge->non_deleted_ratio = best->non_deleted_ratio;

    for (auto* segment : best->segments) {
      to_be_merged.emplace(segment->name);
    }

    max_merge_is_running |= best->hit_too_large;

    STRATA_LOG_DEBUG(absl::StrCat(
      "Selected merge of ", best->segments.size(), " segments on ",
      MergeTriggerName(trigger), ", score: ", best->score,
      ", skew: ", best->skew, ", non deleted ratio: ",
      best->non_deleted_ratio, ", bytes: ", best->total_after));

    spec.merges.emplace_back(std::move(merge));
  }

  return spec;
}

MergeSpecification TieredMergePolicy::FindForcedMerges(
  const IndexMeta& segments, size_t max_segment_count,
  const MergingSegments& merging) {
  if (!max_segment_count) {
    throw illegal_argument{"max_segment_count must be positive"};
  }

  MergeSpecification spec;
  auto eligible = Eligible(segments, merging);

  if (eligible.empty()) {
    return spec;
  }

  if (eligible.size() <= max_segment_count) {
    // a single segment with deletes is not fully merged yet
    if (1 == max_segment_count && 1 == segments.size() &&
        HasRemovals(*eligible.front())) {
      auto merge = MakeMerge(eligible.begin(), eligible.end());
      merge->estimated_bytes = Size(*eligible.front());
      merge->max_num_segments = max_segment_count;
      spec.merges.emplace_back(std::move(merge));
    }

    return spec;
  }

  // segments with the most reclaimable deletes go first
  std::sort(eligible.begin(), eligible.end(),
            [](const SegmentMeta* lhs, const SegmentMeta* rhs) {
              const auto lhs_deleted = DeletedDocs(*lhs);
              const auto rhs_deleted = DeletedDocs(*rhs);
              if (lhs_deleted != rhs_deleted) {
                return lhs_deleted > rhs_deleted;
              }
              const auto lhs_size = Size(*lhs);
              const auto rhs_size = Size(*rhs);
              return lhs_size == rhs_size ? lhs->name < rhs->name
                                          : lhs_size < rhs_size;
            });

  size_t remaining = eligible.size();

  for (size_t idx = 0, count = eligible.size();
       remaining > max_segment_count && idx < count;) {
    const size_t merge_count =
      std::min({options_.max_merge_at_once_explicit,
                remaining - max_segment_count + 1, count - idx});

    if (merge_count < 2) {
      break;
    }

    const auto begin = eligible.begin() + idx;
    auto merge = MakeMerge(begin, begin + merge_count);
    merge->max_num_segments = max_segment_count;

    merge->estimated_bytes = 0;
    for (auto it = begin, end = begin + merge_count; it != end; ++it) {
      merge->estimated_bytes += Size(**it);
    }

    spec.merges.emplace_back(std::move(merge));

    idx += merge_count;
    remaining -= merge_count - 1;
  }

  return spec;
}

MergeSpecification TieredMergePolicy::FindForcedDeletesMerges(
  const IndexMeta& segments, const MergingSegments& merging) {
  MergeSpecification spec;
  SegmentRefs eligible;

  for (auto* segment : Eligible(segments, merging)) {
    if (!segment->docs_count) {
      continue;
    }

    const double pct_deleted = 100. *
                               static_cast<double>(DeletedDocs(*segment)) /
                               static_cast<double>(segment->docs_count);

    if (pct_deleted > options_.force_merge_deletes_pct_allowed) {
      eligible.emplace_back(segment);
    }
  }

  std::sort(eligible.begin(), eligible.end(),
            [](const SegmentMeta* lhs, const SegmentMeta* rhs) {
              const auto lhs_size = Size(*lhs);
              const auto rhs_size = Size(*rhs);
              return lhs_size == rhs_size ? lhs->name < rhs->name
                                          : lhs_size > rhs_size;
            });

  for (size_t start = 0, count = eligible.size(); start < count;) {
    const auto end =
      std::min(start + options_.max_merge_at_once_explicit, count);

    auto merge = MakeMerge(eligible.begin() + start, eligible.begin() + end);
    merge->estimated_bytes = 0;
    for (size_t i = start; i < end; ++i) {
      merge->estimated_bytes += Size(*eligible[i]);
    }

    spec.merges.emplace_back(std::move(merge));
    start = end;
  }

  return spec;
}

bool TieredMergePolicy::UseCompoundFile(const IndexMeta& segments,
                                        const SegmentMeta& merged) const {
  if (0. == options_.no_cfs_ratio) {
    return false;
  }

  const auto merged_size = Size(merged);

  if (merged_size > options_.max_cfs_segment_bytes) {
    return false;
  }

  if (options_.no_cfs_ratio >= 1.) {
    return true;
  }

  uint64_t total_size = 0;
  for (auto& segment : segments.segments()) {
    total_size += Size(segment.meta);
  }

  return static_cast<double>(merged_size) <=
         options_.no_cfs_ratio * static_cast<double>(total_size);
}

}  // namespace strata
