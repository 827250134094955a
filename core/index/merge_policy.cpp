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

#include "index/merge_policy.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"

namespace strata {

std::string_view MergeTriggerName(MergeTrigger trigger) noexcept {
  switch (trigger) {
    case MergeTrigger::kSegmentFlush:
      return "SEGMENT_FLUSH";
    case MergeTrigger::kFullFlush:
      return "FULL_FLUSH";
    case MergeTrigger::kMergeFinished:
      return "MERGE_FINISHED";
    case MergeTrigger::kExplicit:
      return "EXPLICIT";
    case MergeTrigger::kClosing:
      return "CLOSING";
  }
  return "UNKNOWN";
}

void MergeProgress::CheckAborted(std::string_view segment) const {
  if (IsAborted()) {
    throw merge_aborted{absl::StrCat("Merge into '", segment, "' aborted")};
  }
}

OneMerge::OneMerge(std::vector<SegmentMeta>&& segments)
  : segments{std::move(segments)} {
  for (auto& segment : this->segments) {
    total_bytes += segment.byte_size;
  }
  estimated_bytes = total_bytes;
}

uint64_t OneMerge::TotalDocs() const noexcept {
  uint64_t count = 0;
  for (auto& segment : segments) {
    count += segment.docs_count;
  }
  return count;
}

uint64_t OneMerge::TotalLiveDocs() const noexcept {
  uint64_t count = 0;
  for (auto& segment : segments) {
    count += segment.live_docs_count;
  }
  return count;
}

}  // namespace strata
