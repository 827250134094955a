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

#include "index/deletion_policy.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/log.hpp"

namespace strata {
namespace {

void DeleteCommit(IndexCommit& commit, std::string_view policy) {
  STRATA_LOG_DEBUG(absl::StrCat(policy, " deletes commit '",
                                commit.segments_file(), "'"));
  commit.Delete();
}

}  // namespace

IndexCommit::IndexCommit(std::shared_ptr<const IndexMeta> meta,
                         std::string segments_file)
  : meta_{std::move(meta)}, segments_file_{std::move(segments_file)} {
  STRATA_ASSERT(meta_);
  files_ = meta_->files();
  files_.emplace_back(segments_file_);
}

void KeepOnlyLastCommitDeletionPolicy::OnCommit(const IndexCommits& commits) {
  // keep the last commit only
  for (size_t i = 0, count = commits.size(); i + 1 < count; ++i) {
    DeleteCommit(*commits[i], "KeepOnlyLastCommitDeletionPolicy");
  }
}

KeepLastCommitsDeletionPolicy::KeepLastCommitsDeletionPolicy(
  size_t num_commits)
  : num_commits_{num_commits} {
  if (!num_commits_) {
    throw illegal_argument{"Number of commits to keep must be positive"};
  }
}

void KeepLastCommitsDeletionPolicy::OnCommit(const IndexCommits& commits) {
  if (commits.size() <= num_commits_) {
    return;
  }

  for (size_t i = 0, count = commits.size() - num_commits_; i < count; ++i) {
    DeleteCommit(*commits[i], "KeepLastCommitsDeletionPolicy");
  }
}

ExpirationTimeDeletionPolicy::ExpirationTimeDeletionPolicy(
  std::chrono::milliseconds expiration)
  : expiration_{expiration} {
  if (expiration_.count() < 0) {
    throw illegal_argument{absl::StrCat(
      "Expiration time must be non-negative, got ", expiration_.count())};
  }
}

void ExpirationTimeDeletionPolicy::OnCommit(const IndexCommits& commits) {
  if (commits.empty()) {
    return;
  }

  const auto last = commits.back()->timestamp();
  const auto window = static_cast<uint64_t>(expiration_.count());

  if (last < window) {
    return;
  }

  const auto expiration_time = last - window;

  // the most recent commit is never deleted
  for (size_t i = 0, count = commits.size() - 1; i < count; ++i) {
    if (commits[i]->timestamp() < expiration_time) {
      DeleteCommit(*commits[i], "ExpirationTimeDeletionPolicy");
    }
  }
}

}  // namespace strata
