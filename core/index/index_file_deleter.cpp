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

#include "index/index_file_deleter.hpp"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "index/file_names.hpp"
#include "index/index_meta_io.hpp"
#include "utils/directory_utils.hpp"
#include "utils/log.hpp"

namespace strata {

IndexSnapshot::IndexSnapshot(IndexSnapshot&& rhs) noexcept
  : deleter_{std::exchange(rhs.deleter_, nullptr)},
    commit_{std::move(rhs.commit_)} {}

IndexSnapshot& IndexSnapshot::operator=(IndexSnapshot&& rhs) noexcept {
  if (this != &rhs) {
    reset();
    deleter_ = std::exchange(rhs.deleter_, nullptr);
    commit_ = std::move(rhs.commit_);
  }
  return *this;
}

IndexSnapshot::~IndexSnapshot() { reset(); }

void IndexSnapshot::reset() noexcept {
  if (!commit_) {
    return;
  }

  STRATA_ASSERT(deleter_);

  try {
    deleter_->DecRef(commit_->files());
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to release snapshot of '",
                                  commit_->segments_file(),
                                  "', error: ", e.what()));
  }

  commit_.reset();
  deleter_ = nullptr;
}

IndexFileDeleter::IndexFileDeleter(directory& dir, const index_lock& lock,
                                   IndexDeletionPolicy& policy,
                                   std::shared_ptr<const IndexMeta> current)
  : dir_{dir}, policy_{policy} {
  if (!lock.is_locked()) {
    throw illegal_state{"Index write lock must be held to manage files"};
  }

  std::lock_guard guard{mutex_};

  for (auto& file : directory_utils::ListFiles(dir_)) {
    if (!is_index_file(file)) {
      continue;
    }

    const auto gen = parse_generation(file);

    if (index_gen_limits::valid(gen)) {
      // any failure here is fatal, there is no retry at this stage
      auto meta = std::make_shared<IndexMeta>();

      try {
        IndexMetaReader::read(dir_, *meta, file);
      } catch (const std::exception& e) {
        STRATA_LOG_ERROR(absl::StrCat("Failed to read commit '", file,
                                      "', error: ", e.what()));
        throw;
      }

      auto commit = std::make_shared<IndexCommit>(std::move(meta), file);
      IncRefLocked(commit->files());
      commits_.emplace_back(std::move(commit));
    }

    // track every index file even if nothing references it
    refs_.try_emplace(std::move(file));
  }

  std::sort(commits_.begin(), commits_.end(),
            [](const IndexCommit::ptr& lhs, const IndexCommit::ptr& rhs) {
              return lhs->generation() < rhs->generation();
            });

  if (current) {
    last_files_ = current->files();
    IncRefLocked(last_files_);
  }

  policy_.OnInit(commits_);
  DeleteCommitsLocked();
  RefreshLocked({});
}

void IndexFileDeleter::Checkpoint(std::shared_ptr<const IndexMeta> meta,
                                  bool is_commit) {
  STRATA_ASSERT(meta);

  std::lock_guard guard{mutex_};

  // retry files that couldn't be removed previously
  DeletePendingFilesLocked();

  auto files = meta->files();
  IncRefLocked(files);

  if (is_commit) {
    auto commit = std::make_shared<IndexCommit>(
      meta, file_name(kSegmentsPrefix, meta->generation()));
    IncRefLocked(commit->files());
    commits_.emplace_back(commit);

    try {
      policy_.OnCommit(commits_);
    } catch (...) {
      // the generation is not committed if the policy fails
      commits_.pop_back();
      DecRefLocked(commit->files());
      DecRefLocked(files);
      throw;
    }

    DeleteCommitsLocked();
  }

  DecRefLocked(last_files_);
  last_files_ = std::move(files);
}

void IndexFileDeleter::IncRef(std::span<const std::string> files) {
  std::lock_guard guard{mutex_};
  IncRefLocked(files);
}

void IndexFileDeleter::DecRef(std::span<const std::string> files) {
  std::lock_guard guard{mutex_};
  DecRefLocked(files);
}

size_t IndexFileDeleter::RefCount(std::string_view file) const {
  std::lock_guard guard{mutex_};
  const auto it = refs_.find(file);
  return it == refs_.end() ? 0 : it->second.count;
}

bool IndexFileDeleter::Exists(std::string_view file) const {
  return RefCount(file) > 0;
}

IndexCommits IndexFileDeleter::Commits() const {
  std::lock_guard guard{mutex_};
  return commits_;
}

std::vector<std::string> IndexFileDeleter::PendingFiles() const {
  std::lock_guard guard{mutex_};
  return {pending_.begin(), pending_.end()};
}

void IndexFileDeleter::DeletePendingFiles() {
  std::lock_guard guard{mutex_};
  DeletePendingFilesLocked();
}

void IndexFileDeleter::Refresh(std::string_view segment) {
  std::lock_guard guard{mutex_};
  RefreshLocked(segment);
}

IndexSnapshot IndexFileDeleter::OpenSnapshot() {
  std::lock_guard guard{mutex_};

  if (commits_.empty()) {
    throw index_not_found{};
  }

  auto commit = commits_.back();
  IncRefLocked(commit->files());

  return IndexSnapshot{*this, std::move(commit)};
}

void IndexFileDeleter::Close() {
  std::lock_guard guard{mutex_};
  auto files = std::move(last_files_);
  last_files_.clear();
  DecRefLocked(files);
  DeletePendingFilesLocked();
}

void IndexFileDeleter::IncRefLocked(std::string_view file) {
  auto& ref = refs_[file];
  ++ref.count;

  // file became referenced again, e.g. re-created by a writer
  pending_.erase(file);
}

void IndexFileDeleter::DecRefLocked(std::string_view file) {
  const auto it = refs_.find(file);

  if (it == refs_.end() || !it->second.count) {
    throw illegal_state{
      absl::StrCat("Reference count of file '", file, "' is already zero")};
  }

  if (--it->second.count) {
    return;
  }

  const std::string name = it->first;
  refs_.erase(it);
  DeleteFileLocked(name);
}

void IndexFileDeleter::IncRefLocked(std::span<const std::string> files) {
  for (auto& file : files) {
    IncRefLocked(file);
  }
}

void IndexFileDeleter::DecRefLocked(std::span<const std::string> files) {
  for (auto& file : files) {
    DecRefLocked(file);
  }
}

void IndexFileDeleter::DeleteFileLocked(std::string_view file) noexcept {
  if (dir_.remove(file)) {
    STRATA_LOG_TRACE(absl::StrCat("Removed file '", file, "'"));
    pending_.erase(file);
    return;
  }

  // can't remove the file now, e.g. busy, try again on next checkpoint
  STRATA_LOG_WARN(
    absl::StrCat("Failed to remove file '", file, "', will retry later"));

  try {
    pending_.emplace(file);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to schedule removal of file '",
                                  file, "', error: ", e.what()));
  }
}

void IndexFileDeleter::DeleteCommitsLocked() {
  auto it = std::stable_partition(
    commits_.begin(), commits_.end(),
    [](const IndexCommit::ptr& commit) { return !commit->IsDeleted(); });

  IndexCommits deleted(std::make_move_iterator(it),
                       std::make_move_iterator(commits_.end()));
  commits_.erase(it, commits_.end());

  for (auto& commit : deleted) {
    STRATA_LOG_DEBUG(absl::StrCat("Deleting commit '",
                                  commit->segments_file(), "'"));
    DecRefLocked(commit->files());
  }
}

void IndexFileDeleter::DeletePendingFilesLocked() noexcept {
  if (pending_.empty()) {
    return;
  }

  auto pending = std::move(pending_);
  pending_.clear();

  for (auto& file : pending) {
    const auto it = refs_.find(file);

    if (it == refs_.end() || !it->second.count) {
      DeleteFileLocked(file);
    }
  }
}

void IndexFileDeleter::RefreshLocked(std::string_view segment) {
  for (auto& file : directory_utils::ListFiles(dir_)) {
    if (!is_index_file(file)) {
      continue;
    }

    if (!segment.empty() && !is_segment_file(file, segment)) {
      continue;
    }

    const auto it = refs_.find(file);

    if (it == refs_.end() || !it->second.count) {
      if (it != refs_.end()) {
        refs_.erase(it);
      }

      STRATA_LOG_DEBUG(absl::StrCat("Removing unreferenced file '", file, "'"));
      DeleteFileLocked(file);
    }
  }
}

}  // namespace strata
