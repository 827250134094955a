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

#include <mutex>
#include <span>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "index/deletion_policy.hpp"
#include "store/directory.hpp"
#include "utils/noncopyable.hpp"

namespace strata {

class IndexFileDeleter;

// Point-in-time view over a commit, keeps files of the commit referenced
// until destroyed, must not outlive the deleter it was obtained from
class IndexSnapshot : private util::noncopyable {
 public:
  IndexSnapshot() = default;
  IndexSnapshot(IndexSnapshot&& rhs) noexcept;
  IndexSnapshot& operator=(IndexSnapshot&& rhs) noexcept;
  ~IndexSnapshot();

  explicit operator bool() const noexcept { return nullptr != commit_; }

  const IndexCommit& commit() const noexcept { return *commit_; }
  const IndexMeta& meta() const noexcept { return commit_->meta(); }

  // Release referenced files
  void reset() noexcept;

 private:
  friend class IndexFileDeleter;

  IndexSnapshot(IndexFileDeleter& deleter, IndexCommit::ptr commit) noexcept
    : deleter_{&deleter}, commit_{std::move(commit)} {}

  IndexFileDeleter* deleter_{};
  IndexCommit::ptr commit_;
};

// Reference counting authority over index files, the only component
// that removes files of an index
class IndexFileDeleter : private util::noncopyable {
 public:
  // 'lock' must be held by the owner of the deleter,
  // 'current' is the in-memory generation of the owner (if any)
  IndexFileDeleter(directory& dir, const index_lock& lock,
                   IndexDeletionPolicy& policy,
                   std::shared_ptr<const IndexMeta> current = nullptr);

  // Register a new generation, commits are passed to the deletion policy,
  // files no longer referenced are removed
  void Checkpoint(std::shared_ptr<const IndexMeta> meta, bool is_commit);

  void IncRef(std::span<const std::string> files);
  void DecRef(std::span<const std::string> files);

  size_t RefCount(std::string_view file) const;

  // 'true' if the file is referenced
  bool Exists(std::string_view file) const;

  IndexCommits Commits() const;

  // Files that failed to be removed and wait for another attempt
  std::vector<std::string> PendingFiles() const;

  // Attempt to remove files pending deletion
  void DeletePendingFiles();

  // Remove unreferenced index files of the specified segment,
  // empty 'segment' removes every unreferenced index file
  void Refresh(std::string_view segment = {});

  // Take a point-in-time view over the most recent commit,
  // throws index_not_found if there are no commits
  IndexSnapshot OpenSnapshot();

  // Release files of the last checkpoint
  void Close();

 private:
  struct FileRef {
    size_t count{};
  };

  friend class IndexSnapshot;

  void IncRefLocked(std::string_view file);
  void DecRefLocked(std::string_view file);
  void IncRefLocked(std::span<const std::string> files);
  void DecRefLocked(std::span<const std::string> files);
  void DeleteFileLocked(std::string_view file) noexcept;
  void DeleteCommitsLocked();
  void DeletePendingFilesLocked() noexcept;
  void RefreshLocked(std::string_view segment);

  mutable std::mutex mutex_;
  directory& dir_;
  IndexDeletionPolicy& policy_;
  absl::flat_hash_map<std::string, FileRef> refs_;
  absl::flat_hash_set<std::string> pending_;
  IndexCommits commits_;
  std::vector<std::string> last_files_;  // files of the last checkpoint
};

}  // namespace strata
