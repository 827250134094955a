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

#include <chrono>
#include <memory>
#include <vector>

#include "index/index_meta.hpp"

namespace strata {

// Durably persisted generation of an index, i.e. 'segments_N' file
class IndexCommit {
 public:
  using ptr = std::shared_ptr<IndexCommit>;

  IndexCommit(std::shared_ptr<const IndexMeta> meta, std::string segments_file);

  const IndexMeta& meta() const noexcept { return *meta_; }
  const std::shared_ptr<const IndexMeta>& meta_ptr() const noexcept {
    return meta_;
  }

  uint64_t generation() const noexcept { return meta_->generation(); }
  uint64_t timestamp() const noexcept { return meta_->timestamp(); }

  const std::string& segments_file() const noexcept { return segments_file_; }

  // All files referenced by a commit including the commit file itself
  const std::vector<std::string>& files() const noexcept { return files_; }

  // Mark commit for deletion, the commit is dropped once the policy returns
  void Delete() noexcept { deleted_ = true; }

  bool IsDeleted() const noexcept { return deleted_; }

 private:
  std::shared_ptr<const IndexMeta> meta_;
  std::string segments_file_;
  std::vector<std::string> files_;
  bool deleted_{false};
};

// Known commits ordered from the oldest to the most recent one
using IndexCommits = std::vector<IndexCommit::ptr>;

// Decides which commits of an index may be removed,
// the last commit is the current state of an index and must be kept
class IndexDeletionPolicy {
 public:
  using ptr = std::shared_ptr<IndexDeletionPolicy>;

  virtual ~IndexDeletionPolicy() = default;

  // Invoked once for the commits found in a directory
  virtual void OnInit(const IndexCommits& commits) = 0;

  // Invoked after every successful commit
  virtual void OnCommit(const IndexCommits& commits) = 0;
};

class KeepAllDeletionPolicy final : public IndexDeletionPolicy {
 public:
  void OnInit(const IndexCommits&) final {}
  void OnCommit(const IndexCommits&) final {}
};

class KeepOnlyLastCommitDeletionPolicy final : public IndexDeletionPolicy {
 public:
  void OnInit(const IndexCommits& commits) final { OnCommit(commits); }
  void OnCommit(const IndexCommits& commits) final;
};

// Keeps 'num_commits' most recent commits
class KeepLastCommitsDeletionPolicy final : public IndexDeletionPolicy {
 public:
  explicit KeepLastCommitsDeletionPolicy(size_t num_commits);

  void OnInit(const IndexCommits& commits) final { OnCommit(commits); }
  void OnCommit(const IndexCommits& commits) final;

 private:
  size_t num_commits_;
};

// Keeps commits made within 'expiration' of the most recent one
class ExpirationTimeDeletionPolicy final : public IndexDeletionPolicy {
 public:
  explicit ExpirationTimeDeletionPolicy(std::chrono::milliseconds expiration);

  void OnInit(const IndexCommits& commits) final { OnCommit(commits); }
  void OnCommit(const IndexCommits& commits) final;

 private:
  std::chrono::milliseconds expiration_;
};

}  // namespace strata
