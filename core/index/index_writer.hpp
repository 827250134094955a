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

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <span>

#include "index/deletion_policy.hpp"
#include "index/index_file_deleter.hpp"
#include "index/merge_policy.hpp"
#include "index/merge_scheduler.hpp"
#include "store/directory.hpp"
#include "utils/noncopyable.hpp"

namespace strata {

struct TrackingDirectory;

// Defines how index writer should be opened
enum OpenMode {
  // Creates new index repository. In case if repository already
  // exists, all contents will be cleared.
  OM_CREATE = 1,

  // Opens existing index repository. In case if repository does not
  // exist, error will be generated.
  OM_APPEND = 2,

  // Opens existing repository or creates a new one
  OM_CREATE_APPEND = OM_CREATE | OM_APPEND
};

// Options the writer should use after creation
struct IndexWriterOptions {
  // Selects segments to merge, nullptr == TieredMergePolicy
  MergePolicy::ptr merge_policy;

  // Prototype of a merge scheduler, the writer runs merges in its own
  // clone, nullptr == ConcurrentMergeScheduler
  std::shared_ptr<const MergeScheduler> merge_scheduler;

  // Decides which commits to keep,
  // nullptr == KeepOnlyLastCommitDeletionPolicy
  std::shared_ptr<IndexDeletionPolicy> deletion_policy;

  // How long to wait for the write lock,
  // index_lock::kLockWaitForever == wait forever
  int64_t lock_wait_timeout_ms{index_lock::kLockPollIntervalMs};
};

// The only writer of an index.
//
// Segments are produced by Flush(...) and DeleteDocuments(...), merged by
// a merge scheduler in the background and published by Commit(). Every
// change produces a new generation which is checkpointed by the index file
// deleter, so that files are removed once neither the current generation
// nor a kept commit references them.
//
// Thread-safe.
class IndexWriter final : public MergeSource, private util::noncopyable {
 private:
  // Disallow using public constructor
  struct ConstructToken {
    explicit ConstructToken() = default;
  };

 public:
  using ptr = std::shared_ptr<IndexWriter>;

  // Obtains the write lock of 'dir' and opens an index in it,
  // throws lock_obtain_failed if the lock is held by another writer,
  // index_not_found in OM_APPEND mode for an empty directory
  static IndexWriter::ptr Make(directory& dir, OpenMode mode,
                               const IndexWriterOptions& opts = {});

  IndexWriter(ConstructToken, directory& dir, LockGuard&& lock,
              const IndexWriterOptions& opts,
              std::shared_ptr<const IndexMeta>&& meta, bool changed);

  // Rolls back uncommitted changes unless closed
  ~IndexWriter() override;

  // Write a new segment of 'docs_count' documents and 'byte_size' bytes
  // of data, returns the name of the segment
  std::string Flush(uint64_t docs_count, uint64_t byte_size);

  // Mark 'count' live documents of a segment as deleted,
  // throws illegal_argument for an unknown segment or
  // if the segment has less than 'count' live documents
  void DeleteDocuments(std::string_view segment, uint64_t count);

  // Publish the current generation as a new commit,
  // no-op if nothing changed since the last commit
  void Commit();

  // Ask the merge policy for merges and pass them to the merge scheduler
  void MaybeMerge();

  // Merge an index down to at most 'max_segment_count' segments,
  // returns once the merges finish
  void ForceMerge(size_t max_segment_count);

  // Merge away deleted documents, returns once the merges finish
  void ForceMergeDeletes();

  // Wait for every registered merge, rethrows the first failure of a merge
  // run by the merge scheduler
  void WaitForMerges();

  // Drains the merge scheduler, commits pending changes
  // and releases the write lock. On failure changes are rolled back.
  void Close();

  // Abort running merges, drop every change since the last commit
  // and release the write lock
  void Rollback();

  // Point-in-time view over the last commit
  IndexSnapshot OpenSnapshot();

  std::shared_ptr<const IndexMeta> Meta() const;
  std::shared_ptr<const IndexMeta> CommittedMeta() const;

  // Number of merges registered but not yet finished
  size_t RegisteredMerges() const;

  const IndexFileDeleter& Deleter() const noexcept { return *deleter_; }
  const MergeScheduler& Scheduler() const noexcept { return *merge_scheduler_; }

  bool IsClosed() const;

  // MergeSource
  std::shared_ptr<OneMerge> NextMerge() final;
  bool HasPendingMerges() final;
  void Merge(OneMerge& merge) final;

 private:
  void EnsureOpenLocked() const;
  std::string NextSegmentNameLocked();

  // Publish 'meta' as the current generation
  void CheckpointLocked(std::shared_ptr<IndexMeta>&& meta);

  void MaybeMerge(MergeTrigger trigger);
  void UpdatePendingMerges(MergeTrigger trigger);

  // Returns number of registered merges
  size_t RegisterMergesLocked(MergeSpecification&& spec);
  void FinishMergeLocked(OneMerge& merge) noexcept;

  template<typename Finder>
  void ForceMergeImpl(Finder&& finder);

  // Replace inputs of 'merge' with its output in a new generation
  void CommitMerge(OneMerge& merge, TrackingDirectory& dir,
                   std::vector<std::string>& files);

  // Releases partial output of a failed merge
  void MergeFailed(OneMerge& merge, std::string_view segment,
                   std::span<const std::string> files) noexcept;

  directory& dir_;
  LockGuard write_lock_;
  MergePolicy::ptr merge_policy_;
  std::shared_ptr<IndexDeletionPolicy> deletion_policy_;
  mutable std::mutex mutex_;
  std::condition_variable merge_cv_;
  std::shared_ptr<const IndexMeta> meta_;       // current generation
  std::shared_ptr<const IndexMeta> committed_;  // last commit
  std::unique_ptr<IndexFileDeleter> deleter_;
  std::deque<std::shared_ptr<OneMerge>> pending_merges_;
  std::vector<std::shared_ptr<OneMerge>> registered_merges_;
  MergingSegments merging_;
  uint64_t seg_counter_;
  bool changed_;
  bool closed_{false};
  // must be destroyed first since it runs merges against the writer
  MergeScheduler::ptr merge_scheduler_;
};

}  // namespace strata
