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
#include <exception>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "index/merge_policy.hpp"
#include "utils/noncopyable.hpp"

namespace strata {

// Queue of merges registered by a writer
class MergeSource {
 public:
  virtual ~MergeSource() = default;

  // Pop the next pending merge, nullptr if there is none
  virtual std::shared_ptr<OneMerge> NextMerge() = 0;

  virtual bool HasPendingMerges() = 0;

  // Execute a merge in the calling thread, throws on failure
  virtual void Merge(OneMerge& merge) = 0;
};

// Executes merges pulled from a merge source
class MergeScheduler : private util::noncopyable {
 public:
  using ptr = std::unique_ptr<MergeScheduler>;

  virtual ~MergeScheduler() = default;

  // Run merges pending in 'source', may return before they finish
  virtual void Merge(MergeSource& source, MergeTrigger trigger) = 0;

  // Wait for running merges, rethrows the first failure of a merge that
  // ran outside of the calling thread
  virtual void Sync() {}

  // Wait for running merges and release resources
  virtual void Close() = 0;

  // An independent scheduler with the same configuration
  virtual ptr Clone() const = 0;
};

// Runs merges one at a time in the calling thread
class SerialMergeScheduler final : public MergeScheduler {
 public:
  // The first failed merge stops the loop, its error is rethrown and
  // the remaining merges stay pending in 'source'
  void Merge(MergeSource& source, MergeTrigger trigger) final;

  void Close() final {}

  MergeScheduler::ptr Clone() const final {
    return std::make_unique<SerialMergeScheduler>();
  }

 private:
  std::mutex mutex_;
};

// Runs merges in a bounded pool of worker threads.
//
// Every merge queued in a source is pulled on request. At most
// 'max_thread_count' merges run at once, pending merges are started
// smallest first so that a large merge doesn't starve many small ones.
// A thread requesting merges stalls while more than 'max_merge_count'
// merges are pending or running.
class ConcurrentMergeScheduler final : public MergeScheduler {
 public:
  static constexpr size_t kDefaultMaxThreadCount = 1;
  static constexpr size_t kDefaultMaxMergeCount = kDefaultMaxThreadCount + 1;

  ConcurrentMergeScheduler() = default;
  ~ConcurrentMergeScheduler() override;

  // Throws illegal_argument unless
  // 1 <= max_thread_count <= max_merge_count
  void SetMaxMergesAndThreads(size_t max_merge_count, size_t max_thread_count);

  size_t MaxMergeCount() const;
  size_t MaxThreadCount() const;

  void Merge(MergeSource& source, MergeTrigger trigger) final;

  void Sync() final;

  // Drains every pending merge, the wait can't be interrupted
  void Close() final;

  MergeScheduler::ptr Clone() const final;

  size_t PendingMerges() const;
  size_t RunningMerges() const;
  // Estimated bytes of running merges
  uint64_t RunningBytes() const;

 private:
  struct Task {
    std::shared_ptr<OneMerge> merge;
    MergeSource* source;
    uint64_t seq;  // admission order among equally sized merges
  };

  struct TaskLess {
    bool operator()(const Task& lhs, const Task& rhs) const noexcept {
      return lhs.merge->estimated_bytes == rhs.merge->estimated_bytes
               ? lhs.seq < rhs.seq
               : lhs.merge->estimated_bytes < rhs.merge->estimated_bytes;
    }
  };

  // Pull every merge queued in 'source'
  void PullLocked(MergeSource& source);
  void StartWorkersLocked();
  void Run();
  void WaitLocked(std::unique_lock<std::mutex>& lock);
  void RethrowLocked();

  mutable std::mutex mutex_;
  std::condition_variable cond_;
  std::set<Task, TaskLess> pending_;
  std::vector<Task> running_;
  std::vector<std::thread> workers_;
  std::exception_ptr error_;  // first failure of a merge
  size_t max_merge_count_{kDefaultMaxMergeCount};
  size_t max_thread_count_{kDefaultMaxThreadCount};
  uint64_t seq_{};
  bool closed_{false};
};

}  // namespace strata
