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

#include "index/merge_scheduler.hpp"

#include <algorithm>
#include <utility>

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/log.hpp"

namespace strata {

void SerialMergeScheduler::Merge(MergeSource& source, MergeTrigger trigger) {
  std::lock_guard lock{mutex_};

  STRATA_LOG_TRACE(absl::StrCat("Serial merge on ", MergeTriggerName(trigger)));

  while (auto merge = source.NextMerge()) {
    source.Merge(*merge);
  }
}

ConcurrentMergeScheduler::~ConcurrentMergeScheduler() {
  try {
    Close();
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat(
      "Merge failure reported while destroying merge scheduler, error: ",
      e.what()));
  }
}

void ConcurrentMergeScheduler::SetMaxMergesAndThreads(size_t max_merge_count,
                                                      size_t max_thread_count) {
  if (max_thread_count < 1) {
    throw illegal_argument{
      absl::StrCat("max_thread_count must be >= 1, got ", max_thread_count)};
  }

  if (max_merge_count < max_thread_count) {
    throw illegal_argument{absl::StrCat(
      "max_merge_count must be >= max_thread_count, got max_merge_count=",
      max_merge_count, ", max_thread_count=", max_thread_count)};
  }

  {
    std::lock_guard lock{mutex_};
    max_merge_count_ = max_merge_count;
    max_thread_count_ = max_thread_count;
  }

  cond_.notify_all();
}

size_t ConcurrentMergeScheduler::MaxMergeCount() const {
  std::lock_guard lock{mutex_};
  return max_merge_count_;
}

size_t ConcurrentMergeScheduler::MaxThreadCount() const {
  std::lock_guard lock{mutex_};
  return max_thread_count_;
}

void ConcurrentMergeScheduler::Merge(MergeSource& source,
                                     MergeTrigger trigger) {
  std::unique_lock lock{mutex_};

  if (closed_) {
    throw illegal_state{"Merge scheduler is closed"};
  }

  STRATA_LOG_TRACE(
    absl::StrCat("Concurrent merge on ", MergeTriggerName(trigger)));

  StartWorkersLocked();

  // all queued merges are ordered by size before any of them starts
  PullLocked(source);
  cond_.notify_all();

  if (pending_.size() + running_.size() > max_merge_count_) {
    // stall the caller until enough merges finish
    STRATA_LOG_DEBUG(absl::StrCat("Too many merges (",
                                  pending_.size() + running_.size(),
                                  "), stalling merge request"));
    cond_.wait(lock, [this]() {
      return pending_.size() + running_.size() <= max_merge_count_;
    });
  }
}

void ConcurrentMergeScheduler::Sync() {
  std::unique_lock lock{mutex_};
  WaitLocked(lock);
  RethrowLocked();
}

void ConcurrentMergeScheduler::Close() {
  std::vector<std::thread> workers;

  {
    std::unique_lock lock{mutex_};
    WaitLocked(lock);
    closed_ = true;
    workers = std::move(workers_);
    workers_.clear();
  }

  cond_.notify_all();

  for (auto& worker : workers) {
    worker.join();
  }

  std::lock_guard lock{mutex_};
  RethrowLocked();
}

MergeScheduler::ptr ConcurrentMergeScheduler::Clone() const {
  auto clone = std::make_unique<ConcurrentMergeScheduler>();
  clone->SetMaxMergesAndThreads(MaxMergeCount(), MaxThreadCount());
  return clone;
}

size_t ConcurrentMergeScheduler::PendingMerges() const {
  std::lock_guard lock{mutex_};
  return pending_.size();
}

size_t ConcurrentMergeScheduler::RunningMerges() const {
  std::lock_guard lock{mutex_};
  return running_.size();
}

uint64_t ConcurrentMergeScheduler::RunningBytes() const {
  std::lock_guard lock{mutex_};

  uint64_t bytes = 0;
  for (auto& task : running_) {
    bytes += task.merge->estimated_bytes;
  }
  return bytes;
}

void ConcurrentMergeScheduler::PullLocked(MergeSource& source) {
  while (auto merge = source.NextMerge()) {
    pending_.emplace(Task{std::move(merge), &source, seq_++});
  }
}

void ConcurrentMergeScheduler::StartWorkersLocked() {
  while (workers_.size() < max_thread_count_) {
    workers_.emplace_back([this]() { Run(); });
  }
}

void ConcurrentMergeScheduler::Run() {
  std::unique_lock lock{mutex_};

  while (true) {
    cond_.wait(lock, [this]() {
      return closed_ ||
             (!pending_.empty() && running_.size() < max_thread_count_);
    });

    if (pending_.empty() || running_.size() >= max_thread_count_) {
      if (closed_ && pending_.empty()) {
        return;
      }
      continue;
    }

    // the smallest pending merge goes first
    auto task = std::move(pending_.extract(pending_.begin()).value());
    running_.emplace_back(task);

    lock.unlock();

    try {
      task.source->Merge(*task.merge);
    } catch (const merge_aborted& e) {
      STRATA_LOG_DEBUG(absl::StrCat("Merge aborted, reason: ", e.what()));
    } catch (const std::exception& e) {
      STRATA_LOG_ERROR(absl::StrCat("Merge failed, error: ", e.what()));

      std::lock_guard error_lock{mutex_};
      if (!error_) {
        error_ = std::current_exception();
      }
    }

    lock.lock();

    running_.erase(std::find_if(running_.begin(), running_.end(),
                                [&task](const Task& t) {
                                  return t.merge == task.merge;
                                }));

    // merges cascading from the finished one
    if (!closed_) {
      try {
        PullLocked(*task.source);
      } catch (const std::exception& e) {
        STRATA_LOG_ERROR(
          absl::StrCat("Failed to pull pending merges, error: ", e.what()));
        if (!error_) {
          error_ = std::current_exception();
        }
      }
    }

    cond_.notify_all();
  }
}

void ConcurrentMergeScheduler::WaitLocked(std::unique_lock<std::mutex>& lock) {
  cond_.wait(lock, [this]() { return pending_.empty() && running_.empty(); });
}

void ConcurrentMergeScheduler::RethrowLocked() {
  if (error_) {
    std::rethrow_exception(std::exchange(error_, nullptr));
  }
}

}  // namespace strata
