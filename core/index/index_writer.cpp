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

#include "index/index_writer.hpp"

#include <algorithm>
#include <chrono>

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "formats/format_utils.hpp"
#include "index/file_names.hpp"
#include "index/index_meta_io.hpp"
#include "index/tiered_merge_policy.hpp"
#include "utils/directory_utils.hpp"
#include "utils/log.hpp"
#include "utils/misc.hpp"

namespace strata {
namespace {

constexpr std::string_view kDeletesFormatName = "strata_10_deletes";
constexpr int32_t kDeletesFormatMax = 0;

constexpr size_t kBufferSize = 4096;

std::string DataFileName(const SegmentMeta& meta) {
  return file_name(meta.name,
                   meta.use_compound_file ? kCompoundExt : kDataExt);
}

IndexOutput::ptr CreateOutput(directory& dir, std::string_view name) {
  auto out = dir.create(name);

  if (!out) {
    throw io_error{absl::StrCat("Failed to create file, path: ", name)};
  }

  return out;
}

// Segment payload, byte 'i' of a segment holds 'i % 256'
void WritePayload(IndexOutput& out, uint64_t size) {
  byte_type buf[kBufferSize];
  for (size_t i = 0; i < kBufferSize; ++i) {
    buf[i] = static_cast<byte_type>(i);
  }

  while (size) {
    const auto chunk = static_cast<size_t>(std::min<uint64_t>(size, kBufferSize));
    out.WriteBytes(buf, chunk);
    size -= chunk;
  }
}

// Copy at most 'limit' leading bytes of a file
uint64_t CopyPrefix(const directory& dir, std::string_view name,
                    IndexOutput& out, uint64_t limit, MergeProgress& progress,
                    std::string_view segment) {
  auto in = dir.open(name);

  if (!in) {
    throw file_not_found{name};
  }

  byte_type buf[kBufferSize];
  uint64_t copied = 0;

  while (copied < limit) {
    progress.CheckAborted(segment);

    const auto chunk =
      static_cast<size_t>(std::min<uint64_t>(limit - copied, kBufferSize));
    const auto read = in->ReadBytes(buf, chunk);

    if (!read) {
      break;
    }

    out.WriteBytes(buf, read);
    copied += read;
    progress.AddWork(read);
  }

  return copied;
}

// Write a deletes file of the current deletes generation of a segment,
// returns the file name
std::string WriteDeletes(directory& dir, const SegmentMeta& meta) {
  STRATA_ASSERT(del_gen_limits::valid(meta.del_gen));

  auto filename = file_name(meta.name, meta.del_gen, kDeletesExt);
  auto out = CreateOutput(dir, filename);
  format_utils::write_header(*out, kDeletesFormatName, kDeletesFormatMax);
  out->WriteV64(DeletedDocs(meta));
  format_utils::write_footer(*out);
  out->Close();

  return filename;
}

// Register a new deletes generation for 'meta'
void BumpDeletes(directory& dir, SegmentMeta& meta) {
  if (del_gen_limits::valid(meta.del_gen)) {
    meta.files.erase(file_name(meta.name, meta.del_gen, kDeletesExt));
    ++meta.del_gen;
  } else {
    meta.del_gen = 1;
  }

  ++meta.version;
  meta.files.emplace(WriteDeletes(dir, meta));
}

uint64_t Now() noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

}  // namespace

IndexWriter::ptr IndexWriter::Make(directory& dir, OpenMode mode,
                                   const IndexWriterOptions& opts) {
  auto lock = dir.make_lock(kWriteLockName);

  if (!lock) {
    throw lock_obtain_failed{kWriteLockName, "failed to create lock"};
  }

  if (!lock->try_lock(opts.lock_wait_timeout_ms)) {
    throw lock_obtain_failed{kWriteLockName, lock->failure_reason()};
  }
  LockGuard guard{std::move(lock)};

  // read from directory or create index metadata
  auto meta = std::make_shared<IndexMeta>();
  std::string filename;
  const bool index_exists = IndexMetaReader::last_segments_file(dir, filename);
  bool changed = true;

  if (OM_CREATE == mode || (OM_CREATE_APPEND == mode && !index_exists)) {
    // for OM_CREATE meta must be fully recreated, meta read only to get
    // last generation and segment counter
    if (index_exists) {
      IndexMetaReader::read(dir, *meta, filename);
      meta->segments().clear();
    }
  } else if (!index_exists) {
    throw index_not_found{};
  } else {
    IndexMetaReader::read(dir, *meta, filename);
    changed = false;
  }

  return std::make_shared<IndexWriter>(ConstructToken{}, dir, std::move(guard),
                                       opts, std::move(meta), changed);
}

IndexWriter::IndexWriter(ConstructToken, directory& dir, LockGuard&& lock,
                         const IndexWriterOptions& opts,
                         std::shared_ptr<const IndexMeta>&& meta, bool changed)
  : dir_{dir},
    write_lock_{std::move(lock)},
    merge_policy_{opts.merge_policy ? opts.merge_policy
                                    : TieredMergePolicy::Make()},
    deletion_policy_{
      opts.deletion_policy
        ? opts.deletion_policy
        : std::make_shared<KeepOnlyLastCommitDeletionPolicy>()},
    meta_{std::move(meta)},
    committed_{meta_},
    seg_counter_{meta_->counter()},
    changed_{changed},
    merge_scheduler_{opts.merge_scheduler
                       ? opts.merge_scheduler->Clone()
                       : std::make_unique<ConcurrentMergeScheduler>()} {
  STRATA_ASSERT(write_lock_);
  deleter_ = std::make_unique<IndexFileDeleter>(dir_, *write_lock_.get(),
                                                *deletion_policy_, meta_);
}

IndexWriter::~IndexWriter() {
  try {
    Rollback();
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat(
      "Caught error while rolling back index writer, reason: ", e.what()));
  }
}

void IndexWriter::EnsureOpenLocked() const {
  if (closed_) {
    throw illegal_state{"Index writer is closed"};
  }
}

std::string IndexWriter::NextSegmentNameLocked() {
  return file_name(seg_counter_++);
}

void IndexWriter::CheckpointLocked(std::shared_ptr<IndexMeta>&& meta) {
  meta->SetCounter(seg_counter_);
  deleter_->Checkpoint(meta, false);
  meta_ = std::move(meta);
  changed_ = true;
}

std::string IndexWriter::Flush(uint64_t docs_count, uint64_t byte_size) {
  std::string name;

  {
    std::lock_guard lock{mutex_};
    EnsureOpenLocked();

    name = NextSegmentNameLocked();

    try {
      SegmentMeta segment;
      segment.name = name;
      segment.docs_count = docs_count;
      segment.live_docs_count = docs_count;
      segment.byte_size = byte_size;

      const auto data_file = DataFileName(segment);
      auto out = CreateOutput(dir_, data_file);
      WritePayload(*out, byte_size);
      out->Close();
      segment.files.emplace(data_file);

      auto filename = SegmentMetaWriter::write(dir_, segment);

      auto meta = std::make_shared<IndexMeta>(*meta_);
      meta->add(IndexSegment{std::move(filename), std::move(segment)});
      CheckpointLocked(std::move(meta));
    } catch (...) {
      deleter_->Refresh(name);  // remove partially written segment
      throw;
    }

    STRATA_LOG_TRACE(absl::StrCat("Flushed segment '", name, "', docs: ",
                                  docs_count, ", bytes: ", byte_size));
  }

  MaybeMerge(MergeTrigger::kSegmentFlush);

  return name;
}

void IndexWriter::DeleteDocuments(std::string_view segment, uint64_t count) {
  std::lock_guard lock{mutex_};
  EnsureOpenLocked();

  auto meta = std::make_shared<IndexMeta>(*meta_);
  auto& segments = meta->segments();

  const auto it =
    std::find_if(segments.begin(), segments.end(),
                 [segment](const IndexSegment& s) { return s.meta.name == segment; });

  if (it == segments.end()) {
    throw illegal_argument{absl::StrCat("Unknown segment '", segment, "'")};
  }

  if (count > it->meta.live_docs_count) {
    throw illegal_argument{absl::StrCat(
      "Failed to delete ", count, " documents from segment '", segment,
      "' having ", it->meta.live_docs_count, " live documents")};
  }

  if (!count) {
    return;
  }

  try {
    auto updated = it->meta;
    updated.live_docs_count -= count;
    BumpDeletes(dir_, updated);
    it->filename = SegmentMetaWriter::write(dir_, updated);
    it->meta = std::move(updated);

    CheckpointLocked(std::move(meta));
  } catch (...) {
    deleter_->Refresh(segment);  // remove files of the failed update
    throw;
  }
}

void IndexWriter::Commit() {
  std::lock_guard lock{mutex_};
  EnsureOpenLocked();

  if (!changed_) {
    return;
  }

  auto meta = std::make_shared<IndexMeta>(*meta_);
  meta->SetCounter(seg_counter_);
  meta->SetTimestamp(Now());

  IndexMetaWriter writer;

  if (!writer.prepare(dir_, *meta)) {
    throw illegal_state{"Failed to prepare commit, commit is already pending"};
  }

  writer.commit();

  // deleter removes 'segments_N' if the deletion policy fails
  deleter_->Checkpoint(meta, true);

  meta_ = meta;
  committed_ = std::move(meta);
  changed_ = false;

  STRATA_LOG_DEBUG(absl::StrCat("Committed generation ",
                                committed_->generation(), ", segments: ",
                                committed_->size()));
}

void IndexWriter::MaybeMerge() { MaybeMerge(MergeTrigger::kExplicit); }

void IndexWriter::MaybeMerge(MergeTrigger trigger) {
  UpdatePendingMerges(trigger);
  merge_scheduler_->Merge(*this, trigger);
}

void IndexWriter::UpdatePendingMerges(MergeTrigger trigger) {
  std::lock_guard lock{mutex_};

  if (closed_) {
    return;
  }

  RegisterMergesLocked(merge_policy_->FindMerges(trigger, *meta_, merging_));
}

size_t IndexWriter::RegisterMergesLocked(MergeSpecification&& spec) {
  size_t count = 0;

  for (auto& merge : spec.merges) {
    const bool disjoint =
      std::none_of(merge->segments.begin(), merge->segments.end(),
                   [this](const SegmentMeta& segment) {
                     return merging_.contains(segment.name) ||
                            !meta_->find(segment.name);
                   });

    if (!disjoint) {
      STRATA_LOG_WARN(
        "Skipping merge of segments already participating in a merge");
      continue;
    }

    for (auto& segment : merge->segments) {
      merging_.emplace(segment.name);
    }

    SegmentMeta estimated;
    estimated.docs_count = merge->TotalLiveDocs();
    estimated.live_docs_count = estimated.docs_count;
    estimated.byte_size = merge->estimated_bytes;
    merge->use_compound_file =
      merge_policy_->UseCompoundFile(*meta_, estimated);

    pending_merges_.emplace_back(merge);
    registered_merges_.emplace_back(std::move(merge));
    ++count;
  }

  return count;
}

void IndexWriter::FinishMergeLocked(OneMerge& merge) noexcept {
  for (auto& segment : merge.segments) {
    merging_.erase(segment.name);
  }

  std::erase_if(registered_merges_,
                [&merge](const std::shared_ptr<OneMerge>& registered) {
                  return registered.get() == &merge;
                });

  merge_cv_.notify_all();
}

std::shared_ptr<OneMerge> IndexWriter::NextMerge() {
  std::lock_guard lock{mutex_};

  if (pending_merges_.empty()) {
    return nullptr;
  }

  auto merge = std::move(pending_merges_.front());
  pending_merges_.pop_front();
  return merge;
}

bool IndexWriter::HasPendingMerges() {
  std::lock_guard lock{mutex_};
  return !pending_merges_.empty();
}

void IndexWriter::Merge(OneMerge& merge) {
  std::string name;

  {
    std::lock_guard lock{mutex_};
    merge.state = OneMerge::State::kRunning;
    name = NextSegmentNameLocked();
  }

  STRATA_LOG_TRACE(absl::StrCat("Merging ", merge.segments.size(),
                                " segments into '", name, "'"));

  TrackingDirectory dir{dir_};
  std::vector<std::string> files;

  try {
    merge.progress.CheckAborted(name);

    SegmentMeta output;
    output.name = name;
    output.use_compound_file = merge.use_compound_file;

    const auto data_file = DataFileName(output);
    auto out = CreateOutput(dir, data_file);

    for (auto& segment : merge.segments) {
      // only live documents of an input survive the merge
      output.byte_size += CopyPrefix(dir_, DataFileName(segment), *out,
                                     LiveBytes(segment), merge.progress, name);
      output.docs_count += segment.live_docs_count;
    }

    out->Close();
    out.reset();

    output.live_docs_count = output.docs_count;
    output.files.emplace(data_file);

    merge.progress.CheckAborted(name);

    auto filename = SegmentMetaWriter::write(dir, output);
    merge.output.emplace(IndexSegment{std::move(filename), std::move(output)});

    // protect output from removal until it becomes a part of a generation
    files = dir.flush_tracked();
    deleter_->IncRef(files);

    CommitMerge(merge, dir, files);
  } catch (...) {
    MergeFailed(merge, name, files);
    throw;
  }

  deleter_->DecRef(files);

  STRATA_LOG_TRACE(absl::StrCat("Finished merge into '", name, "'"));

  UpdatePendingMerges(MergeTrigger::kMergeFinished);
}

void IndexWriter::CommitMerge(OneMerge& merge, TrackingDirectory& dir,
                              std::vector<std::string>& files) {
  STRATA_ASSERT(merge.output);

  std::lock_guard lock{mutex_};

  // a rollback may have dropped inputs of the merge
  merge.progress.CheckAborted(merge.output->meta.name);

  auto meta = std::make_shared<IndexMeta>(*meta_);
  auto& segments = meta->segments();
  auto& output = *merge.output;

  // deletes applied to inputs while the merge was running
  uint64_t carried_deletes = 0;
  auto first = segments.size();

  for (auto& input : merge.segments) {
    const auto it = std::find_if(
      segments.begin(), segments.end(),
      [&input](const IndexSegment& s) { return s.meta.name == input.name; });

    if (it == segments.end()) {
      throw illegal_state{absl::StrCat("Merge input segment '", input.name,
                                       "' is missing")};
    }

    STRATA_ASSERT(it->meta.live_docs_count <= input.live_docs_count);
    carried_deletes += input.live_docs_count - it->meta.live_docs_count;
    first = std::min(first, static_cast<size_t>(it - segments.begin()));
  }

  if (carried_deletes) {
    output.meta.live_docs_count -= carried_deletes;
    BumpDeletes(dir, output.meta);
    output.filename = SegmentMetaWriter::write(dir, output.meta);

    auto carried_files = dir.flush_tracked();
    deleter_->IncRef(carried_files);
    files.insert(files.end(), carried_files.begin(), carried_files.end());
  }

  // output takes position of the first input
  std::vector<IndexSegment> merged;
  merged.reserve(segments.size() - merge.segments.size() + 1);

  for (size_t i = 0; i < segments.size(); ++i) {
    if (i == first) {
      merged.emplace_back(output);
    }

    const auto& name = segments[i].meta.name;

    if (std::none_of(merge.segments.begin(), merge.segments.end(),
                     [&name](const SegmentMeta& s) { return s.name == name; })) {
      merged.emplace_back(std::move(segments[i]));
    }
  }

  segments = std::move(merged);
  CheckpointLocked(std::move(meta));

  merge.state = OneMerge::State::kCommitted;
  FinishMergeLocked(merge);

  STRATA_LOG_DEBUG(absl::StrCat("Committed merge of ", merge.segments.size(),
                                " segments into '", output.meta.name,
                                "', carried deletes: ", carried_deletes));
}

void IndexWriter::MergeFailed(OneMerge& merge, std::string_view segment,
                              std::span<const std::string> files) noexcept {
  std::lock_guard lock{mutex_};

  merge.state = OneMerge::State::kFailed;
  merge.error = std::current_exception();

  try {
    if (!files.empty()) {
      deleter_->DecRef(files);
    }

    // files that were never referenced
    deleter_->Refresh(segment);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to release output of merge '",
                                  segment, "', reason: ", e.what()));
  }

  FinishMergeLocked(merge);
}

template<typename Finder>
void IndexWriter::ForceMergeImpl(Finder&& finder) {
  while (true) {
    {
      std::lock_guard lock{mutex_};
      EnsureOpenLocked();

      if (!RegisterMergesLocked(finder(*meta_, merging_)) &&
          registered_merges_.empty()) {
        return;
      }
    }

    merge_scheduler_->Merge(*this, MergeTrigger::kExplicit);
    WaitForMerges();
  }
}

void IndexWriter::ForceMerge(size_t max_segment_count) {
  if (!max_segment_count) {
    throw illegal_argument{"max_segment_count must be >= 1"};
  }

  ForceMergeImpl([&](const IndexMeta& meta, const MergingSegments& merging) {
    return merge_policy_->FindForcedMerges(meta, max_segment_count, merging);
  });
}

void IndexWriter::ForceMergeDeletes() {
  ForceMergeImpl([&](const IndexMeta& meta, const MergingSegments& merging) {
    return merge_policy_->FindForcedDeletesMerges(meta, merging);
  });
}

void IndexWriter::WaitForMerges() {
  // merges left in the queue by a failed serial run
  if (HasPendingMerges()) {
    merge_scheduler_->Merge(*this, MergeTrigger::kExplicit);
  }

  {
    std::unique_lock lock{mutex_};
    merge_cv_.wait(lock, [this]() { return registered_merges_.empty(); });
  }

  merge_scheduler_->Sync();
}

void IndexWriter::Close() {
  {
    std::lock_guard lock{mutex_};

    if (closed_) {
      return;
    }
  }

  try {
    merge_scheduler_->Close();

    {
      std::lock_guard lock{mutex_};

      // merges a failed serial run never started
      while (!pending_merges_.empty()) {
        auto merge = std::move(pending_merges_.front());
        pending_merges_.pop_front();
        FinishMergeLocked(*merge);
      }
    }

    Commit();
  } catch (...) {
    Rollback();
    throw;
  }

  std::lock_guard lock{mutex_};
  Finally release = [this]() noexcept { write_lock_.reset(); };
  closed_ = true;
  deleter_->Close();
}

void IndexWriter::Rollback() {
  {
    std::lock_guard lock{mutex_};

    if (closed_) {
      return;
    }

    closed_ = true;

    for (auto& merge : registered_merges_) {
      merge->progress.Abort();
    }

    // merges never handed to the scheduler
    while (!pending_merges_.empty()) {
      auto merge = std::move(pending_merges_.front());
      pending_merges_.pop_front();
      FinishMergeLocked(*merge);
    }
  }

  Finally release = [this]() noexcept { write_lock_.reset(); };

  try {
    merge_scheduler_->Close();
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat(
      "Merge failure reported while rolling back index writer, reason: ",
      e.what()));
  }

  std::unique_lock lock{mutex_};
  merge_cv_.wait(lock, [this]() { return registered_merges_.empty(); });

  // drop every uncommitted change
  meta_ = committed_;
  deleter_->Checkpoint(committed_, false);
  deleter_->Refresh();
  deleter_->Close();
  changed_ = false;

  STRATA_LOG_DEBUG("Rolled back index writer");
}

IndexSnapshot IndexWriter::OpenSnapshot() { return deleter_->OpenSnapshot(); }

std::shared_ptr<const IndexMeta> IndexWriter::Meta() const {
  std::lock_guard lock{mutex_};
  return meta_;
}

std::shared_ptr<const IndexMeta> IndexWriter::CommittedMeta() const {
  std::lock_guard lock{mutex_};
  return committed_;
}

size_t IndexWriter::RegisteredMerges() const {
  std::lock_guard lock{mutex_};
  return registered_merges_.size();
}

bool IndexWriter::IsClosed() const {
  std::lock_guard lock{mutex_};
  return closed_;
}

}  // namespace strata
