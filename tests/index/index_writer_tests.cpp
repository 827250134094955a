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

#include <algorithm>
#include <chrono>
#include <thread>

#include <absl/container/flat_hash_set.h>

#include "error/error.hpp"
#include "index/file_names.hpp"
#include "index/index_meta_io.hpp"
#include "index/index_writer.hpp"
#include "index/tiered_merge_policy.hpp"
#include "store/memory_directory.hpp"
#include "tests_param.hpp"
#include "utils/directory_utils.hpp"

namespace {

using namespace strata;
using namespace std::chrono_literals;

// Scheduler leaving merges registered by a writer for a test to run
class manual_merge_scheduler final : public MergeScheduler {
 public:
  void Merge(MergeSource&, MergeTrigger) final {}
  void Close() final {}
  MergeScheduler::ptr Clone() const final {
    return std::make_unique<manual_merge_scheduler>();
  }
};

IndexWriterOptions SerialOptions() {
  IndexWriterOptions opts;
  opts.merge_scheduler = std::make_shared<SerialMergeScheduler>();
  opts.lock_wait_timeout_ms = 0;
  return opts;
}

bool Exists(const directory& dir, std::string_view name) {
  return directory_utils::Exists(dir, name);
}

std::vector<std::string> SegmentNames(const IndexMeta& meta) {
  std::vector<std::string> names;
  for (auto& segment : meta.segments()) {
    names.emplace_back(segment.meta.name);
  }
  return names;
}

uint64_t LiveDocs(const IndexMeta& meta) {
  uint64_t count = 0;
  for (auto& segment : meta.segments()) {
    count += segment.meta.live_docs_count;
  }
  return count;
}

// Every index file of a directory is referenced by the commit
void AssertNoDanglingFiles(const directory& dir) {
  std::string last;
  ASSERT_TRUE(IndexMetaReader::last_segments_file(dir, last));

  IndexMeta meta;
  IndexMetaReader::read(dir, meta, last);

  auto files = meta.files();
  files.emplace_back(last);
  const absl::flat_hash_set<std::string> expected(files.begin(), files.end());

  for (auto& file : directory_utils::ListFiles(dir)) {
    if (is_index_file(file)) {
      EXPECT_TRUE(expected.contains(file)) << file;
    }
  }

  for (auto& file : files) {
    EXPECT_TRUE(Exists(dir, file)) << file;
  }
}

class index_writer_test_case : public tests::directory_test_case_base {};

TEST_P(index_writer_test_case, flush_commit_reopen) {
  {
    auto writer = IndexWriter::Make(dir(), OM_CREATE, SerialOptions());
    ASSERT_NE(nullptr, writer);

    ASSERT_EQ("_0", writer->Flush(10, 100));
    ASSERT_EQ("_1", writer->Flush(20, 5000));

    auto meta = writer->Meta();
    ASSERT_EQ((std::vector<std::string>{"_0", "_1"}), SegmentNames(*meta));
    ASSERT_EQ(100, (*meta)[0].meta.byte_size);
    ASSERT_EQ(5000, directory_utils::Length(dir(), "_1.dat"));
    ASSERT_TRUE(writer->CommittedMeta()->empty());

    writer->Commit();
    ASSERT_TRUE(Exists(dir(), "segments_1"));
    ASSERT_EQ(*writer->Meta(), *writer->CommittedMeta());
    ASSERT_EQ(1, writer->CommittedMeta()->generation());
    ASSERT_GT(writer->CommittedMeta()->timestamp(), 0);

    // nothing changed
    writer->Commit();
    ASSERT_FALSE(Exists(dir(), "segments_2"));

    writer->Close();
    ASSERT_TRUE(writer->IsClosed());
  }

  AssertNoDanglingFiles(dir());

  auto writer = IndexWriter::Make(dir(), OM_APPEND, SerialOptions());
  auto meta = writer->Meta();
  ASSERT_EQ((std::vector<std::string>{"_0", "_1"}), SegmentNames(*meta));
  ASSERT_EQ(30, LiveDocs(*meta));

  // segment names are never reused
  ASSERT_EQ("_2", writer->Flush(5, 50));
  writer->Commit();
  ASSERT_TRUE(Exists(dir(), "segments_2"));
  ASSERT_FALSE(Exists(dir(), "segments_1"));
  writer->Close();

  AssertNoDanglingFiles(dir());
}

TEST_P(index_writer_test_case, write_lock) {
  auto writer = IndexWriter::Make(dir(), OM_CREATE, SerialOptions());

  try {
    IndexWriter::Make(dir(), OM_CREATE_APPEND, SerialOptions());
    FAIL();
  } catch (const lock_obtain_failed& e) {
    ASSERT_FALSE(e.reason().empty());
  }

  writer->Close();

  // lock is released by close
  writer = IndexWriter::Make(dir(), OM_CREATE_APPEND, SerialOptions());
  ASSERT_NE(nullptr, writer);
  writer->Rollback();

  // and by rollback
  writer = IndexWriter::Make(dir(), OM_APPEND, SerialOptions());
  ASSERT_NE(nullptr, writer);
}

TEST_P(index_writer_test_case, append_empty_directory) {
  ASSERT_THROW(IndexWriter::Make(dir(), OM_APPEND, SerialOptions()),
               index_not_found);

  // failed open releases the lock
  auto writer = IndexWriter::Make(dir(), OM_CREATE_APPEND, SerialOptions());
  ASSERT_TRUE(writer->Meta()->empty());
}

TEST_P(index_writer_test_case, force_merge_concurrent) {
  TieredMergePolicy::Options options;
  options.max_merge_at_once = 2;
  options.segments_per_tier = 2.;

  IndexWriterOptions opts;
  opts.merge_policy = TieredMergePolicy::Make(options);
  auto scheduler = std::make_shared<ConcurrentMergeScheduler>();
  scheduler->SetMaxMergesAndThreads(3, 2);
  opts.merge_scheduler = scheduler;

  auto writer = IndexWriter::Make(dir(), OM_CREATE, opts);

  uint64_t docs = 0;
  for (uint64_t i = 1; i <= 20; ++i) {
    writer->Flush(i, 64 * i);
    docs += i;
  }

  writer->WaitForMerges();
  ASSERT_EQ(0, writer->RegisteredMerges());
  ASSERT_EQ(docs, LiveDocs(*writer->Meta()));
  ASSERT_LE(writer->Meta()->size(), 20);

  writer->Commit();
  AssertNoDanglingFiles(dir());

  writer->ForceMerge(1);
  ASSERT_EQ(1, writer->Meta()->size());
  ASSERT_EQ(docs, LiveDocs(*writer->Meta()));

  writer->Close();
  AssertNoDanglingFiles(dir());
}

INSTANTIATE_TEST_SUITE_P(index_writer_test, index_writer_test_case,
                         ::testing::ValuesIn(tests::kTestDirs),
                         index_writer_test_case::to_string);

class index_writer_test : public test_base {
 protected:
  MemoryDirectory dir_;
};

TEST_F(index_writer_test, create_over_existing_index) {
  {
    auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
    writer->Flush(10, 100);
    writer->Flush(10, 100);
    writer->Close();
  }

  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  ASSERT_TRUE(writer->Meta()->empty());

  // previous commit is kept until a new one replaces it
  ASSERT_TRUE(Exists(dir_, "_0.dat"));
  ASSERT_TRUE(Exists(dir_, "segments_1"));

  ASSERT_EQ("_2", writer->Flush(1, 10));
  writer->Commit();

  ASSERT_TRUE(Exists(dir_, "segments_2"));
  ASSERT_FALSE(Exists(dir_, "segments_1"));
  ASSERT_FALSE(Exists(dir_, "_0.dat"));
  ASSERT_FALSE(Exists(dir_, "_1.dat"));
  ASSERT_TRUE(Exists(dir_, "_2.dat"));
}

TEST_F(index_writer_test, create_empty_commit) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  writer->Commit();

  ASSERT_TRUE(Exists(dir_, "segments_1"));
  ASSERT_TRUE(writer->CommittedMeta()->empty());
  writer->Close();

  writer = IndexWriter::Make(dir_, OM_APPEND, SerialOptions());
  ASSERT_TRUE(writer->Meta()->empty());
}

TEST_F(index_writer_test, delete_documents) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  writer->Flush(10, 1000);

  ASSERT_THROW(writer->DeleteDocuments("_1", 1), illegal_argument);
  ASSERT_THROW(writer->DeleteDocuments("_0", 11), illegal_argument);

  writer->DeleteDocuments("_0", 0);
  ASSERT_EQ("_0.0.sm", (*writer->Meta())[0].filename);

  writer->DeleteDocuments("_0", 3);
  {
    auto meta = writer->Meta();
    auto& segment = (*meta)[0];
    ASSERT_EQ("_0.1.sm", segment.filename);
    ASSERT_EQ(10, segment.meta.docs_count);
    ASSERT_EQ(7, segment.meta.live_docs_count);
    ASSERT_EQ(1, segment.meta.del_gen);
    ASSERT_EQ(1, segment.meta.version);
    ASSERT_TRUE(segment.meta.files.contains("_0.1.del"));
    ASSERT_TRUE(Exists(dir_, "_0.1.del"));
    ASSERT_FALSE(Exists(dir_, "_0.0.sm"));
  }

  writer->Commit();

  writer->DeleteDocuments("_0", 7);
  {
    auto meta = writer->Meta();
    auto& segment = (*meta)[0];
    ASSERT_EQ("_0.2.sm", segment.filename);
    ASSERT_EQ(0, segment.meta.live_docs_count);
    ASSERT_EQ(2, segment.meta.del_gen);
    ASSERT_FALSE(segment.meta.files.contains("_0.1.del"));
    ASSERT_TRUE(segment.meta.files.contains("_0.2.del"));
  }

  // files of the commit are kept
  ASSERT_TRUE(Exists(dir_, "_0.1.del"));
  ASSERT_TRUE(Exists(dir_, "_0.1.sm"));

  writer->Commit();
  ASSERT_FALSE(Exists(dir_, "_0.1.del"));
  ASSERT_FALSE(Exists(dir_, "_0.1.sm"));

  writer->Close();
  AssertNoDanglingFiles(dir_);

  writer = IndexWriter::Make(dir_, OM_APPEND, SerialOptions());
  ASSERT_EQ(0, LiveDocs(*writer->Meta()));
}

TEST_F(index_writer_test, force_merge) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  ASSERT_THROW(writer->ForceMerge(0), illegal_argument);

  writer->Flush(10, 100);
  writer->Flush(20, 200);
  writer->Flush(30, 300);
  writer->DeleteDocuments("_1", 5);

  writer->ForceMerge(1);

  auto meta = writer->Meta();
  ASSERT_EQ(1, meta->size());

  auto& segment = (*meta)[0].meta;
  ASSERT_EQ("_3", segment.name);
  ASSERT_EQ(55, segment.docs_count);
  ASSERT_EQ(55, segment.live_docs_count);
  ASSERT_EQ(100 + 150 + 300, segment.byte_size);
  ASSERT_FALSE(segment.use_compound_file);
  ASSERT_EQ(SegmentMeta::FileSet{"_3.dat"}, segment.files);
  ASSERT_EQ(550, directory_utils::Length(dir_, "_3.dat"));

  // inputs were never committed
  ASSERT_FALSE(Exists(dir_, "_0.dat"));
  ASSERT_FALSE(Exists(dir_, "_1.dat"));
  ASSERT_FALSE(Exists(dir_, "_1.1.del"));
  ASSERT_FALSE(Exists(dir_, "_2.dat"));

  // already merged
  writer->ForceMerge(1);
  ASSERT_EQ("_3", (*writer->Meta())[0].meta.name);

  writer->Close();
  AssertNoDanglingFiles(dir_);
}

TEST_F(index_writer_test, force_merge_single_segment_with_deletes) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  writer->Flush(10, 100);
  writer->DeleteDocuments("_0", 4);

  writer->ForceMerge(1);

  auto meta = writer->Meta();
  auto& segment = (*meta)[0].meta;
  ASSERT_EQ("_1", segment.name);
  ASSERT_EQ(6, segment.docs_count);
  ASSERT_FALSE(HasRemovals(segment));
  ASSERT_EQ(60, segment.byte_size);
}

TEST_F(index_writer_test, force_merge_deletes) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  writer->Flush(10, 100);
  writer->Flush(10, 100);
  writer->Flush(100, 1000);
  writer->DeleteDocuments("_0", 5);
  writer->DeleteDocuments("_2", 50);

  writer->ForceMergeDeletes();

  auto meta = writer->Meta();
  ASSERT_EQ((std::vector<std::string>{"_3", "_1"}), SegmentNames(*meta));
  ASSERT_EQ(55, (*meta)[0].meta.docs_count);
  ASSERT_FALSE(HasRemovals((*meta)[0].meta));
  ASSERT_EQ(550, (*meta)[0].meta.byte_size);
  ASSERT_EQ(65, LiveDocs(*meta));

  // nothing to reclaim
  writer->ForceMergeDeletes();
  ASSERT_EQ((std::vector<std::string>{"_3", "_1"}),
            SegmentNames(*writer->Meta()));
}

TEST_F(index_writer_test, merge_on_flush) {
  TieredMergePolicy::Options options;
  options.max_merge_at_once = 2;
  options.segments_per_tier = 2.;

  auto opts = SerialOptions();
  opts.merge_policy = TieredMergePolicy::Make(options);

  auto writer = IndexWriter::Make(dir_, OM_CREATE, opts);
  writer->Flush(100, 1000);
  writer->Flush(100, 1000);
  ASSERT_EQ(2, writer->Meta()->size());

  // over budget, merged by the serial scheduler within flush
  writer->Flush(100, 1000);
  ASSERT_EQ((std::vector<std::string>{"_3", "_2"}),
            SegmentNames(*writer->Meta()));
  ASSERT_EQ(200, writer->Meta()->segments().front().meta.docs_count);
  ASSERT_EQ(0, writer->RegisteredMerges());
}

TEST_F(index_writer_test, merge_carries_concurrent_deletes) {
  TieredMergePolicy::Options options;
  options.max_merge_at_once = 2;
  options.segments_per_tier = 2.;

  IndexWriterOptions opts;
  opts.merge_policy = TieredMergePolicy::Make(options);
  opts.merge_scheduler = std::make_shared<manual_merge_scheduler>();

  auto writer = IndexWriter::Make(dir_, OM_CREATE, opts);
  writer->Flush(100, 1000);
  writer->Flush(100, 1000);
  writer->Flush(100, 1000);
  ASSERT_EQ(1, writer->RegisteredMerges());
  ASSERT_TRUE(writer->HasPendingMerges());

  auto merge = writer->NextMerge();
  ASSERT_NE(nullptr, merge);
  ASSERT_EQ(nullptr, writer->NextMerge());
  ASSERT_EQ(2, merge->segments.size());
  ASSERT_EQ("_0", merge->segments[0].name);
  ASSERT_EQ("_1", merge->segments[1].name);
  ASSERT_EQ(OneMerge::State::kPending, merge->state);

  // inputs of a registered merge are not merged again
  writer->MaybeMerge();
  ASSERT_EQ(1, writer->RegisteredMerges());

  // deletes applied while the merge runs
  writer->DeleteDocuments("_1", 10);

  writer->Merge(*merge);
  ASSERT_EQ(OneMerge::State::kCommitted, merge->state);
  ASSERT_TRUE(merge->output.has_value());
  ASSERT_EQ(0, writer->RegisteredMerges());

  auto meta = writer->Meta();
  ASSERT_EQ((std::vector<std::string>{"_3", "_2"}), SegmentNames(*meta));

  auto& merged = (*meta)[0];
  ASSERT_EQ(200, merged.meta.docs_count);
  ASSERT_EQ(190, merged.meta.live_docs_count);
  ASSERT_EQ(2000, merged.meta.byte_size);
  ASSERT_EQ(1, merged.meta.del_gen);
  ASSERT_EQ("_3.1.sm", merged.filename);
  ASSERT_EQ((SegmentMeta::FileSet{"_3.dat", "_3.1.del"}), merged.meta.files);
  ASSERT_FALSE(Exists(dir_, "_3.0.sm"));
  ASSERT_FALSE(Exists(dir_, "_1.1.del"));

  writer->Close();
  AssertNoDanglingFiles(dir_);
}

TEST_F(index_writer_test, rollback) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  writer->Flush(10, 100);
  writer->Commit();

  writer->Flush(20, 200);
  writer->DeleteDocuments("_0", 2);
  ASSERT_TRUE(Exists(dir_, "_1.dat"));
  ASSERT_TRUE(Exists(dir_, "_0.1.del"));

  writer->Rollback();
  ASSERT_TRUE(writer->IsClosed());
  ASSERT_EQ(*writer->CommittedMeta(), *writer->Meta());

  ASSERT_FALSE(Exists(dir_, "_1.dat"));
  ASSERT_FALSE(Exists(dir_, "_1.0.sm"));
  ASSERT_FALSE(Exists(dir_, "_0.1.del"));
  ASSERT_FALSE(Exists(dir_, "_0.1.sm"));
  ASSERT_TRUE(Exists(dir_, "_0.dat"));
  ASSERT_TRUE(Exists(dir_, "_0.0.sm"));

  ASSERT_THROW(writer->Flush(1, 1), illegal_state);
  ASSERT_THROW(writer->Commit(), illegal_state);

  // no-op
  writer->Rollback();
  writer->Close();

  AssertNoDanglingFiles(dir_);

  writer = IndexWriter::Make(dir_, OM_APPEND, SerialOptions());
  ASSERT_EQ((std::vector<std::string>{"_0"}), SegmentNames(*writer->Meta()));
  ASSERT_EQ(10, LiveDocs(*writer->Meta()));
}

TEST_F(index_writer_test, rollback_aborts_merge) {
  TieredMergePolicy::Options options;
  options.max_merge_at_once = 2;
  options.segments_per_tier = 2.;

  IndexWriterOptions opts;
  opts.merge_policy = TieredMergePolicy::Make(options);
  opts.merge_scheduler = std::make_shared<manual_merge_scheduler>();

  auto writer = IndexWriter::Make(dir_, OM_CREATE, opts);
  writer->Flush(100, 1000);
  writer->Flush(100, 1000);
  writer->Commit();
  writer->Flush(100, 1000);

  auto merge = writer->NextMerge();
  ASSERT_NE(nullptr, merge);

  // rollback waits for the merge handed to the scheduler
  std::thread rollback([&writer]() { writer->Rollback(); });

  while (!writer->IsClosed()) {
    std::this_thread::sleep_for(1ms);
  }

  ASSERT_TRUE(merge->progress.IsAborted());
  ASSERT_THROW(writer->Merge(*merge), merge_aborted);
  rollback.join();

  ASSERT_EQ(OneMerge::State::kFailed, merge->state);
  ASSERT_NE(nullptr, merge->error);
  ASSERT_FALSE(merge->output.has_value());
  ASSERT_EQ(0, writer->RegisteredMerges());

  ASSERT_TRUE(Exists(dir_, "_0.dat"));
  ASSERT_TRUE(Exists(dir_, "_1.dat"));
  ASSERT_FALSE(Exists(dir_, "_2.dat"));
  ASSERT_FALSE(Exists(dir_, "_3.dat"));
  AssertNoDanglingFiles(dir_);
}

TEST_F(index_writer_test, close_commits_pending_changes) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  writer->Flush(10, 100);
  writer->Close();

  ASSERT_TRUE(Exists(dir_, "segments_1"));
  ASSERT_THROW(writer->Flush(1, 1), illegal_state);
  ASSERT_THROW(writer->DeleteDocuments("_0", 1), illegal_state);
  ASSERT_THROW(writer->ForceMerge(1), illegal_state);

  // closing twice is fine
  writer->Close();

  writer = IndexWriter::Make(dir_, OM_APPEND, SerialOptions());
  ASSERT_EQ(1, writer->Meta()->size());
}

TEST_F(index_writer_test, destructor_rolls_back) {
  {
    auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
    writer->Flush(10, 100);
  }

  ASSERT_FALSE(Exists(dir_, "segments_1"));
  ASSERT_FALSE(Exists(dir_, "_0.dat"));
  ASSERT_THROW(IndexWriter::Make(dir_, OM_APPEND, SerialOptions()),
               index_not_found);
}

TEST_F(index_writer_test, snapshot) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  ASSERT_THROW(writer->OpenSnapshot(), index_not_found);

  writer->Flush(10, 100);
  writer->Flush(10, 100);
  writer->Commit();

  auto snapshot = writer->OpenSnapshot();
  ASSERT_TRUE(snapshot);
  ASSERT_EQ(2, snapshot.meta().size());
  ASSERT_EQ("segments_1", snapshot.commit().segments_file());

  writer->ForceMerge(1);
  writer->Commit();

  ASSERT_TRUE(Exists(dir_, "_0.dat"));
  ASSERT_TRUE(Exists(dir_, "_1.dat"));
  ASSERT_TRUE(Exists(dir_, "segments_1"));
  ASSERT_EQ(1, writer->Deleter().Commits().size());

  snapshot.reset();
  ASSERT_FALSE(Exists(dir_, "_0.dat"));
  ASSERT_FALSE(Exists(dir_, "_1.dat"));
  ASSERT_FALSE(Exists(dir_, "segments_1"));
  ASSERT_TRUE(Exists(dir_, "segments_2"));

  writer->Close();
}

TEST_F(index_writer_test, keep_all_commits) {
  auto opts = SerialOptions();
  opts.deletion_policy = std::make_shared<KeepAllDeletionPolicy>();

  auto writer = IndexWriter::Make(dir_, OM_CREATE, opts);
  writer->Flush(10, 100);
  writer->Commit();
  writer->Flush(10, 100);
  writer->Commit();
  writer->ForceMerge(1);
  writer->Commit();

  auto commits = writer->Deleter().Commits();
  ASSERT_EQ(3, commits.size());
  ASSERT_EQ(1, commits[0]->meta().size());
  ASSERT_EQ(2, commits[1]->meta().size());
  ASSERT_EQ(1, commits[2]->meta().size());

  ASSERT_TRUE(Exists(dir_, "segments_1"));
  ASSERT_TRUE(Exists(dir_, "segments_2"));
  ASSERT_TRUE(Exists(dir_, "segments_3"));
  ASSERT_TRUE(Exists(dir_, "_0.dat"));
  ASSERT_TRUE(Exists(dir_, "_1.dat"));
  ASSERT_TRUE(Exists(dir_, "_2.dat"));
  writer->Close();

  // reopening with the default policy keeps only the last commit
  writer = IndexWriter::Make(dir_, OM_APPEND, SerialOptions());
  ASSERT_FALSE(Exists(dir_, "segments_1"));
  ASSERT_FALSE(Exists(dir_, "segments_2"));
  ASSERT_FALSE(Exists(dir_, "_0.dat"));
  ASSERT_TRUE(Exists(dir_, "_2.dat"));
}

TEST_F(index_writer_test, serial_scheduler_failure) {
  auto writer = IndexWriter::Make(dir_, OM_CREATE, SerialOptions());
  writer->Flush(10, 100);
  writer->Flush(10, 100);

  // an input vanished from the directory
  ASSERT_TRUE(dir_.remove("_1.dat"));

  ASSERT_THROW(writer->ForceMerge(1), file_not_found);
  ASSERT_EQ(0, writer->RegisteredMerges());
  ASSERT_EQ(2, writer->Meta()->size());
  ASSERT_FALSE(Exists(dir_, "_2.dat"));
  ASSERT_FALSE(Exists(dir_, "_2.0.sm"));
}

TEST_F(index_writer_test, serial_scheduler_failure_leaves_queued_merges) {
  TieredMergePolicy::Options options;
  options.max_merge_at_once_explicit = 2;

  auto opts = SerialOptions();
  opts.merge_policy = TieredMergePolicy::Make(options);

  auto writer = IndexWriter::Make(dir_, OM_CREATE, opts);
  writer->Flush(10, 100);
  writer->Flush(10, 200);
  writer->Flush(10, 300);
  writer->Flush(10, 400);

  // {_0, _1} merged first, {_2, _3} is still queued when it fails
  ASSERT_TRUE(dir_.remove("_0.dat"));

  ASSERT_THROW(writer->ForceMerge(2), file_not_found);
  ASSERT_EQ(1, writer->RegisteredMerges());
  ASSERT_FALSE(Exists(dir_, "_4.dat"));

  // queued merge runs instead of waiting forever
  writer->WaitForMerges();
  ASSERT_EQ(0, writer->RegisteredMerges());

  auto meta = writer->Meta();
  ASSERT_EQ((std::vector<std::string>{"_0", "_1", "_5"}), SegmentNames(*meta));
  ASSERT_EQ(700, (*meta)[2].meta.byte_size);
  ASSERT_TRUE(Exists(dir_, "_5.dat"));
  ASSERT_FALSE(Exists(dir_, "_2.dat"));
  ASSERT_FALSE(Exists(dir_, "_3.dat"));
}

TEST_F(index_writer_test, close_drops_queued_merges) {
  TieredMergePolicy::Options options;
  options.max_merge_at_once_explicit = 2;

  auto opts = SerialOptions();
  opts.merge_policy = TieredMergePolicy::Make(options);

  auto writer = IndexWriter::Make(dir_, OM_CREATE, opts);
  writer->Flush(10, 100);
  writer->Flush(10, 200);
  writer->Flush(10, 300);
  writer->Flush(10, 400);
  ASSERT_TRUE(dir_.remove("_0.dat"));

  ASSERT_THROW(writer->ForceMerge(2), file_not_found);
  ASSERT_EQ(1, writer->RegisteredMerges());

  writer->Close();
  ASSERT_TRUE(writer->IsClosed());
  ASSERT_EQ(0, writer->RegisteredMerges());
  ASSERT_EQ((std::vector<std::string>{"_0", "_1", "_2", "_3"}),
            SegmentNames(*writer->CommittedMeta()));
  ASSERT_TRUE(Exists(dir_, "segments_1"));
}

}  // namespace
