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

#include "index/index_meta_io.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "formats/format_utils.hpp"
#include "index/file_names.hpp"
#include "store/store_utils.hpp"
#include "utils/log.hpp"

namespace strata {
namespace {

enum SegmentFlags : byte_type { kUseCompoundFile = 1 };

IndexInput::ptr OpenInput(const directory& dir, std::string_view filename) {
  auto in = dir.open(filename);

  if (!in) {
    throw file_not_found{filename};
  }

  return in;
}

void SyncFile(directory& dir, std::string_view filename) {
  if (!dir.sync({&filename, 1})) {
    throw io_error{absl::StrCat("Failed to sync file, path: ", filename)};
  }
}

}  // namespace

IndexMetaWriter::~IndexMetaWriter() { rollback(); }

bool IndexMetaWriter::prepare(directory& dir, IndexMeta& meta) {
  if (meta_) {
    // prepare() was already called with no corresponding call to commit()
    return false;
  }

  const auto prev_gen = meta.gen_;
  meta.gen_ = meta.next_generation();

  const auto seg_file = file_name(kPendingSegmentsPrefix, meta.gen_);

  try {
    const auto files = meta.files();
    std::vector<std::string_view> names(files.begin(), files.end());

    if (!dir.sync(names)) {
      throw io_error{absl::StrCat("Failed to sync files referenced by '",
                                  seg_file, "'")};
    }

    auto out = dir.create(seg_file);

    if (!out) {
      throw io_error{absl::StrCat("Failed to create file, path: ", seg_file)};
    }

    format_utils::write_header(*out, IndexMetaWriter::kFormatName, kFormatMax);
    out->WriteV64(meta.gen_);
    out->WriteU64(meta.seg_counter_);
    out->WriteU64(meta.timestamp_);
    out->WriteV32(static_cast<uint32_t>(meta.size()));

    for (auto& segment : meta.segments_) {
      WriteStr(*out, segment.filename);
    }

    format_utils::write_footer(*out);
    out->Close();  // important to close output here

    SyncFile(dir, seg_file);
  } catch (...) {
    meta.gen_ = prev_gen;

    if (!dir.remove(seg_file)) {
      STRATA_LOG_ERROR(absl::StrCat("Failed to remove file, path: ", seg_file));
    }

    throw;
  }

  // only noexcept operations below
  dir_ = &dir;
  meta_ = &meta;
  last_gen_ = prev_gen;

  return true;
}

bool IndexMetaWriter::commit() {
  if (!meta_) {
    return false;
  }

  const auto src = file_name(kPendingSegmentsPrefix, meta_->gen_);
  const auto dst = file_name(kSegmentsPrefix, meta_->gen_);

  if (!dir_->rename(src, dst)) {
    rollback();

    throw io_error{absl::StrCat("Failed to rename file, src path: '", src,
                                "' dst path: '", dst, "'")};
  }

  // only noexcept operations below
  meta_->last_gen_ = meta_->gen_;

  // clear pending state
  meta_ = nullptr;
  dir_ = nullptr;

  return true;
}

void IndexMetaWriter::rollback() noexcept {
  if (!meta_) {
    return;
  }

  std::string seg_file;

  try {
    seg_file = file_name(kPendingSegmentsPrefix, meta_->gen_);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat(
      "Caught error while generating file name for index meta, reason: ",
      e.what()));
  }

  if (!seg_file.empty() && !dir_->remove(seg_file)) {  // suppress all errors
    STRATA_LOG_ERROR(absl::StrCat("Failed to remove file, path: ", seg_file));
  }

  meta_->gen_ = last_gen_;

  // clear pending state
  dir_ = nullptr;
  meta_ = nullptr;
}

bool IndexMetaReader::last_segments_file(const directory& dir,
                                         std::string& out) {
  uint64_t max_gen = 0;
  directory::visitor_f visitor = [&out, &max_gen](std::string_view name) {
    const uint64_t gen = parse_generation(name);

    if (index_gen_limits::valid(gen) && gen > max_gen) {
      out = name;
      max_gen = gen;
    }
    return true;  // continue iteration
  };

  if (!dir.visit(visitor)) {
    throw io_error{"Failed to list files in a directory"};
  }

  return max_gen > 0;
}

void IndexMetaReader::read(const directory& dir, IndexMeta& meta,
                           std::string_view filename) {
  auto in = OpenInput(dir, filename);

  const auto checksum = format_utils::checksum(*in);

  format_utils::check_header(*in, IndexMetaWriter::kFormatName,
                             IndexMetaWriter::kFormatMin,
                             IndexMetaWriter::kFormatMax);

  const auto gen = in->ReadV64();

  if (const auto expected = parse_generation(filename);
      index_gen_limits::valid(expected) && expected != gen) {
    throw index_error{absl::StrCat("Generation mismatch in '", filename,
                                   "', got ", gen)};
  }

  const auto cnt = in->ReadU64();
  const auto timestamp = in->ReadU64();
  const auto seg_count = in->ReadV32();

  std::vector<IndexSegment> segments(seg_count);

  for (auto& segment : segments) {
    segment.filename = ReadString<std::string>(*in);
  }

  format_utils::check_footer(*in, checksum);

  for (auto& segment : segments) {
    SegmentMetaReader::read(dir, segment.meta, segment.filename);
  }

  meta.gen_ = gen;
  meta.last_gen_ = gen;
  meta.seg_counter_ = cnt;
  meta.timestamp_ = timestamp;
  meta.segments_ = std::move(segments);
}

std::string SegmentMetaWriter::write(directory& dir, const SegmentMeta& meta) {
  auto meta_file = file_name(meta.name, meta.version, kSegmentMetaExt);

  auto out = dir.create(meta_file);

  if (!out) {
    throw io_error{absl::StrCat("Failed to create file, path: ", meta_file)};
  }

  format_utils::write_header(*out, kFormatName, kFormatMax);
  WriteStr(*out, meta.name);
  out->WriteV64(meta.version);
  out->WriteV64(meta.docs_count);
  out->WriteV64(meta.live_docs_count);
  out->WriteV64(meta.byte_size);
  out->WriteV64(meta.del_gen);
  out->WriteByte(meta.use_compound_file ? kUseCompoundFile : 0);
  out->WriteV32(static_cast<uint32_t>(meta.files.size()));

  for (auto& file : meta.files) {
    WriteStr(*out, file);
  }

  format_utils::write_footer(*out);
  out->Close();

  return meta_file;
}

void SegmentMetaReader::read(const directory& dir, SegmentMeta& meta,
                             std::string_view filename) {
  auto in = OpenInput(dir, filename);

  const auto checksum = format_utils::checksum(*in);

  format_utils::check_header(*in, SegmentMetaWriter::kFormatName,
                             SegmentMetaWriter::kFormatMin,
                             SegmentMetaWriter::kFormatMax);

  auto name = ReadString<std::string>(*in);
  const auto version = in->ReadV64();
  const auto docs_count = in->ReadV64();
  const auto live_docs_count = in->ReadV64();

  if (live_docs_count > docs_count) {
    throw index_error{absl::StrCat(
      "While reading segment meta '", name, "', error: docs_count(",
      docs_count, ") < live_docs_count(", live_docs_count, ")")};
  }

  const auto byte_size = in->ReadV64();
  const auto del_gen = in->ReadV64();
  const auto flags = in->ReadByte();

  SegmentMeta::FileSet files;
  for (auto count = in->ReadV32(); count; --count) {
    files.emplace(ReadString<std::string>(*in));
  }

  format_utils::check_footer(*in, checksum);

  meta.name = std::move(name);
  meta.version = version;
  meta.docs_count = docs_count;
  meta.live_docs_count = live_docs_count;
  meta.byte_size = byte_size;
  meta.del_gen = del_gen;
  meta.use_compound_file = 0 != (flags & kUseCompoundFile);
  meta.files = std::move(files);
}

}  // namespace strata
