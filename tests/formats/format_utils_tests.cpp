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

#include "error/error.hpp"
#include "formats/format_utils.hpp"
#include "store/memory_directory.hpp"
#include "tests_shared.hpp"

namespace {

using namespace strata;

constexpr std::string_view kFormat = "strata_test_format";

void WriteFile(directory& dir, std::string_view name, int32_t ver,
               uint64_t payload) {
  auto out = dir.create(name);
  ASSERT_NE(nullptr, out);
  format_utils::write_header(*out, kFormat, ver);
  out->WriteU64(payload);
  format_utils::write_footer(*out);
  out->Close();
}

// Overwrite a single byte of a file
void CorruptByte(directory& dir, std::string_view name, size_t offset) {
  auto in = dir.open(name);
  ASSERT_NE(nullptr, in);

  bstring data(in->Length(), 0);
  ASSERT_EQ(data.size(), in->ReadBytes(data.data(), data.size()));
  data[offset] ^= 0xFF;

  auto out = dir.create(name);
  ASSERT_NE(nullptr, out);
  out->WriteBytes(data.data(), data.size());
  out->Close();
}

TEST(format_utils_test, header_footer) {
  MemoryDirectory dir;
  WriteFile(dir, "file", 1, 42);

  auto in = dir.open("file");
  ASSERT_NE(nullptr, in);

  const auto checksum = format_utils::checksum(*in);
  ASSERT_EQ(0, in->Position());
  ASSERT_EQ(1, format_utils::check_header(*in, kFormat, 0, 2));
  ASSERT_EQ(42, in->ReadU64());
  format_utils::check_footer(*in, checksum);
  ASSERT_TRUE(in->IsEOF());
}

TEST(format_utils_test, header_mismatch) {
  MemoryDirectory dir;
  WriteFile(dir, "file", 3, 42);

  {
    auto in = dir.open("file");
    ASSERT_NE(nullptr, in);
    ASSERT_THROW(format_utils::check_header(*in, "other_format", 0, 3),
                 index_error);
  }

  {
    auto in = dir.open("file");
    ASSERT_NE(nullptr, in);
    ASSERT_THROW(format_utils::check_header(*in, kFormat, 0, 2), index_error);
  }

  CorruptByte(dir, "file", 0);

  {
    auto in = dir.open("file");
    ASSERT_NE(nullptr, in);
    ASSERT_THROW(format_utils::check_header(*in, kFormat, 0, 3), index_error);
  }
}

TEST(format_utils_test, corrupted_payload) {
  MemoryDirectory dir;
  WriteFile(dir, "file", 0, 42);

  auto in = dir.open("file");
  ASSERT_NE(nullptr, in);
  const auto payload_offset = in->Length() - format_utils::kFooterLen - 1;
  in.reset();

  CorruptByte(dir, "file", payload_offset);

  in = dir.open("file");
  ASSERT_NE(nullptr, in);
  const auto checksum = format_utils::checksum(*in);
  format_utils::check_header(*in, kFormat, 0, 0);
  in->ReadU64();
  ASSERT_THROW(format_utils::check_footer(*in, checksum), index_error);
}

TEST(format_utils_test, truncated_file) {
  MemoryDirectory dir;

  auto out = dir.create("file");
  ASSERT_NE(nullptr, out);
  out->WriteU32(format_utils::kFormatMagic);
  out->Close();

  auto in = dir.open("file");
  ASSERT_NE(nullptr, in);
  ASSERT_THROW(format_utils::checksum(*in), index_error);
}

}  // namespace
