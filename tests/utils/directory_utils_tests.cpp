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

#include "error/error.hpp"
#include "store/memory_directory.hpp"
#include "tests_shared.hpp"
#include "utils/directory_utils.hpp"

namespace {

using namespace strata;

class bytes_output final : public DataOutput {
 public:
  void WriteByte(byte_type b) final { data.push_back(b); }

  void WriteBytes(const byte_type* b, size_t len) final {
    data.append(b, len);
  }

  bstring data;
};

std::vector<std::string> Sorted(std::vector<std::string> files) {
  std::sort(files.begin(), files.end());
  return files;
}

TEST(directory_utils_test, copy) {
  MemoryDirectory dir;

  {
    auto out = dir.create("foo");
    ASSERT_NE(nullptr, out);
    for (size_t i = 0; i < 10000; ++i) {
      out->WriteByte(static_cast<byte_type>(i));
    }
    out->Close();
  }

  bytes_output out;
  directory_utils::Copy(dir, "foo", out);
  ASSERT_EQ(10000, out.data.size());
  ASSERT_EQ(static_cast<byte_type>(9999), out.data.back());

  ASSERT_THROW(directory_utils::Copy(dir, "missing", out), file_not_found);
}

TEST(directory_utils_test, length_of_missing_file) {
  MemoryDirectory dir;
  ASSERT_THROW(directory_utils::Length(dir, "missing"), io_error);
}

TEST(tracking_directory_test, track_created) {
  MemoryDirectory dir;
  TrackingDirectory tracking{dir};

  for (auto name : {"_1.dat", "_1.0.sm"}) {
    auto out = tracking.create(name);
    ASSERT_NE(nullptr, out);
    out->Close();
  }

  // opened files are not tracked by default
  ASSERT_NE(nullptr, tracking.open("_1.dat"));

  ASSERT_EQ((std::vector<std::string>{"_1.0.sm", "_1.dat"}),
            Sorted(tracking.flush_tracked()));
  ASSERT_TRUE(tracking.flush_tracked().empty());
  ASSERT_TRUE(directory_utils::Exists(dir, "_1.dat"));
}

TEST(tracking_directory_test, track_opened) {
  MemoryDirectory dir;

  {
    auto out = dir.create("_1.dat");
    ASSERT_NE(nullptr, out);
    out->Close();
  }

  TrackingDirectory tracking{dir, true};
  ASSERT_NE(nullptr, tracking.open("_1.dat"));
  ASSERT_EQ(std::vector<std::string>{"_1.dat"}, tracking.flush_tracked());
}

TEST(tracking_directory_test, remove_and_rename) {
  MemoryDirectory dir;
  TrackingDirectory tracking{dir};

  for (auto name : {"a", "b"}) {
    auto out = tracking.create(name);
    ASSERT_NE(nullptr, out);
    out->Close();
  }

  ASSERT_TRUE(tracking.remove("a"));
  ASSERT_FALSE(directory_utils::Exists(dir, "a"));

  ASSERT_TRUE(tracking.rename("b", "c"));
  ASSERT_FALSE(tracking.rename("missing", "d"));

  ASSERT_EQ(std::vector<std::string>{"c"}, tracking.flush_tracked());

  auto out = tracking.create("e");
  ASSERT_NE(nullptr, out);
  tracking.clear_tracked();
  ASSERT_TRUE(tracking.flush_tracked().empty());
}

}  // namespace
