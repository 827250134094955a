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

#include "store/memory_directory.hpp"
#include "tests_shared.hpp"
#include "utils/directory_utils.hpp"

namespace {

using namespace strata;

TEST(memory_directory_test, removed_file_stays_readable) {
  MemoryDirectory dir;

  {
    auto out = dir.create("_0.dat");
    ASSERT_NE(nullptr, out);
    out->WriteU32(42);
    out->Close();
  }

  auto in = dir.open("_0.dat");
  ASSERT_NE(nullptr, in);

  ASSERT_TRUE(dir.remove("_0.dat"));
  ASSERT_FALSE(directory_utils::Exists(dir, "_0.dat"));
  ASSERT_EQ(nullptr, dir.open("_0.dat"));

  ASSERT_EQ(4, in->Length());
  ASSERT_EQ(42, in->ReadU32());
}

TEST(memory_directory_test, recreated_file_keeps_open_contents) {
  MemoryDirectory dir;

  {
    auto out = dir.create("foo");
    ASSERT_NE(nullptr, out);
    out->WriteU32(1);
    out->Close();
  }

  auto in = dir.open("foo");
  ASSERT_NE(nullptr, in);

  {
    auto out = dir.create("foo");
    ASSERT_NE(nullptr, out);
    out->WriteU64(2);
    out->Close();
  }

  ASSERT_EQ(4, in->Length());
  ASSERT_EQ(1, in->ReadU32());
  ASSERT_EQ(8, directory_utils::Length(dir, "foo"));
}

TEST(memory_directory_test, lock_failure_reason) {
  MemoryDirectory dir;

  auto lock0 = dir.make_lock("write.lock");
  auto lock1 = dir.make_lock("write.lock");
  auto other = dir.make_lock("other.lock");
  ASSERT_NE(nullptr, lock0);
  ASSERT_NE(nullptr, lock1);
  ASSERT_NE(nullptr, other);

  ASSERT_TRUE(lock0->lock());
  ASSERT_TRUE(other->lock());  // locks are independent

  ASSERT_TRUE(lock1->failure_reason().empty());
  ASSERT_FALSE(lock1->lock());
  ASSERT_EQ("Lock 'write.lock' is already held", lock1->failure_reason());

  ASSERT_TRUE(lock0->unlock());
  ASSERT_FALSE(lock0->unlock());
  ASSERT_TRUE(other->unlock());
}

}  // namespace
