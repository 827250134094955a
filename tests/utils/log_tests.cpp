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

#include <string>
#include <vector>

#include "tests_shared.hpp"
#include "utils/log.hpp"

namespace {

using namespace strata;

std::vector<std::pair<log::Level, std::string>> sMessages;

void CollectMessage(log::Level level, std::string_view, size_t,
                    std::string_view, std::string_view message) {
  sMessages.emplace_back(level, std::string{message});
}

class log_test : public ::testing::Test {
 protected:
  void SetUp() override {
    sMessages.clear();
    prev_level_ = log::GetLevel();
    prev_callback_ = log::SetCallback(CollectMessage);
  }

  void TearDown() override {
    log::SetCallback(prev_callback_);
    log::SetLevel(prev_level_);
  }

 private:
  log::Level prev_level_;
  log::Callback prev_callback_;
};

TEST_F(log_test, threshold) {
  log::SetLevel(log::Level::kWarn);
  ASSERT_TRUE(log::Enabled(log::Level::kError));
  ASSERT_TRUE(log::Enabled(log::Level::kWarn));
  ASSERT_FALSE(log::Enabled(log::Level::kInfo));

  STRATA_LOG_ERROR("error");
  STRATA_LOG_WARN("warn");
  STRATA_LOG_INFO("info");
  STRATA_LOG_TRACE("trace");

  ASSERT_EQ(2, sMessages.size());
  ASSERT_EQ(log::Level::kError, sMessages[0].first);
  ASSERT_EQ("error", sMessages[0].second);
  ASSERT_EQ(log::Level::kWarn, sMessages[1].first);
  ASSERT_EQ("warn", sMessages[1].second);
}

TEST_F(log_test, parse_level) {
  log::Level level;
  ASSERT_TRUE(log::ParseLevel("trace", level));
  ASSERT_EQ(log::Level::kTrace, level);
  ASSERT_TRUE(log::ParseLevel("WARN", level));
  ASSERT_EQ(log::Level::kWarn, level);
  ASSERT_FALSE(log::ParseLevel("verbose", level));
  ASSERT_EQ("DEBUG", log::LevelName(log::Level::kDebug));
}

}  // namespace
