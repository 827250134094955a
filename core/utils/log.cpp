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

#include "utils/log.hpp"

#include <array>
#include <atomic>
#include <mutex>

#include <absl/strings/match.h>

namespace strata::log {
namespace {

constexpr size_t kLevelCount = static_cast<size_t>(Level::kTrace) + 1;

constexpr std::array<std::string_view, kLevelCount> kLevelNames{
  "FATAL", "ERROR", "WARN", "INFO", "DEBUG", "TRACE"};

class LoggerContext {
 public:
  LoggerContext() noexcept {
    outputs_.fill(stderr);
  }

  Level level() const noexcept {
    return level_.load(std::memory_order_relaxed);
  }

  void level(Level level) noexcept {
    level_.store(level, std::memory_order_relaxed);
  }

  void output(Level level, FILE* out) noexcept {
    std::lock_guard lock{mutex_};
    outputs_[static_cast<size_t>(level)] = out;
  }

  Callback callback(Callback callback) noexcept {
    return callback_.exchange(callback);
  }

  void write(Level level, std::string_view file, size_t line,
             std::string_view function, std::string_view message) noexcept {
    if (auto* callback = callback_.load(); callback) {
      callback(level, file, line, function, message);
      return;
    }

    std::lock_guard lock{mutex_};
    auto* out = outputs_[static_cast<size_t>(level)];

    if (!out) {
      return;
    }

    std::fprintf(out, "%.*s: %.*s:%zu %.*s\n",
                 static_cast<int>(LevelName(level).size()),
                 LevelName(level).data(), static_cast<int>(file.size()),
                 file.data(), line, static_cast<int>(message.size()),
                 message.data());
    std::fflush(out);
  }

 private:
  std::atomic<Level> level_{Level::kInfo};
  std::atomic<Callback> callback_{nullptr};
  std::mutex mutex_;  // guards 'outputs_' and interleaving of messages
  std::array<FILE*, kLevelCount> outputs_;
};

LoggerContext& Context() noexcept {
  static LoggerContext ctx;
  return ctx;
}

}  // namespace

Level GetLevel() noexcept { return Context().level(); }

void SetLevel(Level level) noexcept { Context().level(level); }

void SetOutput(Level level, FILE* out) noexcept {
  Context().output(level, out);
}

void SetOutputLE(Level level, FILE* out) noexcept {
  for (size_t i = 0, last = static_cast<size_t>(level); i <= last; ++i) {
    Context().output(static_cast<Level>(i), out);
  }
}

Callback SetCallback(Callback callback) noexcept {
  return Context().callback(callback);
}

bool Enabled(Level level) noexcept { return level <= Context().level(); }

void Log(Level level, std::string_view file, size_t line,
         std::string_view function, std::string_view message) noexcept {
  Context().write(level, file, line, function, message);
}

std::string_view LevelName(Level level) noexcept {
  const auto idx = static_cast<size_t>(level);
  return idx < kLevelNames.size() ? kLevelNames[idx] : "UNKNOWN";
}

bool ParseLevel(std::string_view name, Level& level) noexcept {
  for (size_t i = 0; i < kLevelNames.size(); ++i) {
    if (absl::EqualsIgnoreCase(name, kLevelNames[i])) {
      level = static_cast<Level>(i);
      return true;
    }
  }

  return false;
}

}  // namespace strata::log
