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

#include <ctime>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "store/data_input.hpp"
#include "store/data_output.hpp"
#include "utils/noncopyable.hpp"

namespace strata {

// Interprocess exclusive lock over a named resource of a directory
class index_lock : private util::noncopyable {
 public:
  using ptr = std::unique_ptr<index_lock>;

  // interval between two consecutive lock attempts in try_lock(...)
  static constexpr int64_t kLockPollIntervalMs = 1000;
  // wait timeout for try_lock(...) meaning "never give up"
  static constexpr int64_t kLockWaitForever = -1;

  virtual ~index_lock() = default;

  // Single attempt to obtain the lock, returns 'false' if the lock is held
  // by someone else, failure_reason() may describe why
  virtual bool lock() = 0;

  // Returns 'true' if the resource is currently locked by anyone
  virtual bool is_locked() const = 0;

  // Release the lock, returns 'false' if the lock wasn't held
  virtual bool unlock() noexcept = 0;

  // Attempts to obtain the lock within 'wait_timeout_ms' milliseconds
  // polling every kLockPollIntervalMs, throws lock_obtain_failed carrying
  // the last failure reason on timeout and illegal_argument for a negative
  // timeout other than kLockWaitForever
  bool try_lock(int64_t wait_timeout_ms);

  const std::string& failure_reason() const noexcept { return failure_reason_; }

 protected:
  void failure_reason(std::string&& reason) noexcept {
    failure_reason_ = std::move(reason);
  }

  virtual std::string_view name() const noexcept = 0;

 private:
  std::string failure_reason_;
};

// Releases a held lock on scope exit
class LockGuard {
 public:
  explicit LockGuard(index_lock::ptr&& lock) noexcept
    : lock_{std::move(lock)} {}

  LockGuard(LockGuard&& rhs) noexcept = default;
  LockGuard& operator=(LockGuard&& rhs) noexcept {
    if (this != &rhs) {
      reset();
      lock_ = std::move(rhs.lock_);
    }
    return *this;
  }

  ~LockGuard() { reset(); }

  index_lock* get() const noexcept { return lock_.get(); }

  explicit operator bool() const noexcept { return nullptr != lock_; }

  void reset() noexcept {
    if (lock_) {
      lock_->unlock();
      lock_.reset();
    }
  }

 private:
  index_lock::ptr lock_;
};

// Flat container of named files
struct directory : private util::noncopyable {
  using ptr = std::unique_ptr<directory>;
  using visitor_f = std::function<bool(std::string_view name)>;

  virtual ~directory() = default;

  // Open output stream for writing, existing file is truncated,
  // nullptr on failure
  virtual IndexOutput::ptr create(std::string_view name) noexcept = 0;

  virtual bool exists(bool& result, std::string_view name) const noexcept = 0;

  virtual bool length(uint64_t& result,
                      std::string_view name) const noexcept = 0;

  virtual index_lock::ptr make_lock(std::string_view name) noexcept = 0;

  virtual bool mtime(std::time_t& result,
                     std::string_view name) const noexcept = 0;

  // Open input stream for reading, nullptr on failure
  virtual IndexInput::ptr open(std::string_view name) const noexcept = 0;

  // Returns 'true' if the file doesn't exist anymore, 'false' if it could not
  // be removed (e.g. busy), removing a nonexistent file is not an error
  virtual bool remove(std::string_view name) noexcept = 0;

  virtual bool rename(std::string_view src,
                      std::string_view dst) noexcept = 0;

  // Make contents of the specified files durable
  virtual bool sync(std::span<const std::string_view> files) noexcept = 0;

  // Visit every file in a directory, stop as soon as visitor returns 'false'
  virtual bool visit(const visitor_f& visitor) const = 0;
};

}  // namespace strata
