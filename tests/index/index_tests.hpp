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

#include <mutex>
#include <set>
#include <string>

#include "index/index_meta.hpp"
#include "index/index_meta_io.hpp"
#include "store/memory_directory.hpp"

namespace tests {

// Directory refusing to remove files marked as busy,
// e.g. files still opened by a reader on some platforms
class busy_directory final : public strata::directory {
 public:
  void busy(std::string_view name) {
    std::lock_guard lock{mutex_};
    busy_.emplace(name);
  }

  void release(std::string_view name) {
    std::lock_guard lock{mutex_};
    busy_.erase(std::string{name});
  }

  strata::directory& impl() noexcept { return impl_; }

  strata::IndexOutput::ptr create(std::string_view name) noexcept final {
    return impl_.create(name);
  }

  bool exists(bool& result, std::string_view name) const noexcept final {
    return impl_.exists(result, name);
  }

  bool length(uint64_t& result, std::string_view name) const noexcept final {
    return impl_.length(result, name);
  }

  strata::index_lock::ptr make_lock(std::string_view name) noexcept final {
    return impl_.make_lock(name);
  }

  bool mtime(std::time_t& result,
             std::string_view name) const noexcept final {
    return impl_.mtime(result, name);
  }

  strata::IndexInput::ptr open(std::string_view name) const noexcept final {
    return impl_.open(name);
  }

  bool remove(std::string_view name) noexcept final {
    {
      std::lock_guard lock{mutex_};
      if (busy_.contains(std::string{name})) {
        return false;
      }
    }

    return impl_.remove(name);
  }

  bool rename(std::string_view src, std::string_view dst) noexcept final {
    return impl_.rename(src, dst);
  }

  bool sync(std::span<const std::string_view> files) noexcept final {
    return impl_.sync(files);
  }

  bool visit(const visitor_f& visitor) const final {
    return impl_.visit(visitor);
  }

 private:
  strata::MemoryDirectory impl_;
  std::mutex mutex_;
  std::set<std::string> busy_;
};

// Write data and descriptor files of a segment
strata::IndexSegment WriteSegment(strata::directory& dir,
                                  std::string_view name, uint64_t docs_count,
                                  uint64_t byte_size);

// Commit 'meta' as the next generation, returns a snapshot of the commit
std::shared_ptr<const strata::IndexMeta> WriteCommit(strata::directory& dir,
                                                     strata::IndexMeta& meta);

// Segment descriptor without any files
strata::SegmentMeta MakeSegment(std::string_view name, uint64_t docs_count,
                                uint64_t live_docs_count, uint64_t byte_size);

}  // namespace tests
