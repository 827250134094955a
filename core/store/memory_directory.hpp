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

#include <chrono>
#include <mutex>
#include <shared_mutex>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "store/directory.hpp"

namespace strata {

class MemoryFile {
 public:
  MemoryFile() noexcept { mtime_ = now(); }

  size_t Length() const noexcept {
    std::lock_guard lock{mutex_};
    return data_.size();
  }

  std::time_t mtime() const noexcept {
    std::lock_guard lock{mutex_};
    return mtime_;
  }

  void Append(const byte_type* b, size_t len) {
    std::lock_guard lock{mutex_};
    data_.append(b, len);
    mtime_ = now();
  }

  // Copy up to 'len' bytes starting at 'offset', returns number of bytes
  // copied
  size_t Read(size_t offset, byte_type* b, size_t len) const noexcept;

  void Reset() noexcept {
    std::lock_guard lock{mutex_};
    data_.clear();
  }

 private:
  static std::time_t now() noexcept {
    return std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  }

  mutable std::mutex mutex_;
  bstring data_;
  std::time_t mtime_;
};

class MemoryIndexInput final : public IndexInput {
 public:
  explicit MemoryIndexInput(std::shared_ptr<const MemoryFile> file) noexcept
    : file_{std::move(file)} {}

  byte_type ReadByte() final;
  size_t ReadBytes(byte_type* b, size_t count) final;

  size_t Position() const noexcept final { return pos_; }
  size_t Length() const noexcept final { return file_->Length(); }
  void Seek(size_t pos) final;

 private:
  std::shared_ptr<const MemoryFile> file_;
  size_t pos_{};
};

class MemoryIndexOutput final : public IndexOutput {
 public:
  explicit MemoryIndexOutput(std::shared_ptr<MemoryFile> file) noexcept
    : file_{std::move(file)} {}

  void Flush() noexcept final {}

  void Close() noexcept final {}

 protected:
  void WriteDirect(const byte_type* b, size_t len) final {
    file_->Append(b, len);
  }

 private:
  std::shared_ptr<MemoryFile> file_;
};

// In-memory directory, files opened for reading stay readable after
// removal until the last stream over them is closed
class MemoryDirectory final : public directory {
 public:
  MemoryDirectory() = default;
  ~MemoryDirectory() noexcept final;

  IndexOutput::ptr create(std::string_view name) noexcept final;

  bool exists(bool& result, std::string_view name) const noexcept final;

  bool length(uint64_t& result, std::string_view name) const noexcept final;

  index_lock::ptr make_lock(std::string_view name) noexcept final;

  bool mtime(std::time_t& result, std::string_view name) const noexcept final;

  IndexInput::ptr open(std::string_view name) const noexcept final;

  bool remove(std::string_view name) noexcept final;

  bool rename(std::string_view src, std::string_view dst) noexcept final;

  bool sync(std::span<const std::string_view>) noexcept final { return true; }

  bool visit(const visitor_f& visitor) const final;

 private:
  friend class SingleInstanceLock;

  using FileMap =
    absl::flat_hash_map<std::string, std::shared_ptr<MemoryFile>>;
  using LockMap = absl::flat_hash_set<std::string>;

  mutable std::shared_mutex flock_;
  std::mutex llock_;
  FileMap files_;
  LockMap locks_;
};

}  // namespace strata
