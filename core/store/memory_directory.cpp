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

#include <cstring>

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/assert.hpp"
#include "utils/log.hpp"

namespace strata {

class SingleInstanceLock : public index_lock {
 public:
  SingleInstanceLock(std::string_view name, MemoryDirectory* parent)
    : name_{name}, parent_{parent} {
    STRATA_ASSERT(parent_);
  }

  bool lock() final {
    std::lock_guard lock{parent_->llock_};
    if (!parent_->locks_.insert(name_).second) {
      failure_reason(absl::StrCat("Lock '", name_, "' is already held"));
      return false;
    }
    held_ = true;
    return true;
  }

  bool is_locked() const final {
    std::lock_guard lock{parent_->llock_};
    return parent_->locks_.contains(name_);
  }

  bool unlock() noexcept final {
    if (!held_) {
      return false;
    }

    std::lock_guard lock{parent_->llock_};
    parent_->locks_.erase(name_);
    held_ = false;
    return true;
  }

 protected:
  std::string_view name() const noexcept final { return name_; }

 private:
  std::string name_;
  MemoryDirectory* parent_;
  bool held_{false};
};

size_t MemoryFile::Read(size_t offset, byte_type* b,
                        size_t len) const noexcept {
  std::lock_guard lock{mutex_};
  if (offset >= data_.size()) {
    return 0;
  }

  len = std::min(len, data_.size() - offset);
  std::memcpy(b, data_.data() + offset, len);
  return len;
}

byte_type MemoryIndexInput::ReadByte() {
  byte_type b;
  if (1 != file_->Read(pos_, &b, 1)) {
    throw eof_error{};
  }
  ++pos_;
  return b;
}

size_t MemoryIndexInput::ReadBytes(byte_type* b, size_t count) {
  const auto read = file_->Read(pos_, b, count);
  pos_ += read;
  return read;
}

void MemoryIndexInput::Seek(size_t pos) {
  if (pos > Length()) {
    throw io_error{absl::StrCat("Seek out of range for input file, length ",
                                Length(), ", position ", pos)};
  }
  pos_ = pos;
}

MemoryDirectory::~MemoryDirectory() noexcept {
  std::lock_guard lock{flock_};
  files_.clear();
}

bool MemoryDirectory::exists(bool& result,
                             std::string_view name) const noexcept {
  std::shared_lock lock{flock_};
  result = files_.contains(name);
  return true;
}

IndexOutput::ptr MemoryDirectory::create(std::string_view name) noexcept {
  try {
    std::lock_guard lock{flock_};

    // existing readers keep the previous contents
    auto& file = files_[std::string{name}];
    file = std::make_shared<MemoryFile>();

    return std::make_unique<MemoryIndexOutput>(file);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to create file '", name,
                                  "', error: ", e.what()));
  }

  return nullptr;
}

bool MemoryDirectory::length(uint64_t& result,
                             std::string_view name) const noexcept {
  std::shared_lock lock{flock_};

  const auto it = files_.find(name);

  if (it == files_.end()) {
    return false;
  }

  result = it->second->Length();

  return true;
}

index_lock::ptr MemoryDirectory::make_lock(std::string_view name) noexcept {
  try {
    return std::make_unique<SingleInstanceLock>(name, this);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to make lock '", name,
                                  "', error: ", e.what()));
  }

  return nullptr;
}

bool MemoryDirectory::mtime(std::time_t& result,
                            std::string_view name) const noexcept {
  std::shared_lock lock{flock_};

  const auto it = files_.find(name);

  if (it == files_.end()) {
    return false;
  }

  result = it->second->mtime();

  return true;
}

IndexInput::ptr MemoryDirectory::open(std::string_view name) const noexcept {
  try {
    std::shared_lock lock{flock_};

    const auto it = files_.find(name);

    if (it != files_.end()) {
      return std::make_unique<MemoryIndexInput>(it->second);
    }

    STRATA_LOG_ERROR(absl::StrCat("Failed to open input file, error: File "
                                  "not found, path: ",
                                  name));
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to open input file '", name,
                                  "', error: ", e.what()));
  }

  return nullptr;
}

bool MemoryDirectory::remove(std::string_view name) noexcept {
  std::lock_guard lock{flock_};
  files_.erase(name);
  return true;
}

bool MemoryDirectory::rename(std::string_view src,
                             std::string_view dst) noexcept {
  try {
    std::lock_guard lock{flock_};

    const auto it = files_.find(src);

    if (it == files_.end()) {
      return false;
    }

    auto file = std::move(it->second);
    files_.erase(it);
    files_.insert_or_assign(std::string{dst}, std::move(file));

    return true;
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to rename '", src, "' to '", dst,
                                  "', error: ", e.what()));
  }

  return false;
}

bool MemoryDirectory::visit(const directory::visitor_f& visitor) const {
  std::vector<std::string> names;

  {
    std::shared_lock lock{flock_};
    names.reserve(files_.size());
    for (const auto& entry : files_) {
      names.emplace_back(entry.first);
    }
  }

  for (const auto& name : names) {
    if (!visitor(name)) {
      return false;
    }
  }

  return true;
}

}  // namespace strata
