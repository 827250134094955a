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

#include <absl/container/flat_hash_set.h>

#include "shared.hpp"
#include "store/directory.hpp"

namespace strata {
namespace directory_utils {

// Names of all files in a directory, throws io_error on failure
std::vector<std::string> ListFiles(const directory& dir);

// Throws io_error if the directory can't tell whether the file exists
bool Exists(const directory& dir, std::string_view name);

// Length of an existing file, throws io_error on failure
uint64_t Length(const directory& dir, std::string_view name);

// Copy contents of the file 'name' to the output stream
void Copy(const directory& dir, std::string_view name, DataOutput& out);

}  // namespace directory_utils

// Track files created/opened via file names
struct TrackingDirectory final : public directory {
  using file_set = absl::flat_hash_set<std::string>;

  // @param track_open - track file refs for calls to open(...)
  explicit TrackingDirectory(directory& impl, bool track_open = false) noexcept;

  directory& operator*() noexcept { return impl_; }

  IndexOutput::ptr create(std::string_view name) noexcept override;

  void clear_tracked() noexcept;

  bool exists(bool& result, std::string_view name) const noexcept override {
    return impl_.exists(result, name);
  }

  std::vector<std::string> flush_tracked();

  bool length(uint64_t& result, std::string_view name) const noexcept override {
    return impl_.length(result, name);
  }

  index_lock::ptr make_lock(std::string_view name) noexcept override {
    return impl_.make_lock(name);
  }

  bool mtime(std::time_t& result,
             std::string_view name) const noexcept override {
    return impl_.mtime(result, name);
  }

  IndexInput::ptr open(std::string_view name) const noexcept override;

  bool remove(std::string_view name) noexcept override;

  bool rename(std::string_view src, std::string_view dst) noexcept override;

  bool sync(std::span<const std::string_view> files) noexcept override {
    return impl_.sync(files);
  }

  bool visit(const visitor_f& visitor) const override {
    return impl_.visit(visitor);
  }

 private:
  mutable file_set files_;
  directory& impl_;
  bool track_open_;
};

}  // namespace strata
