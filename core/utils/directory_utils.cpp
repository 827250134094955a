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

#include "utils/directory_utils.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/log.hpp"

namespace strata {
namespace directory_utils {

std::vector<std::string> ListFiles(const directory& dir) {
  std::vector<std::string> files;

  if (!dir.visit([&files](std::string_view name) {
        files.emplace_back(name);
        return true;
      })) {
    throw io_error{"Failed to list files in a directory"};
  }

  return files;
}

bool Exists(const directory& dir, std::string_view name) {
  bool result;

  if (!dir.exists(result, name)) {
    throw io_error{absl::StrCat("Failed to check existence of file, path: ",
                                name)};
  }

  return result;
}

uint64_t Length(const directory& dir, std::string_view name) {
  uint64_t result;

  if (!dir.length(result, name)) {
    throw io_error{absl::StrCat("Failed to get length of file, path: ", name)};
  }

  return result;
}

void Copy(const directory& dir, std::string_view name, DataOutput& out) {
  auto in = dir.open(name);

  if (!in) {
    throw file_not_found{name};
  }

  byte_type buf[4096];
  for (size_t read; (read = in->ReadBytes(buf, sizeof buf));) {
    out.WriteBytes(buf, read);
  }
}

}  // namespace directory_utils

TrackingDirectory::TrackingDirectory(directory& impl,
                                     bool track_open /*= false*/) noexcept
  : impl_{impl}, track_open_{track_open} {}

IndexOutput::ptr TrackingDirectory::create(std::string_view name) noexcept {
  try {
    files_.emplace(name);

    auto result = impl_.create(name);

    if (result) {
      return result;
    }

    files_.erase(name);  // revert change
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to create tracked file '", name,
                                  "', error: ", e.what()));
  }

  return nullptr;
}

IndexInput::ptr TrackingDirectory::open(std::string_view name) const noexcept {
  if (track_open_) {
    try {
      files_.emplace(name);
    } catch (const std::exception& e) {
      STRATA_LOG_ERROR(absl::StrCat("Failed to track file '", name,
                                    "', error: ", e.what()));
      return nullptr;
    }
  }

  return impl_.open(name);
}

bool TrackingDirectory::remove(std::string_view name) noexcept {
  if (!impl_.remove(name)) {
    return false;
  }

  files_.erase(name);
  return true;
}

bool TrackingDirectory::rename(std::string_view src,
                               std::string_view dst) noexcept {
  if (!impl_.rename(src, dst)) {
    return false;
  }

  try {
    if (files_.emplace(dst).second) {
      files_.erase(src);
    }

    return true;
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to track renamed file '", dst,
                                  "', error: ", e.what()));
    if (!impl_.rename(dst, src)) {  // revert
      STRATA_LOG_ERROR(absl::StrCat("Failed to revert rename of '", src,
                                    "' to '", dst, "'"));
    }
  }

  return false;
}

void TrackingDirectory::clear_tracked() noexcept { files_.clear(); }

std::vector<std::string> TrackingDirectory::flush_tracked() {
  std::vector<std::string> files(files_.begin(), files_.end());
  files_.clear();
  return files;
}

}  // namespace strata
